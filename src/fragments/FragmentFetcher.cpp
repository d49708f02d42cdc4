// Repository: Seamline
// Component: Fragment Fetcher Implementation
// Purpose: AVIO-backed copy of remote fragments into the work directory.
// Copyright (c) 2025 Seamline Authors

#include "seamline/fragments/FragmentFetcher.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>
#include <vector>

#include <zlib.h>

#include "seamline/util/Logger.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/error.h>
}

namespace fs = std::filesystem;

namespace seamline::fragments {

namespace {

constexpr size_t kCopyChunkBytes = 64 * 1024;

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

bool IsRemote(const std::string& url) {
  return url.find("://") != std::string::npos;
}

std::optional<std::string> ExistingFile(const std::string& path) {
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    return path;
  }
  return std::nullopt;
}

}  // namespace

AvioFragmentFetcher::AvioFragmentFetcher() {
  avformat_network_init();
}

std::string AvioFragmentFetcher::FileNameForUrl(const std::string& url) {
  std::string path = url;
  size_t cut = path.find_first_of("?#");
  if (cut != std::string::npos) {
    path.resize(cut);
  }
  size_t scheme = path.find("://");
  if (scheme != std::string::npos) {
    path = path.substr(scheme + 3);
    // Drop the authority; a bare host has no file name.
    size_t slash = path.find('/');
    path = (slash == std::string::npos) ? std::string() : path.substr(slash);
  }
  size_t last = path.find_last_of('/');
  std::string name = (last == std::string::npos) ? path : path.substr(last + 1);
  if (name.empty() || name == "." || name == "..") {
    return "fragment";
  }
  return name;
}

std::string AvioFragmentFetcher::LocalNameForUrl(const std::string& url) {
  const uLong crc = crc32(crc32(0L, Z_NULL, 0),
                          reinterpret_cast<const Bytef*>(url.data()),
                          static_cast<uInt>(url.size()));
  char key[9];
  std::snprintf(key, sizeof(key), "%08x", static_cast<unsigned>(crc));

  const fs::path name(FileNameForUrl(url));
  return name.stem().string() + "-" + key + name.extension().string();
}

std::optional<std::string> AvioFragmentFetcher::Fetch(const std::string& url,
                                                      const std::string& dest_dir) {
  if (url.rfind("file://", 0) == 0) {
    return ExistingFile(url.substr(7));
  }
  if (!IsRemote(url)) {
    return ExistingFile(url);
  }

  std::error_code ec;
  fs::create_directories(dest_dir, ec);
  if (ec) {
    util::Logger::Error("[AvioFragmentFetcher] Cannot create " + dest_dir + ": " + ec.message());
    return std::nullopt;
  }

  const std::string dest_path = (fs::path(dest_dir) / LocalNameForUrl(url)).string();
  if (fs::is_regular_file(dest_path, ec) && fs::file_size(dest_path, ec) > 0 && !ec) {
    util::Logger::Debug("[AvioFragmentFetcher] Reusing " + dest_path);
    return dest_path;
  }

  if (!CopyUrlToFile(url, dest_path)) {
    fs::remove(dest_path, ec);
    return std::nullopt;
  }
  return dest_path;
}

bool AvioFragmentFetcher::CopyUrlToFile(const std::string& url, const std::string& dest_path) {
  AVIOContext* in = nullptr;
  int ret = avio_open2(&in, url.c_str(), AVIO_FLAG_READ, nullptr, nullptr);
  if (ret < 0) {
    util::Logger::Warn("[AvioFragmentFetcher] open FAILED url=" + url +
                       " err=" + AvErrorString(ret));
    return false;
  }

  AVIOContext* out = nullptr;
  ret = avio_open2(&out, dest_path.c_str(), AVIO_FLAG_WRITE, nullptr, nullptr);
  if (ret < 0) {
    util::Logger::Warn("[AvioFragmentFetcher] create FAILED path=" + dest_path +
                       " err=" + AvErrorString(ret));
    avio_closep(&in);
    return false;
  }

  std::vector<unsigned char> chunk(kCopyChunkBytes);
  int64_t total = 0;
  bool ok = true;
  while (true) {
    int n = avio_read(in, chunk.data(), static_cast<int>(chunk.size()));
    if (n == AVERROR_EOF || n == 0) {
      break;
    }
    if (n < 0) {
      util::Logger::Warn("[AvioFragmentFetcher] read FAILED url=" + url +
                         " err=" + AvErrorString(n));
      ok = false;
      break;
    }
    avio_write(out, chunk.data(), n);
    total += n;
  }

  avio_flush(out);
  if (out->error < 0) {
    util::Logger::Warn("[AvioFragmentFetcher] write FAILED path=" + dest_path +
                       " err=" + AvErrorString(out->error));
    ok = false;
  }
  avio_closep(&out);
  avio_closep(&in);

  if (ok && total == 0) {
    util::Logger::Warn("[AvioFragmentFetcher] empty response url=" + url);
    ok = false;
  }
  if (ok) {
    util::Logger::Debug("[AvioFragmentFetcher] Fetched " + std::to_string(total) +
                        " bytes -> " + dest_path);
  }
  return ok;
}

}  // namespace seamline::fragments
