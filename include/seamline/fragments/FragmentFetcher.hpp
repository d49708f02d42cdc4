// Repository: Seamline
// Component: Fragment Fetcher
// Purpose: Loader boundary. Resolves a fragment URL to a local file.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_FRAGMENTS_FRAGMENT_FETCHER_HPP_
#define SEAMLINE_FRAGMENTS_FRAGMENT_FETCHER_HPP_

#include <optional>
#include <string>

namespace seamline::fragments {

class IFragmentFetcher {
 public:
  virtual ~IFragmentFetcher() = default;

  // Returns the local path of the fetched file, or nullopt on failure.
  // A returned path always names an existing file.
  virtual std::optional<std::string> Fetch(const std::string& url,
                                           const std::string& dest_dir) = 0;
};

// AvioFragmentFetcher copies remote fragments through libavformat's AVIO
// layer, so every protocol built into FFmpeg (http, https, ftp, ...) works.
//
// - Plain paths and file:// URLs resolve in place (no copy).
// - Remote URLs are copied to dest_dir/<basename>, query string stripped.
// - An existing non-empty file at the destination is reused.
// - A failed copy removes the partial file.
class AvioFragmentFetcher : public IFragmentFetcher {
 public:
  AvioFragmentFetcher();

  std::optional<std::string> Fetch(const std::string& url,
                                   const std::string& dest_dir) override;

  // Last path component of the URL, without query or fragment. Falls back
  // to "fragment" when the URL has no usable name.
  static std::string FileNameForUrl(const std::string& url);

  // Download name in the work directory: FileNameForUrl() with the CRC32 of
  // the whole URL before the extension ("clip-1a2b3c4d.webm"). URLs that
  // share a file name land in different files; the same URL always maps to
  // the same file, so a finished download is reused.
  static std::string LocalNameForUrl(const std::string& url);

 private:
  bool CopyUrlToFile(const std::string& url, const std::string& dest_path);
};

}  // namespace seamline::fragments

#endif  // SEAMLINE_FRAGMENTS_FRAGMENT_FETCHER_HPP_
