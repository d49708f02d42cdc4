// Repository: Seamline
// Component: Fake Media Opener
// Purpose: Scripted IMediaOpener. Each path is registered as video, audio
//          or nothing; records every open attempt.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_TESTS_FIXTURES_FAKE_MEDIA_OPENER_H_
#define SEAMLINE_TESTS_FIXTURES_FAKE_MEDIA_OPENER_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "seamline/fragments/MediaOpener.hpp"
#include "FakeFragment.h"

namespace seamline::tests::fixtures {

class FakeMediaOpener : public fragments::IMediaOpener {
 public:
  struct Attempt {
    std::string path;
    media::MediaKind as;
  };

  void AddVideo(const std::string& path, double duration, int width = 640, int height = 360) {
    entries_[path] = Entry{media::MediaKind::kVideo, duration, width, height};
  }

  void AddAudio(const std::string& path, double duration) {
    entries_[path] = Entry{media::MediaKind::kAudio, duration, 0, 0};
  }

  fragments::OpenResult OpenAsVideo(const std::string& path) override {
    attempts_.push_back({path, media::MediaKind::kVideo});
    auto it = entries_.find(path);
    if (it == entries_.end() || it->second.kind != media::MediaKind::kVideo) {
      return fragments::OpenResult::Failure("no video stream in " + path);
    }
    auto f = FakeFragment::Video(it->second.duration, it->second.width, it->second.height);
    f->WithUri(path);
    return fragments::OpenResult::Success(std::move(f));
  }

  fragments::OpenResult OpenAsAudio(const std::string& path) override {
    attempts_.push_back({path, media::MediaKind::kAudio});
    auto it = entries_.find(path);
    if (it == entries_.end() || it->second.kind != media::MediaKind::kAudio) {
      return fragments::OpenResult::Failure("no audio stream in " + path);
    }
    auto f = FakeFragment::Audio(it->second.duration);
    f->WithUri(path);
    return fragments::OpenResult::Success(std::move(f));
  }

  const std::vector<Attempt>& attempts() const { return attempts_; }

 private:
  struct Entry {
    media::MediaKind kind;
    double duration;
    int width;
    int height;
  };

  std::map<std::string, Entry> entries_;
  std::vector<Attempt> attempts_;
};

}  // namespace seamline::tests::fixtures

#endif  // SEAMLINE_TESTS_FIXTURES_FAKE_MEDIA_OPENER_H_
