// Repository: Seamline
// Component: Media Opener
// Purpose: Decoder boundary. Opens a local file as a video or an audio
//          fragment, reporting failure as an error detail instead of throwing.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_FRAGMENTS_MEDIA_OPENER_HPP_
#define SEAMLINE_FRAGMENTS_MEDIA_OPENER_HPP_

#include <memory>
#include <string>

#include "seamline/media/Fragment.hpp"

namespace seamline::fragments {

// Exactly one of fragment / error is meaningful: fragment is non-null on
// success, error is non-empty on failure.
struct OpenResult {
  std::unique_ptr<media::Fragment> fragment;
  std::string error;

  bool ok() const { return fragment != nullptr; }

  static OpenResult Success(std::unique_ptr<media::Fragment> f) {
    OpenResult r;
    r.fragment = std::move(f);
    return r;
  }
  static OpenResult Failure(std::string err) {
    OpenResult r;
    r.error = std::move(err);
    return r;
  }
};

class IMediaOpener {
 public:
  virtual ~IMediaOpener() = default;

  // Succeeds only if the file has a decodable video stream and a positive
  // duration. Audio streams in the file are ignored.
  virtual OpenResult OpenAsVideo(const std::string& path) = 0;

  // Succeeds only if the file has a decodable audio stream and a positive
  // duration.
  virtual OpenResult OpenAsAudio(const std::string& path) = 0;
};

}  // namespace seamline::fragments

#endif  // SEAMLINE_FRAGMENTS_MEDIA_OPENER_HPP_
