// Repository: Seamline
// Component: Fragment Classifier
// Purpose: Two-step format sniffing: try video, fall back to audio, else
//          unreadable. Returns a tagged result; no exceptions.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_FRAGMENTS_FRAGMENT_CLASSIFIER_HPP_
#define SEAMLINE_FRAGMENTS_FRAGMENT_CLASSIFIER_HPP_

#include <memory>
#include <string>

#include "seamline/fragments/MediaOpener.hpp"
#include "seamline/media/Fragment.hpp"

namespace seamline::fragments {

enum class FragmentKind {
  kVideo,
  kAudio,
  kUnreadable,
};

const char* FragmentKindName(FragmentKind kind);

struct FragmentClassification {
  FragmentKind kind = FragmentKind::kUnreadable;
  std::unique_ptr<media::Fragment> fragment;  // null when kUnreadable

  // Error details from each attempt. video_error is set whenever the video
  // attempt failed (also for kAudio); audio_error only when kUnreadable.
  std::string video_error;
  std::string audio_error;
};

FragmentClassification ClassifyFragment(const std::string& path, IMediaOpener& opener);

}  // namespace seamline::fragments

#endif  // SEAMLINE_FRAGMENTS_FRAGMENT_CLASSIFIER_HPP_
