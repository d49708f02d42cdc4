// Repository: Seamline
// Component: Fragment Classifier Implementation
// Purpose: Video-then-audio open sequence.
// Copyright (c) 2025 Seamline Authors

#include "seamline/fragments/FragmentClassifier.hpp"

namespace seamline::fragments {

const char* FragmentKindName(FragmentKind kind) {
  switch (kind) {
    case FragmentKind::kVideo:      return "video";
    case FragmentKind::kAudio:      return "audio";
    case FragmentKind::kUnreadable: return "unreadable";
  }
  return "unknown";
}

FragmentClassification ClassifyFragment(const std::string& path, IMediaOpener& opener) {
  FragmentClassification result;

  OpenResult video = opener.OpenAsVideo(path);
  if (video.ok()) {
    result.kind = FragmentKind::kVideo;
    result.fragment = std::move(video.fragment);
    return result;
  }
  result.video_error = video.error.empty() ? "not decodable as video" : video.error;

  OpenResult audio = opener.OpenAsAudio(path);
  if (audio.ok()) {
    result.kind = FragmentKind::kAudio;
    result.fragment = std::move(audio.fragment);
    return result;
  }
  result.audio_error = audio.error.empty() ? "not decodable as audio" : audio.error;

  result.kind = FragmentKind::kUnreadable;
  return result;
}

}  // namespace seamline::fragments
