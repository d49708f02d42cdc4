// Repository: Seamline
// Component: Composition Configuration Implementation
// Purpose: Validation and diagnostics for CompositionConfig / EncodingProfile.
// Copyright (c) 2025 Seamline Authors

#include "seamline/config/CompositionConfig.hpp"

#include <sstream>
#include <thread>

#include "seamline/config/EncodingProfile.hpp"

namespace seamline::config {

bool CompositionConfig::IsValid() const {
  if (fallback_width <= 0 || fallback_height <= 0) {
    return false;
  }
  // YUV420P needs even dimensions.
  if (fallback_width % 2 != 0 || fallback_height % 2 != 0) {
    return false;
  }
  if (audio_sample_rate <= 0 || audio_channels <= 0) {
    return false;
  }
  return tolerance_s >= 0.0;
}

std::string CompositionConfig::ToString() const {
  std::ostringstream oss;
  oss << "fallback=" << fallback_width << "x" << fallback_height
      << " audio=" << audio_sample_rate << "Hz/" << audio_channels << "ch"
      << " tolerance=" << tolerance_s << "s";
  return oss.str();
}

EncodingProfile EncodingProfile::Default() {
  EncodingProfile profile;
  unsigned int cpus = std::thread::hardware_concurrency();
  profile.threads = cpus > 0 ? static_cast<int>(cpus) : 1;
  return profile;
}

std::string EncodingProfile::ToString() const {
  std::ostringstream oss;
  oss << "video=" << video_codec << " preset=" << preset
      << " fps=" << fps << " bitrate=" << (video_bitrate / 1000) << "k"
      << " audio=" << audio_codec << " audio_bitrate=" << (audio_bitrate / 1000) << "k"
      << " threads=" << threads;
  return oss.str();
}

}  // namespace seamline::config
