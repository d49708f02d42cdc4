// Repository: Seamline
// Component: Encoding Profile
// Purpose: Fixed encoder settings handed to the writer with every composition.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_CONFIG_ENCODING_PROFILE_HPP_
#define SEAMLINE_CONFIG_ENCODING_PROFILE_HPP_

#include <string>

namespace seamline::config {

struct EncodingProfile {
  std::string video_codec = "libx264";   // H.264
  std::string audio_codec = "aac";
  std::string preset = "medium";
  int fps = 24;
  int video_bitrate = 5000000;           // 5000 kbps
  int audio_bitrate = 192000;            // 192 kbps
  int threads = 1;

  // The design's fixed profile; threads = available CPU count.
  static EncodingProfile Default();

  std::string ToString() const;
};

}  // namespace seamline::config

#endif  // SEAMLINE_CONFIG_ENCODING_PROFILE_HPP_
