// Repository: Seamline
// Component: Composition Configuration
// Purpose: Defaults for synthetic filler and the gap tolerance shared by the
//          Timeline Builder and Audio Mixer.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_CONFIG_COMPOSITION_CONFIG_HPP_
#define SEAMLINE_CONFIG_COMPOSITION_CONFIG_HPP_

#include <cstdint>
#include <string>

#include "seamline/buffer/Frame.hpp"

namespace seamline::config {

// RGB color for filler video. Only black is produced today.
struct FillerColor {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  bool IsBlack() const { return r == 0 && g == 0 && b == 0; }
};

// CompositionConfig holds the constants the timeline algorithms fall back on.
// POD struct - immutable after construction. Tests shrink the fallback frame
// size to keep synthetic fixtures small.
struct CompositionConfig {
  int fallback_width = 1920;      // Filler size when there are no video fragments
  int fallback_height = 1080;
  int audio_sample_rate = buffer::kHouseAudioSampleRate;
  int audio_channels = buffer::kHouseAudioChannels;
  double tolerance_s = 0.01;      // Gaps/mismatches at or below this are ignored
  FillerColor filler_color;

  // Positive frame size (even, for YUV420P), positive rate and channels,
  // non-negative tolerance.
  bool IsValid() const;

  std::string ToString() const;
};

}  // namespace seamline::config

#endif  // SEAMLINE_CONFIG_COMPOSITION_CONFIG_HPP_
