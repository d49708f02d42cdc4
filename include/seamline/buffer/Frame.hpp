// Repository: Seamline
// Component: Frame Buffers
// Purpose: Decoded video frame (YUV420P) and audio frame (S16 interleaved)
//          exchanged between decoder, renderer and encoder.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_BUFFER_FRAME_HPP_
#define SEAMLINE_BUFFER_FRAME_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace seamline::buffer {

// House audio format: every audio frame leaving the decoder and every frame
// handed to the encoder uses this layout.
constexpr int kHouseAudioSampleRate = 44100;
constexpr int kHouseAudioChannels = 2;

struct FrameMetadata {
  int64_t pts = 0;          // Presentation time in microseconds, fragment-relative
  int64_t dts = 0;
  double duration = 0.0;    // Seconds
  std::string asset_uri;    // Source path, or a sentinel for synthetic frames
};

// Planar YUV420P: Y plane (width*height) followed by U and V planes
// ((width/2)*(height/2) each), tightly packed.
struct Frame {
  int width = 0;
  int height = 0;
  FrameMetadata metadata;
  std::vector<uint8_t> data;

  size_t YSize() const { return static_cast<size_t>(width) * static_cast<size_t>(height); }
  size_t UVSize() const {
    return static_cast<size_t>(width / 2) * static_cast<size_t>(height / 2);
  }
  size_t ExpectedSize() const { return YSize() + 2 * UVSize(); }
};

// Interleaved signed 16-bit PCM.
struct AudioFrame {
  int sample_rate = kHouseAudioSampleRate;
  int channels = kHouseAudioChannels;
  int nb_samples = 0;       // Samples per channel
  int64_t pts_us = 0;       // Fragment-relative
  std::vector<uint8_t> data;

  bool IsHouseFormat() const {
    return sample_rate == kHouseAudioSampleRate && channels == kHouseAudioChannels;
  }

  const int16_t* Samples() const { return reinterpret_cast<const int16_t*>(data.data()); }
  int16_t* MutableSamples() { return reinterpret_cast<int16_t*>(data.data()); }
};

}  // namespace seamline::buffer

#endif  // SEAMLINE_BUFFER_FRAME_HPP_
