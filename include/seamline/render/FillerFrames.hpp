// Repository: Seamline
// Component: Filler Frames
// Purpose: Pre-allocated filler video frame and silence chunk. Built once per
//          frame size; no per-frame allocation.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_RENDER_FILLER_FRAMES_HPP_
#define SEAMLINE_RENDER_FILLER_FRAMES_HPP_

#include <cmath>
#include <cstdint>
#include <cstring>

#include "seamline/buffer/Frame.hpp"
#include "seamline/config/CompositionConfig.hpp"
#include "seamline/media/FrameFingerprint.hpp"

namespace seamline::render {

class FillerFrames {
 public:
  FillerFrames(int width, int height, const config::FillerColor& color)
      : color_(color), video_crc32_(0) {
    const int w = width;
    const int h = height;
    const size_t y_size = static_cast<size_t>(w) * static_cast<size_t>(h);
    const size_t uv_size = static_cast<size_t>(w / 2) * static_cast<size_t>(h / 2);

    video_frame_.width = w;
    video_frame_.height = h;
    video_frame_.metadata.asset_uri = kAssetUri;
    video_frame_.data.resize(y_size + 2 * uv_size);

    // BT.601 studio range. Black is Y=0x10, U=V=0x80.
    uint8_t y, u, v;
    RgbToYuv(color, y, u, v);
    std::memset(video_frame_.data.data(), y, y_size);
    std::memset(video_frame_.data.data() + y_size, u, uv_size);
    std::memset(video_frame_.data.data() + y_size + uv_size, v, uv_size);

    video_crc32_ = media::CRC32YPlane(video_frame_);
  }

  // Immutable filler frame.
  const buffer::Frame& VideoFrame() const { return video_frame_; }

  // CRC32 of the Y plane (computed once).
  uint32_t VideoCRC32() const { return video_crc32_; }

  bool Matches(int width, int height, const config::FillerColor& color) const {
    return video_frame_.width == width && video_frame_.height == height &&
           color_.r == color.r && color_.g == color.g && color_.b == color.b;
  }

  static void RgbToYuv(const config::FillerColor& c, uint8_t& y, uint8_t& u, uint8_t& v) {
    const double r = c.r, g = c.g, b = c.b;
    y = static_cast<uint8_t>(std::lround(16.0 + (65.481 * r + 128.553 * g + 24.966 * b) / 255.0));
    u = static_cast<uint8_t>(std::lround(128.0 + (-37.797 * r - 74.203 * g + 112.0 * b) / 255.0));
    v = static_cast<uint8_t>(std::lround(128.0 + (112.0 * r - 93.786 * g - 18.214 * b) / 255.0));
  }

  static constexpr const char* kAssetUri = "internal://filler";

 private:
  config::FillerColor color_;
  buffer::Frame video_frame_;   // Immutable after ctor
  uint32_t video_crc32_;
};

}  // namespace seamline::render

#endif  // SEAMLINE_RENDER_FILLER_FRAMES_HPP_
