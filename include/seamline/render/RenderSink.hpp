// Repository: Seamline
// Component: Render Sink
// Purpose: Consumer of rendered output frames (encoder, or a recorder in
//          tests).
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_RENDER_RENDER_SINK_HPP_
#define SEAMLINE_RENDER_RENDER_SINK_HPP_

#include <cstdint>

#include "seamline/buffer/Frame.hpp"

namespace seamline::render {

// Frames arrive in output order. Video frames may differ in size from the
// composition frame size (content keeps its native size); the sink scales.
// Audio frames are house format. Returning false aborts the render.
class IRenderSink {
 public:
  virtual ~IRenderSink() = default;

  // frame_index counts output frames from 0 at the profile frame rate.
  virtual bool ConsumeVideo(const buffer::Frame& frame, int64_t frame_index) = 0;

  virtual bool ConsumeAudio(const buffer::AudioFrame& frame) = 0;
};

}  // namespace seamline::render

#endif  // SEAMLINE_RENDER_RENDER_SINK_HPP_
