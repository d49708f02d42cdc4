// Repository: Seamline
// Component: Composition Renderer
// Purpose: Drives a composition into an IRenderSink: constant-frame-rate
//          video and fixed-chunk mixed audio, interleaved by time.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_RENDER_COMPOSITION_RENDERER_HPP_
#define SEAMLINE_RENDER_COMPOSITION_RENDERER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "seamline/media/FrameFingerprint.hpp"
#include "seamline/render/RenderSink.hpp"
#include "seamline/timeline/TimelineTypes.hpp"

namespace seamline::render {

struct RenderResult {
  bool ok = false;
  std::string error;

  int64_t video_frames = 0;
  int64_t audio_samples = 0;    // Per channel

  // One entry per segment boundary crossed (first segment included).
  std::vector<media::SeamFingerprint> seams;

  static RenderResult Failure(std::string err) {
    RenderResult r;
    r.error = std::move(err);
    return r;
  }
};

// CompositionRenderer samples the composition at a fixed frame rate.
//
// Video: llround(duration * fps) frames; frame n shows timeline time n/fps.
// Filler segments emit a pre-allocated frame. Content segments decode
// their fragment sequentially and show the latest frame whose PTS is at or
// before the local time (repeat or drop to match the output rate). A
// fragment that yields no frame renders as filler.
//
// Audio (only when the composition has a track): llround(duration * rate)
// samples in kAudioChunkSamples chunks. Placements are decoded lazily from
// their start and mixed in float; the sum saturates to S16. Fragments are
// closed once their span is rendered.
//
// Video-native audio is never read.
class CompositionRenderer {
 public:
  static constexpr int kAudioChunkSamples = 1024;

  explicit CompositionRenderer(int fps);

  RenderResult Render(const timeline::Composition& composition, IRenderSink& sink);

  int fps() const { return fps_; }

 private:
  int fps_;
};

}  // namespace seamline::render

#endif  // SEAMLINE_RENDER_COMPOSITION_RENDERER_HPP_
