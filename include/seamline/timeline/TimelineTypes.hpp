// Repository: Seamline
// Component: Timeline Types
// Purpose: Video timeline (contiguous segments), composite audio track
//          (overlaid placements) and the composition that pairs them.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_TIMELINE_TIMELINE_TYPES_HPP_
#define SEAMLINE_TIMELINE_TIMELINE_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <vector>

#include "seamline/buffer/Frame.hpp"
#include "seamline/config/CompositionConfig.hpp"
#include "seamline/media/Fragment.hpp"

namespace seamline::timeline {

// =============================================================================
// Segment Type
// =============================================================================

enum class SegmentType : int32_t {
  kContent = 0,
  kFiller  = 1,
};

inline const char* SegmentTypeName(SegmentType t) {
  switch (t) {
    case SegmentType::kContent: return "content";
    case SegmentType::kFiller:  return "filler";
  }
  return "unknown";
}

// =============================================================================
// Video Timeline
// =============================================================================

// One entry of a concatenated video timeline. Segments do not overlap in
// output time: each begins where the previous one ended.
struct TimelineSegment {
  SegmentType type = SegmentType::kFiller;
  double start_s = 0.0;         // Output-time start (sum of prior durations)
  double duration_s = 0.0;

  // Content only. Non-owning; the Compiler owns the fragment.
  media::Fragment* fragment = nullptr;

  // Filler only.
  int width = 0;
  int height = 0;
  config::FillerColor color;

  double end_s() const { return start_s + duration_s; }
  bool IsFiller() const { return type == SegmentType::kFiller; }
};

struct VideoTimeline {
  std::vector<TimelineSegment> segments;
  int width = 0;                // Output frame size
  int height = 0;

  // Sum of segment durations.
  double Duration() const;

  size_t FillerCount() const;
  size_t ContentCount() const;
};

// =============================================================================
// Audio Track
// =============================================================================

// One layer of the composite track. fragment == nullptr means silence.
struct AudioPlacement {
  double start_s = 0.0;
  double duration_s = 0.0;
  media::Fragment* fragment = nullptr;

  double end_s() const { return start_s + duration_s; }
  bool IsSilence() const { return fragment == nullptr; }
};

// Overlay of placements; overlapping placements sum.
struct CompositeTrack {
  std::vector<AudioPlacement> placements;   // Ascending start_s
  int sample_rate = buffer::kHouseAudioSampleRate;
  int channels = buffer::kHouseAudioChannels;

  // Latest placement end (0 when empty).
  double Duration() const;
};

// =============================================================================
// Composition
// =============================================================================

// Video timeline plus optional audio track. Audio comes only from the
// track; the video segments are never read for audio. No track means the
// output has no audio stream.
struct Composition {
  VideoTimeline video;
  std::optional<CompositeTrack> audio;

  // Hard end cap set by Truncate(); output covers [0, end_s).
  std::optional<double> end_s;

  // min(video duration, end cap).
  double Duration() const;

  // Caps the composition at max_s. No effect if already shorter or equal.
  // Returns true if the cap shortened the composition.
  bool Truncate(double max_s);
};

}  // namespace seamline::timeline

#endif  // SEAMLINE_TIMELINE_TIMELINE_TYPES_HPP_
