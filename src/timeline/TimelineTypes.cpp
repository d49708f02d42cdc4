// Repository: Seamline
// Component: Timeline Types Implementation
// Purpose: Duration queries and truncation.
// Copyright (c) 2025 Seamline Authors

#include "seamline/timeline/TimelineTypes.hpp"

#include <algorithm>

namespace seamline::timeline {

double VideoTimeline::Duration() const {
  double total = 0.0;
  for (const auto& seg : segments) {
    total += seg.duration_s;
  }
  return total;
}

size_t VideoTimeline::FillerCount() const {
  return static_cast<size_t>(std::count_if(segments.begin(), segments.end(),
      [](const TimelineSegment& s) { return s.type == SegmentType::kFiller; }));
}

size_t VideoTimeline::ContentCount() const {
  return segments.size() - FillerCount();
}

double CompositeTrack::Duration() const {
  double end = 0.0;
  for (const auto& p : placements) {
    end = std::max(end, p.end_s());
  }
  return end;
}

double Composition::Duration() const {
  double d = video.Duration();
  if (end_s) {
    d = std::min(d, *end_s);
  }
  return d;
}

bool Composition::Truncate(double max_s) {
  if (Duration() <= max_s) {
    return false;
  }
  end_s = max_s;
  return true;
}

}  // namespace seamline::timeline
