// Repository: Seamline
// Component: Timeline Builder Implementation
// Purpose: Gap detection and filler insertion.
// Copyright (c) 2025 Seamline Authors

#include "seamline/timeline/TimelineBuilder.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace seamline::timeline {

namespace {

constexpr const char* kComponent = "TimelineBuilder";

TimelineSegment MakeFiller(double start_s, double duration_s, int width, int height,
                           const config::FillerColor& color) {
  TimelineSegment seg;
  seg.type = SegmentType::kFiller;
  seg.start_s = start_s;
  seg.duration_s = duration_s;
  seg.width = width;
  seg.height = height;
  seg.color = color;
  return seg;
}

}  // namespace

VideoTimeline BuildVideoTimeline(double total_duration,
                                 const media::TimedFragments& fragments,
                                 const config::CompositionConfig& config,
                                 util::IReporter& reporter) {
  VideoTimeline timeline;

  if (fragments.empty()) {
    timeline.width = config.fallback_width;
    timeline.height = config.fallback_height;
    timeline.segments.push_back(MakeFiller(0.0, total_duration, timeline.width,
                                           timeline.height, config.filler_color));
  } else {
    std::vector<const media::TimedFragment*> ordered;
    ordered.reserve(fragments.size());
    for (const auto& tf : fragments) {
      ordered.push_back(&tf);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const media::TimedFragment* a, const media::TimedFragment* b) {
                       return a->start_time < b->start_time;
                     });

    const media::Fragment& first = *ordered.front()->fragment;
    timeline.width = first.Width() > 0 ? first.Width() : config.fallback_width;
    timeline.height = first.Height() > 0 ? first.Height() : config.fallback_height;

    double current_time = 0.0;
    for (const media::TimedFragment* tf : ordered) {
      if (tf->start_time > current_time) {
        double gap = tf->start_time - current_time;
        if (gap > config.tolerance_s) {
          timeline.segments.push_back(MakeFiller(current_time, gap, timeline.width,
                                                 timeline.height, config.filler_color));
          current_time += gap;
        }
      }

      TimelineSegment content;
      content.type = SegmentType::kContent;
      content.start_s = current_time;
      content.duration_s = tf->fragment->Duration();
      content.fragment = tf->fragment.get();
      timeline.segments.push_back(content);

      // Advance by the fragment's own length, not to start_time + length.
      current_time += content.duration_s;
    }

    if (current_time < total_duration) {
      double remaining = total_duration - current_time;
      if (remaining > config.tolerance_s) {
        timeline.segments.push_back(MakeFiller(current_time, remaining, timeline.width,
                                               timeline.height, config.filler_color));
      }
    }
  }

  std::ostringstream oss;
  oss << "Final video duration: " << timeline.Duration() << "s ("
      << timeline.ContentCount() << " content, " << timeline.FillerCount() << " filler, "
      << timeline.width << "x" << timeline.height << ")";
  reporter.Info(util::ReportCode::kVideoTimelineBuilt, kComponent, oss.str());
  return timeline;
}

}  // namespace seamline::timeline
