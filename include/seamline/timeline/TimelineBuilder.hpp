// Repository: Seamline
// Component: Timeline Builder
// Purpose: Concatenated video timeline with black filler in the gaps.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_TIMELINE_TIMELINE_BUILDER_HPP_
#define SEAMLINE_TIMELINE_TIMELINE_BUILDER_HPP_

#include "seamline/config/CompositionConfig.hpp"
#include "seamline/media/Fragment.hpp"
#include "seamline/timeline/TimelineTypes.hpp"
#include "seamline/util/Reporter.hpp"

namespace seamline::timeline {

// Builds the video timeline for total_duration seconds.
//
// Fragments are ordered by start_time (stable: equal starts keep input
// order). Walking from t=0, a gap larger than config.tolerance_s before a
// fragment becomes filler of exactly the gap; the fragment follows and time
// advances by the fragment's own duration. Leftover time above tolerance
// becomes one trailing filler.
//
// Overlapping or overrunning fragments are concatenated as-is, so the result
// may run longer than total_duration; it is never shorter by more than the
// tolerance.
//
// Filler takes the first ordered fragment's frame size, or the configured
// fallback size when there are no fragments.
VideoTimeline BuildVideoTimeline(double total_duration,
                                 const media::TimedFragments& fragments,
                                 const config::CompositionConfig& config,
                                 util::IReporter& reporter);

}  // namespace seamline::timeline

#endif  // SEAMLINE_TIMELINE_TIMELINE_BUILDER_HPP_
