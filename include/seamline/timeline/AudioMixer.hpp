// Repository: Seamline
// Component: Audio Mixer
// Purpose: Composite audio track: fragments overlaid at their start times,
//          padded with trailing silence.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_TIMELINE_AUDIO_MIXER_HPP_
#define SEAMLINE_TIMELINE_AUDIO_MIXER_HPP_

#include <vector>

#include "seamline/config/CompositionConfig.hpp"
#include "seamline/media/Fragment.hpp"
#include "seamline/timeline/TimelineTypes.hpp"
#include "seamline/util/Reporter.hpp"

namespace seamline::timeline {

// Builds the composite audio track for total_duration seconds.
//
// No fragments: one silence placement covering [0, total_duration).
// Otherwise each fragment is placed at its own start_time (ordered, stable)
// and overlapping fragments mix. If the latest fragment end falls short of
// total_duration by more than config.tolerance_s, silence fills the rest.
// Overruns are kept.
CompositeTrack BuildAudioTrack(double total_duration,
                               const media::TimedFragments& fragments,
                               const config::CompositionConfig& config,
                               util::IReporter& reporter);

// Audio carried by one content segment of the video timeline.
struct SegmentAudio {
  double start_s = 0.0;         // Segment start in output time
  double duration_s = 0.0;      // Segment length; longer audio is cut here
  media::Fragment* fragment = nullptr;
};

// Builds the track from audio that came inside the video fragments. Each
// source plays at its segment start for at most the segment length, so
// neighbouring segments never overlap. Filler segments stay silent and the
// same trailing-silence rule as BuildAudioTrack applies.
CompositeTrack BuildSegmentAudioTrack(double total_duration,
                                      const std::vector<SegmentAudio>& sources,
                                      const config::CompositionConfig& config,
                                      util::IReporter& reporter);

}  // namespace seamline::timeline

#endif  // SEAMLINE_TIMELINE_AUDIO_MIXER_HPP_
