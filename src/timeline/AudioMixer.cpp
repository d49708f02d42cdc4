// Repository: Seamline
// Component: Audio Mixer Implementation
// Purpose: Placement ordering and trailing silence.
// Copyright (c) 2025 Seamline Authors

#include "seamline/timeline/AudioMixer.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace seamline::timeline {

namespace {

constexpr const char* kComponent = "AudioMixer";

void PadWithSilence(CompositeTrack& track, double total_duration,
                    const config::CompositionConfig& config) {
  double natural = track.Duration();
  if (natural < total_duration) {
    double silence = total_duration - natural;
    if (silence > config.tolerance_s) {
      track.placements.push_back({natural, silence, nullptr});
    }
  }
}

void ReportTrack(const CompositeTrack& track, util::IReporter& reporter) {
  std::ostringstream oss;
  oss << "Total audio duration: " << track.Duration() << "s ("
      << track.placements.size() << " placements)";
  reporter.Info(util::ReportCode::kAudioTrackBuilt, kComponent, oss.str());
}

}  // namespace

CompositeTrack BuildAudioTrack(double total_duration,
                               const media::TimedFragments& fragments,
                               const config::CompositionConfig& config,
                               util::IReporter& reporter) {
  CompositeTrack track;
  track.sample_rate = config.audio_sample_rate;
  track.channels = config.audio_channels;

  if (fragments.empty()) {
    track.placements.push_back({0.0, total_duration, nullptr});
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

    for (const media::TimedFragment* tf : ordered) {
      track.placements.push_back({tf->start_time, tf->fragment->Duration(), tf->fragment.get()});
    }

    PadWithSilence(track, total_duration, config);
  }

  ReportTrack(track, reporter);
  return track;
}

CompositeTrack BuildSegmentAudioTrack(double total_duration,
                                      const std::vector<SegmentAudio>& sources,
                                      const config::CompositionConfig& config,
                                      util::IReporter& reporter) {
  CompositeTrack track;
  track.sample_rate = config.audio_sample_rate;
  track.channels = config.audio_channels;

  std::vector<const SegmentAudio*> ordered;
  ordered.reserve(sources.size());
  for (const auto& source : sources) {
    if (source.fragment && source.duration_s > 0.0) {
      ordered.push_back(&source);
    }
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const SegmentAudio* a, const SegmentAudio* b) {
                     return a->start_s < b->start_s;
                   });

  for (const SegmentAudio* source : ordered) {
    double length = std::min(source->fragment->Duration(), source->duration_s);
    track.placements.push_back({source->start_s, length, source->fragment});
  }

  if (track.placements.empty()) {
    track.placements.push_back({0.0, total_duration, nullptr});
  } else {
    PadWithSilence(track, total_duration, config);
  }

  ReportTrack(track, reporter);
  return track;
}

}  // namespace seamline::timeline
