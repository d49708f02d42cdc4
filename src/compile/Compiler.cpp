// Repository: Seamline
// Component: Compiler Implementation
// Purpose: Compose, cap, write, release.
// Copyright (c) 2025 Seamline Authors

#include "seamline/compile/Compiler.hpp"

#include <cmath>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "seamline/timeline/AudioMixer.hpp"
#include "seamline/timeline/TimelineBuilder.hpp"
#include "seamline/timeline/TimelineTypes.hpp"
#include "seamline/util/Errors.hpp"

namespace seamline::compile {

namespace {

constexpr const char* kComponent = "Compiler";

// Closes every fragment of every set when it goes out of scope.
class FragmentReleaser {
 public:
  FragmentReleaser(std::initializer_list<media::TimedFragments*> sets,
                   util::IReporter& reporter)
      : sets_(sets), reporter_(reporter) {}

  ~FragmentReleaser() {
    size_t count = 0;
    for (auto* set : sets_) {
      for (auto& tf : *set) {
        if (tf.fragment) {
          tf.fragment->Close();
          ++count;
        }
      }
    }
    reporter_.Debug(util::ReportCode::kFragmentsReleased, kComponent,
                    "Released " + std::to_string(count) + " fragments");
  }

  FragmentReleaser(const FragmentReleaser&) = delete;
  FragmentReleaser& operator=(const FragmentReleaser&) = delete;

 private:
  std::vector<media::TimedFragments*> sets_;
  util::IReporter& reporter_;
};

}  // namespace

Compiler::Compiler(encode::IMediaWriter& writer, util::IReporter& reporter,
                   config::CompositionConfig config, config::EncodingProfile profile)
    : writer_(writer), reporter_(reporter), config_(config), profile_(std::move(profile)) {}

CompileSummary Compiler::Compile(double total_duration,
                                 media::TimedFragments video_fragments,
                                 media::TimedFragments audio_fragments,
                                 const std::string& output_path,
                                 std::optional<double> max_duration) {
  // Audio-mode handles opened on the video sources; released with the rest.
  media::TimedFragments native_audio;
  FragmentReleaser releaser({&video_fragments, &audio_fragments, &native_audio}, reporter_);
  try {
    return CompileOwned(total_duration, video_fragments, audio_fragments, native_audio,
                        output_path, max_duration);
  } catch (const std::exception& e) {
    const CompileError* already = dynamic_cast<const CompileError*>(&e);
    const std::string cause = already ? already->cause() : std::string(e.what());
    reporter_.Error(util::ReportCode::kCompileFailed, kComponent,
                    "Failed to compile final video: " + cause);
    if (already) {
      throw;
    }
    throw CompileError(cause);
  }
}

CompileSummary Compiler::CompileOwned(double total_duration,
                                      const media::TimedFragments& video_fragments,
                                      const media::TimedFragments& audio_fragments,
                                      media::TimedFragments& native_audio,
                                      const std::string& output_path,
                                      std::optional<double> max_duration) {
  if (!(total_duration > 0.0) || !std::isfinite(total_duration)) {
    std::ostringstream oss;
    oss << "total duration must be positive (got " << total_duration << ")";
    throw CompileError(oss.str());
  }
  if (!config_.IsValid()) {
    throw CompileError("invalid composition config: " + config_.ToString());
  }
  for (const auto* set : {&video_fragments, &audio_fragments}) {
    for (const auto& tf : *set) {
      if (!tf.fragment) {
        throw CompileError("null fragment handle");
      }
    }
  }

  CompileSummary summary;

  timeline::Composition composition;
  composition.video = timeline::BuildVideoTimeline(total_duration, video_fragments, config_,
                                                   reporter_);
  summary.video_duration_s = composition.video.Duration();

  // Attached audio replaces whatever audio the video fragments carry.
  // Without it, the video fragments keep their own audio.
  if (!audio_fragments.empty()) {
    composition.audio = timeline::BuildAudioTrack(total_duration, audio_fragments, config_,
                                                  reporter_);
  } else {
    composition.audio = NativeAudioTrack(total_duration, composition.video, native_audio);
  }
  if (composition.audio) {
    summary.audio_duration_s = composition.audio->Duration();
  }

  if (max_duration && *max_duration > 0.0 && composition.Truncate(*max_duration)) {
    std::ostringstream oss;
    oss << "Duration limit! Crop to " << *max_duration << " seconds";
    reporter_.Info(util::ReportCode::kDurationCapped, kComponent, oss.str());
    summary.capped = true;
  }
  summary.output_duration_s = composition.Duration();

  reporter_.Info(util::ReportCode::kWritingOutput, kComponent,
                 "Writing final video to " + output_path);
  encode::WriteResult written = writer_.WriteFile(composition, output_path, profile_);
  if (!written.ok) {
    throw CompileError(written.error.empty() ? "writer failed" : written.error);
  }

  std::ostringstream oss;
  oss << "Wrote " << output_path << " (" << summary.output_duration_s << "s)";
  reporter_.Info(util::ReportCode::kOutputWritten, kComponent, oss.str());
  return summary;
}

std::optional<timeline::CompositeTrack> Compiler::NativeAudioTrack(
    double total_duration, const timeline::VideoTimeline& video,
    media::TimedFragments& native_audio) {
  std::vector<timeline::SegmentAudio> sources;
  for (const auto& seg : video.segments) {
    if (seg.IsFiller() || !seg.fragment) {
      continue;
    }
    std::unique_ptr<media::Fragment> audio = seg.fragment->OpenNativeAudio();
    if (!audio) {
      continue;
    }
    sources.push_back({seg.start_s, seg.duration_s, audio.get()});
    native_audio.push_back({seg.start_s, std::move(audio)});
  }
  if (sources.empty()) {
    return std::nullopt;
  }

  reporter_.Info(util::ReportCode::kNativeAudioKept, kComponent,
                 "Keeping audio of " + std::to_string(sources.size()) + " of " +
                     std::to_string(video.ContentCount()) + " video fragments");
  return timeline::BuildSegmentAudioTrack(total_duration, sources, config_, reporter_);
}

}  // namespace seamline::compile
