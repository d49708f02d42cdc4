// Repository: Seamline
// Component: Compiler
// Purpose: Build the video timeline and audio track, attach audio, apply the
//          duration cap, write the output, release every fragment.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_COMPILE_COMPILER_HPP_
#define SEAMLINE_COMPILE_COMPILER_HPP_

#include <optional>
#include <string>

#include "seamline/config/CompositionConfig.hpp"
#include "seamline/config/EncodingProfile.hpp"
#include "seamline/encode/MediaWriter.hpp"
#include "seamline/media/Fragment.hpp"
#include "seamline/timeline/TimelineTypes.hpp"
#include "seamline/util/Reporter.hpp"

namespace seamline::compile {

struct CompileSummary {
  double video_duration_s = 0.0;    // Timeline before the cap
  std::optional<double> audio_duration_s;
  double output_duration_s = 0.0;   // After the cap
  bool capped = false;
};

// Compiler takes ownership of both fragment sets for one Compile() call.
//
// With no audio fragments, content segments keep the audio their own
// sources carry (filler is silent); with audio fragments, that audio is
// dropped in favour of the composite track.
//
// On success and on every failure path, all fragments are closed before
// Compile() returns or throws. Any failure surfaces as CompileError with
// the underlying message as cause().
class Compiler {
 public:
  Compiler(encode::IMediaWriter& writer, util::IReporter& reporter,
           config::CompositionConfig config = config::CompositionConfig(),
           config::EncodingProfile profile = config::EncodingProfile::Default());

  // max_duration: when set and > 0, output is cut to [0, max_duration] if
  // longer. Non-positive values are ignored.
  CompileSummary Compile(double total_duration,
                         media::TimedFragments video_fragments,
                         media::TimedFragments audio_fragments,
                         const std::string& output_path,
                         std::optional<double> max_duration = std::nullopt);

  const config::EncodingProfile& profile() const { return profile_; }

 private:
  CompileSummary CompileOwned(double total_duration,
                              const media::TimedFragments& video_fragments,
                              const media::TimedFragments& audio_fragments,
                              media::TimedFragments& native_audio,
                              const std::string& output_path,
                              std::optional<double> max_duration);

  // nullopt when no content segment has decodable audio.
  std::optional<timeline::CompositeTrack> NativeAudioTrack(
      double total_duration, const timeline::VideoTimeline& video,
      media::TimedFragments& native_audio);

  encode::IMediaWriter& writer_;
  util::IReporter& reporter_;
  config::CompositionConfig config_;
  config::EncodingProfile profile_;
};

}  // namespace seamline::compile

#endif  // SEAMLINE_COMPILE_COMPILER_HPP_
