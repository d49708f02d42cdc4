// Repository: Seamline
// Component: Compiler Contract Tests
// Purpose: Audio attachment, duration cap, error wrapping and fragment
//          release of Compiler::Compile.
// Copyright (c) 2025 Seamline Authors

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "seamline/compile/Compiler.hpp"
#include "seamline/util/Errors.hpp"
#include "fixtures/FakeFragment.h"
#include "fixtures/RecordingReporter.h"
#include "fixtures/RecordingWriter.h"

namespace seamline::testing {
namespace {

using tests::fixtures::FakeFragment;
using tests::fixtures::FragmentTally;
using tests::fixtures::RecordingReporter;
using tests::fixtures::RecordingWriter;
using tests::fixtures::Timed;
using util::ReportCode;

class CompilerContractTest : public ::testing::Test {
 protected:
  CompilerContractTest() : compiler_(writer_, reporter_) {}

  void AddVideo(double start, double duration) {
    auto f = FakeFragment::Video(duration);
    tallies_.push_back(f->tally());
    video_.push_back(Timed(start, std::move(f)));
  }

  // Video whose source also carries audio; returns the video's tally.
  std::shared_ptr<FragmentTally> AddVideoWithAudio(double start, double duration,
                                                   int16_t level = 500,
                                                   double audio_duration = -1.0) {
    auto f = FakeFragment::Video(duration);
    f->WithNativeAudio(level, audio_duration);
    auto tally = f->tally();
    tallies_.push_back(tally);
    video_.push_back(Timed(start, std::move(f)));
    return tally;
  }

  void AddAudio(double start, double duration) {
    auto f = FakeFragment::Audio(duration);
    tallies_.push_back(f->tally());
    audio_.push_back(Timed(start, std::move(f)));
  }

  compile::CompileSummary Compile(double total, std::optional<double> max = std::nullopt) {
    return compiler_.Compile(total, std::move(video_), std::move(audio_), "/tmp/out.mp4", max);
  }

  void ExpectAllReleased() const {
    for (const auto& p : tallies_) {
      EXPECT_GE(p->close_calls, 1);
    }
  }

  RecordingWriter writer_;
  RecordingReporter reporter_;
  compile::Compiler compiler_;
  media::TimedFragments video_;
  media::TimedFragments audio_;
  std::vector<std::shared_ptr<FragmentTally>> tallies_;
};

// =============================================================================
// Composition handed to the writer
// =============================================================================

TEST_F(CompilerContractTest, SilentVideoHasNoAudioTrack) {
  AddVideo(3.0, 4.0);

  auto summary = Compile(10.0);

  ASSERT_EQ(writer_.calls(), 1);
  const auto& comp = *writer_.composition();
  EXPECT_FALSE(comp.audio.has_value());
  EXPECT_EQ(comp.video.segments.size(), 3u);
  EXPECT_DOUBLE_EQ(comp.Duration(), 10.0);
  EXPECT_FALSE(summary.audio_duration_s.has_value());
  EXPECT_FALSE(summary.capped);
  EXPECT_EQ(writer_.output_path(), "/tmp/out.mp4");
  EXPECT_FALSE(reporter_.Has(ReportCode::kNativeAudioKept));
}

// =============================================================================
// Audio carried by the video fragments
// =============================================================================

TEST_F(CompilerContractTest, VideoAudioIsKeptWithoutAudioFragments) {
  auto tally = AddVideoWithAudio(3.0, 4.0);

  auto summary = Compile(10.0);

  const auto& comp = *writer_.composition();
  ASSERT_TRUE(comp.audio.has_value());
  ASSERT_EQ(comp.audio->placements.size(), 2u);

  // Content segment [3, 7) plays its own audio; filler after it is silent.
  const auto& content = comp.audio->placements[0];
  EXPECT_DOUBLE_EQ(content.start_s, 3.0);
  EXPECT_DOUBLE_EQ(content.duration_s, 4.0);
  EXPECT_NE(content.fragment, nullptr);
  const auto& tail = comp.audio->placements[1];
  EXPECT_TRUE(tail.IsSilence());
  EXPECT_DOUBLE_EQ(tail.start_s, 7.0);
  EXPECT_DOUBLE_EQ(tail.duration_s, 3.0);

  ASSERT_TRUE(summary.audio_duration_s.has_value());
  EXPECT_DOUBLE_EQ(*summary.audio_duration_s, 10.0);
  EXPECT_TRUE(reporter_.Has(ReportCode::kNativeAudioKept));

  EXPECT_EQ(tally->native_audio_opens, 1);
  ASSERT_NE(tally->native_audio, nullptr);
  EXPECT_FALSE(writer_.any_fragment_closed_during_write());
  EXPECT_GE(tally->native_audio->close_calls, 1);
  ExpectAllReleased();
}

TEST_F(CompilerContractTest, VideoAudioIsCutToItsSegment) {
  AddVideoWithAudio(0.0, 2.0, 500, 3.0);
  AddVideoWithAudio(2.0, 2.0);

  Compile(4.0);

  const auto& comp = *writer_.composition();
  ASSERT_TRUE(comp.audio.has_value());
  ASSERT_EQ(comp.audio->placements.size(), 2u);
  EXPECT_DOUBLE_EQ(comp.audio->placements[0].start_s, 0.0);
  EXPECT_DOUBLE_EQ(comp.audio->placements[0].duration_s, 2.0);
  EXPECT_DOUBLE_EQ(comp.audio->placements[1].start_s, 2.0);
  EXPECT_DOUBLE_EQ(comp.audio->placements[1].duration_s, 2.0);
}

TEST_F(CompilerContractTest, OnlyVideosWithAudioContribute) {
  AddVideo(0.0, 2.0);
  AddVideoWithAudio(2.0, 2.0);

  Compile(4.0);

  const auto& comp = *writer_.composition();
  ASSERT_TRUE(comp.audio.has_value());
  ASSERT_EQ(comp.audio->placements.size(), 1u);
  EXPECT_DOUBLE_EQ(comp.audio->placements[0].start_s, 2.0);
  const auto* e = reporter_.Find(ReportCode::kNativeAudioKept);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->message, "Keeping audio of 1 of 2 video fragments");
}

TEST_F(CompilerContractTest, AudioFragmentsReplaceVideoAudio) {
  auto tally = AddVideoWithAudio(0.0, 4.0);
  AddAudio(0.0, 4.0);

  Compile(4.0);

  const auto& comp = *writer_.composition();
  ASSERT_TRUE(comp.audio.has_value());
  ASSERT_EQ(comp.audio->placements.size(), 1u);
  EXPECT_EQ(tally->native_audio_opens, 0);
  EXPECT_FALSE(reporter_.Has(ReportCode::kNativeAudioKept));
}

TEST_F(CompilerContractTest, VideoAudioIsReleasedWhenWriterFails) {
  auto tally = AddVideoWithAudio(0.0, 2.0);
  writer_.FailWith("disk full");

  EXPECT_THROW(Compile(2.0), CompileError);

  ASSERT_NE(tally->native_audio, nullptr);
  EXPECT_GE(tally->native_audio->close_calls, 1);
  ExpectAllReleased();
}

TEST_F(CompilerContractTest, AudioFragmentsAreAttached) {
  AddVideo(0.0, 4.0);
  AddAudio(0.0, 3.0);
  AddAudio(1.0, 3.0);

  auto summary = Compile(4.0);

  const auto& comp = *writer_.composition();
  ASSERT_TRUE(comp.audio.has_value());
  EXPECT_EQ(comp.audio->placements.size(), 2u);
  ASSERT_TRUE(summary.audio_duration_s.has_value());
  EXPECT_DOUBLE_EQ(*summary.audio_duration_s, 4.0);
}

TEST_F(CompilerContractTest, NoVideoFragmentsStillWritesFiller) {
  AddAudio(0.0, 2.0);

  Compile(5.0);

  const auto& comp = *writer_.composition();
  ASSERT_EQ(comp.video.segments.size(), 1u);
  EXPECT_TRUE(comp.video.segments[0].IsFiller());
  EXPECT_DOUBLE_EQ(comp.Duration(), 5.0);
}

TEST_F(CompilerContractTest, HandsProfileToWriter) {
  AddVideo(0.0, 1.0);
  config::EncodingProfile profile;
  profile.fps = 30;
  compile::Compiler compiler(writer_, reporter_, config::CompositionConfig(), profile);

  compiler.Compile(1.0, std::move(video_), {}, "/tmp/a.mkv");

  EXPECT_EQ(writer_.profile().fps, 30);
  EXPECT_EQ(writer_.profile().video_codec, "libx264");
}

// =============================================================================
// Duration cap
// =============================================================================

TEST_F(CompilerContractTest, MaxDurationCropsLongerOutput) {
  AddVideo(3.0, 4.0);

  auto summary = Compile(10.0, 8.0);

  EXPECT_TRUE(summary.capped);
  EXPECT_DOUBLE_EQ(summary.video_duration_s, 10.0);
  EXPECT_DOUBLE_EQ(summary.output_duration_s, 8.0);
  EXPECT_DOUBLE_EQ(writer_.composition()->Duration(), 8.0);
  const auto* e = reporter_.Find(ReportCode::kDurationCapped);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->message, "Duration limit! Crop to 8 seconds");
}

TEST_F(CompilerContractTest, MaxDurationAboveLengthIsNoOp) {
  AddVideo(0.0, 4.0);

  auto summary = Compile(4.0, 30.0);

  EXPECT_FALSE(summary.capped);
  EXPECT_DOUBLE_EQ(writer_.composition()->Duration(), 4.0);
  EXPECT_FALSE(reporter_.Has(ReportCode::kDurationCapped));
}

TEST_F(CompilerContractTest, NonPositiveMaxDurationIsIgnored) {
  AddVideo(0.0, 4.0);

  auto summary = Compile(4.0, 0.0);

  EXPECT_FALSE(summary.capped);
  EXPECT_DOUBLE_EQ(writer_.composition()->Duration(), 4.0);
}

// =============================================================================
// Release and errors
// =============================================================================

TEST_F(CompilerContractTest, FragmentsAreOpenDuringWriteAndReleasedAfter) {
  AddVideo(0.0, 2.0);
  AddAudio(0.0, 2.0);

  Compile(2.0);

  EXPECT_FALSE(writer_.any_fragment_closed_during_write());
  ExpectAllReleased();
  EXPECT_TRUE(reporter_.Has(ReportCode::kOutputWritten));
  EXPECT_TRUE(reporter_.Has(ReportCode::kFragmentsReleased));
}

TEST_F(CompilerContractTest, WriterFailureRaisesCompileErrorAndReleases) {
  AddVideo(0.0, 2.0);
  AddAudio(0.5, 1.0);
  writer_.FailWith("encoder exploded");

  try {
    Compile(2.0);
    FAIL() << "expected CompileError";
  } catch (const CompileError& e) {
    EXPECT_EQ(e.cause(), "encoder exploded");
    EXPECT_STREQ(e.what(), "Failed to compile final video: encoder exploded");
  }

  ExpectAllReleased();
  EXPECT_TRUE(reporter_.Has(ReportCode::kCompileFailed));
  EXPECT_FALSE(reporter_.Has(ReportCode::kOutputWritten));
}

TEST_F(CompilerContractTest, NonPositiveTotalRaisesCompileError) {
  AddVideo(0.0, 2.0);

  EXPECT_THROW(Compile(0.0), CompileError);
  EXPECT_EQ(writer_.calls(), 0);
  ExpectAllReleased();
}

TEST_F(CompilerContractTest, InvalidConfigRaisesCompileError) {
  AddVideo(0.0, 2.0);
  config::CompositionConfig bad;
  bad.fallback_width = 641;
  compile::Compiler compiler(writer_, reporter_, bad);

  EXPECT_THROW(compiler.Compile(2.0, std::move(video_), {}, "/tmp/out.mp4"), CompileError);
  ExpectAllReleased();
}

TEST_F(CompilerContractTest, NullFragmentHandleRaisesCompileError) {
  AddVideo(0.0, 2.0);
  video_.push_back(media::TimedFragment{1.0, nullptr});

  EXPECT_THROW(Compile(2.0), CompileError);
  ExpectAllReleased();
}

}  // namespace
}  // namespace seamline::testing
