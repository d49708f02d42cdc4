// Repository: Seamline
// Component: Composition Renderer Contract Tests
// Purpose: Frame counts, black filler identity, seam positions, audio
//          sample counts, mixing and fragment release of CompositionRenderer.
// Copyright (c) 2025 Seamline Authors

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "seamline/config/CompositionConfig.hpp"
#include "seamline/render/CompositionRenderer.hpp"
#include "seamline/render/FillerFrames.hpp"
#include "seamline/timeline/AudioMixer.hpp"
#include "seamline/timeline/TimelineBuilder.hpp"
#include "fixtures/FakeFragment.h"
#include "fixtures/RecordingRenderSink.h"
#include "fixtures/RecordingReporter.h"

namespace seamline::testing {
namespace {

using tests::fixtures::FakeFragment;
using tests::fixtures::RecordingRenderSink;
using tests::fixtures::RecordingReporter;
using tests::fixtures::Timed;

constexpr int kWidth = 64;
constexpr int kHeight = 36;
constexpr int kFps = 24;

class CompositionRendererContractTest : public ::testing::Test {
 protected:
  CompositionRendererContractTest() {
    config_.fallback_width = kWidth;
    config_.fallback_height = kHeight;
  }

  void BuildComposition(double total) {
    composition_.video = timeline::BuildVideoTimeline(total, video_, config_, reporter_);
    if (!audio_.empty()) {
      composition_.audio = timeline::BuildAudioTrack(total, audio_, config_, reporter_);
    }
  }

  render::RenderResult Render() {
    render::CompositionRenderer renderer(kFps);
    return renderer.Render(composition_, sink_);
  }

  uint32_t BlackCrc() const {
    return render::FillerFrames(kWidth, kHeight, config::FillerColor{}).VideoCRC32();
  }

  config::CompositionConfig config_;
  RecordingReporter reporter_;
  media::TimedFragments video_;
  media::TimedFragments audio_;
  timeline::Composition composition_;
  RecordingRenderSink sink_;
};

// =============================================================================
// Filler
// =============================================================================

TEST(FillerFramesTest, BlackIsStudioRangeYuv) {
  render::FillerFrames filler(16, 8, config::FillerColor{});
  const auto& f = filler.VideoFrame();

  ASSERT_EQ(f.data.size(), f.ExpectedSize());
  EXPECT_EQ(f.data[0], 0x10);
  EXPECT_EQ(f.data[f.YSize()], 0x80);
  EXPECT_EQ(f.data[f.YSize() + f.UVSize()], 0x80);
  EXPECT_EQ(filler.VideoCRC32(), media::CRC32YPlane(f));
  EXPECT_EQ(f.metadata.asset_uri, render::FillerFrames::kAssetUri);
}

TEST_F(CompositionRendererContractTest, FillerOnlyEmitsBlackFrames) {
  BuildComposition(2.0);

  auto result = Render();

  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(result.video_frames, 48);
  ASSERT_EQ(sink_.video().size(), 48u);
  for (const auto& rec : sink_.video()) {
    EXPECT_EQ(rec.y_crc32, BlackCrc());
    EXPECT_EQ(rec.first_y, 0x10);
    EXPECT_EQ(rec.width, kWidth);
    EXPECT_EQ(rec.height, kHeight);
  }
  ASSERT_EQ(result.seams.size(), 1u);
  EXPECT_TRUE(result.seams[0].incoming_is_filler);
}

TEST_F(CompositionRendererContractTest, FrameCountFollowsRoundedDuration) {
  BuildComposition(1.03);

  auto result = Render();

  ASSERT_TRUE(result.ok);
  // llround(1.03 * 24) = 25
  EXPECT_EQ(result.video_frames, 25);
}

// =============================================================================
// Content and seams
// =============================================================================

TEST_F(CompositionRendererContractTest, ContentBetweenFillerSeamsAtSegmentStarts) {
  auto frag = FakeFragment::Video(1.0, kWidth, kHeight, 0x80, kFps);
  auto tally = frag->tally();
  video_.push_back(Timed(1.0, std::move(frag)));
  BuildComposition(3.0);

  auto result = Render();

  ASSERT_TRUE(result.ok) << result.error;
  ASSERT_EQ(sink_.video().size(), 72u);
  for (int i = 0; i < 72; ++i) {
    const bool content = i >= 24 && i < 48;
    EXPECT_EQ(sink_.video()[i].first_y, content ? 0x80 : 0x10) << "frame " << i;
    EXPECT_EQ(sink_.video()[i].frame_index, i);
  }

  ASSERT_EQ(result.seams.size(), 3u);
  EXPECT_EQ(result.seams[0].frame_index, 0);
  EXPECT_EQ(result.seams[1].frame_index, 24);
  EXPECT_FALSE(result.seams[1].incoming_is_filler);
  EXPECT_EQ(result.seams[1].outgoing_crc32, BlackCrc());
  EXPECT_EQ(result.seams[2].frame_index, 48);
  EXPECT_EQ(result.seams[2].incoming_crc32, BlackCrc());

  EXPECT_EQ(tally->video_frames_read, 24);
  EXPECT_GE(tally->close_calls, 1);
}

TEST_F(CompositionRendererContractTest, FramelessContentRendersBlack) {
  auto frag = FakeFragment::Video(1.0, kWidth, kHeight);
  frag->WithoutFrames();
  video_.push_back(Timed(0.0, std::move(frag)));
  BuildComposition(1.0);

  auto result = Render();

  ASSERT_TRUE(result.ok);
  ASSERT_EQ(sink_.video().size(), 24u);
  EXPECT_EQ(sink_.video()[0].y_crc32, BlackCrc());
}

TEST_F(CompositionRendererContractTest, TruncatedCompositionStopsAtCap) {
  video_.push_back(Timed(0.0, FakeFragment::Video(3.0, kWidth, kHeight)));
  BuildComposition(3.0);
  ASSERT_TRUE(composition_.Truncate(1.5));

  auto result = Render();

  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.video_frames, 36);
}

// =============================================================================
// Audio
// =============================================================================

TEST_F(CompositionRendererContractTest, NoAudioTrackEmitsNoAudio) {
  BuildComposition(1.0);

  auto result = Render();

  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.audio_samples, 0);
  EXPECT_EQ(sink_.audio_chunks(), 0);
}

TEST_F(CompositionRendererContractTest, AudioCoversDurationAndPlacesFragment) {
  auto frag = FakeFragment::Audio(1.0, 1000);
  auto tally = frag->tally();
  audio_.push_back(Timed(0.5, std::move(frag)));
  BuildComposition(2.0);

  auto result = Render();

  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(result.audio_samples, 88200);
  EXPECT_EQ(sink_.audio_samples(), 88200);
  EXPECT_EQ(sink_.audio_channels(), 2);
  EXPECT_EQ(sink_.audio_sample_rate(), 44100);
  // One second of stereo signal, silence elsewhere.
  EXPECT_EQ(sink_.nonzero_samples(), 88200);
  EXPECT_GE(tally->close_calls, 1);
}

TEST_F(CompositionRendererContractTest, SilenceOnlyTrackIsAllZero) {
  composition_.video = timeline::BuildVideoTimeline(1.0, video_, config_, reporter_);
  composition_.audio = timeline::BuildAudioTrack(1.0, audio_, config_, reporter_);

  auto result = Render();

  ASSERT_TRUE(result.ok);
  EXPECT_EQ(sink_.audio_samples(), 44100);
  EXPECT_EQ(sink_.nonzero_samples(), 0);
}

TEST_F(CompositionRendererContractTest, OverlappingAudioSums) {
  audio_.push_back(Timed(0.0, FakeFragment::Audio(3.0, 1000)));
  audio_.push_back(Timed(1.0, FakeFragment::Audio(3.0, 1000)));
  BuildComposition(4.0);

  auto result = Render();

  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(sink_.SampleAtSeconds(0.5), 1000);
  EXPECT_EQ(sink_.SampleAtSeconds(1.5), 2000);
  EXPECT_EQ(sink_.SampleAtSeconds(2.5, 1), 2000);
  EXPECT_EQ(sink_.SampleAtSeconds(3.5), 1000);
}

TEST_F(CompositionRendererContractTest, OverlapSaturatesAtSampleRange) {
  audio_.push_back(Timed(0.0, FakeFragment::Audio(1.0, 30000)));
  audio_.push_back(Timed(0.0, FakeFragment::Audio(1.0, 30000)));
  audio_.push_back(Timed(1.0, FakeFragment::Audio(1.0, -30000)));
  audio_.push_back(Timed(1.0, FakeFragment::Audio(1.0, -30000)));
  BuildComposition(2.0);

  auto result = Render();

  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(sink_.SampleAtSeconds(0.5), 32767);
  EXPECT_EQ(sink_.SampleAtSeconds(0.5, 1), 32767);
  EXPECT_EQ(sink_.SampleAtSeconds(1.5), -32768);
}

TEST_F(CompositionRendererContractTest, SegmentAudioStopsAtSegmentEnd) {
  auto longer = FakeFragment::Audio(2.0, 700);
  std::vector<timeline::SegmentAudio> sources = {{0.5, 1.0, longer.get()}};
  composition_.video = timeline::BuildVideoTimeline(2.0, video_, config_, reporter_);
  composition_.audio = timeline::BuildSegmentAudioTrack(2.0, sources, config_, reporter_);

  auto result = Render();

  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(sink_.SampleAtSeconds(0.25), 0);
  EXPECT_EQ(sink_.SampleAtSeconds(1.0), 700);
  EXPECT_EQ(sink_.SampleAtSeconds(1.75), 0);
  // One second of stereo signal.
  EXPECT_EQ(sink_.nonzero_samples(), 88200);
  EXPECT_GE(longer->tally()->close_calls, 1);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(CompositionRendererContractTest, SinkRejectionAbortsRender) {
  BuildComposition(2.0);
  sink_.RejectVideoAt(5);

  auto result = Render();

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, "sink rejected video frame 5");
  EXPECT_EQ(result.video_frames, 5);
}

TEST_F(CompositionRendererContractTest, EmptyCompositionFails) {
  auto result = Render();

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, "composition has no video segments");
}

TEST_F(CompositionRendererContractTest, InvalidFrameRateFails) {
  BuildComposition(1.0);
  render::CompositionRenderer renderer(0);

  auto result = renderer.Render(composition_, sink_);

  EXPECT_FALSE(result.ok);
  EXPECT_TRUE(sink_.video().empty());
}

}  // namespace
}  // namespace seamline::testing
