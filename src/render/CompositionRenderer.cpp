// Repository: Seamline
// Component: Composition Renderer Implementation
// Purpose: Frame-rate conversion, filler emission and audio mixing.
// Copyright (c) 2025 Seamline Authors

#include "seamline/render/CompositionRenderer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <utility>

#include "seamline/render/FillerFrames.hpp"
#include "seamline/util/Logger.hpp"

namespace seamline::render {

namespace {

// Segment boundaries are sums of doubles; a frame time this close to a
// boundary belongs to the next segment.
constexpr double kBoundaryEpsilon = 1e-9;

// Sequential reader over one content fragment. Holds the latest frame whose
// PTS is at or before the requested local time, with one frame of lookahead.
class VideoCursor {
 public:
  explicit VideoCursor(media::Fragment* fragment) : fragment_(fragment) {}

  // nullptr when the fragment produced no frame at all.
  const buffer::Frame* FrameAt(int64_t local_us) {
    if (!started_) {
      started_ = true;
      has_held_ = Pull(held_);
      if (has_held_) {
        has_next_ = Pull(next_);
      }
    }
    while (has_next_ && next_.metadata.pts <= local_us) {
      std::swap(held_, next_);
      has_next_ = Pull(next_);
    }
    return has_held_ ? &held_ : nullptr;
  }

 private:
  bool Pull(buffer::Frame& frame) {
    return fragment_ && !fragment_->IsClosed() && fragment_->NextVideoFrame(frame);
  }

  media::Fragment* fragment_;
  bool started_ = false;
  bool has_held_ = false;
  bool has_next_ = false;
  buffer::Frame held_;
  buffer::Frame next_;
};

// Sequential reader over one audio fragment. Past end of stream it
// contributes nothing (silence).
class AudioCursor {
 public:
  AudioCursor(media::Fragment* fragment, int channels)
      : fragment_(fragment), channels_(channels) {}

  // Adds count sample frames into dst (interleaved, channels_ wide).
  void MixInto(float* dst, int64_t count) {
    while (count > 0) {
      if (pos_ >= frame_.nb_samples && !Refill()) {
        return;
      }
      const int64_t n = std::min<int64_t>(count, frame_.nb_samples - pos_);
      const int src_channels = frame_.channels;
      const int16_t* src = frame_.Samples() + pos_ * src_channels;
      for (int64_t i = 0; i < n; ++i) {
        for (int c = 0; c < channels_; ++c) {
          // Fewer source channels: repeat the last one (mono → both sides).
          const int sc = std::min(c, src_channels - 1);
          dst[i * channels_ + c] += static_cast<float>(src[i * src_channels + sc]);
        }
      }
      dst += n * channels_;
      count -= n;
      pos_ += n;
    }
  }

 private:
  bool Refill() {
    while (!eof_) {
      if (!fragment_ || fragment_->IsClosed() || !fragment_->NextAudioFrame(frame_)) {
        eof_ = true;
        break;
      }
      if (frame_.nb_samples > 0 && frame_.channels > 0) {
        pos_ = 0;
        return true;
      }
    }
    frame_.nb_samples = 0;
    pos_ = 0;
    return false;
  }

  media::Fragment* fragment_;
  int channels_;
  buffer::AudioFrame frame_;
  int64_t pos_ = 0;
  bool eof_ = false;
};

struct PlacementState {
  const timeline::AudioPlacement* placement = nullptr;
  int64_t start_sample = 0;
  int64_t end_sample = 0;
  std::unique_ptr<AudioCursor> cursor;
  bool done = false;
};

// One Render() call.
class RenderSession {
 public:
  RenderSession(const timeline::Composition& composition, IRenderSink& sink, int fps)
      : composition_(composition), sink_(sink), fps_(fps) {}

  RenderResult Run() {
    const auto& segments = composition_.video.segments;
    if (segments.empty()) {
      return RenderResult::Failure("composition has no video segments");
    }
    const double duration = composition_.Duration();
    if (!(duration > 0.0)) {
      return RenderResult::Failure("composition duration is not positive");
    }

    const int64_t total_frames = std::llround(duration * fps_);
    if (composition_.audio) {
      PrepareAudio(duration);
    }

    size_t seg_idx = 0;
    size_t current_seg = std::numeric_limits<size_t>::max();
    std::optional<VideoCursor> cursor;
    uint32_t last_crc = 0;

    for (int64_t n = 0; n < total_frames; ++n) {
      const double t = static_cast<double>(n) / fps_;
      while (seg_idx + 1 < segments.size() &&
             t >= segments[seg_idx].end_s() - kBoundaryEpsilon) {
        ++seg_idx;
      }

      const timeline::TimelineSegment& seg = segments[seg_idx];
      const bool entering = seg_idx != current_seg;
      if (entering) {
        CloseSegment(current_seg);
        current_seg = seg_idx;
        cursor.reset();
        if (!seg.IsFiller()) {
          cursor.emplace(seg.fragment);
        }
      }

      const buffer::Frame* frame = nullptr;
      if (seg.IsFiller()) {
        frame = &Filler(seg.width, seg.height, seg.color).VideoFrame();
      } else {
        const auto local_us = static_cast<int64_t>(std::llround((t - seg.start_s) * 1'000'000.0));
        frame = cursor->FrameAt(local_us);
        if (!frame) {
          frame = &Filler(composition_.video.width, composition_.video.height,
                          config::FillerColor{}).VideoFrame();
        }
      }

      const uint32_t crc = media::CRC32YPlane(*frame);
      if (entering) {
        media::SeamFingerprint seam;
        seam.frame_index = n;
        seam.segment_index = seg_idx;
        seam.incoming_is_filler = seg.IsFiller();
        seam.outgoing_crc32 = last_crc;
        seam.incoming_crc32 = crc;
        result_.seams.push_back(seam);
      }

      if (!sink_.ConsumeVideo(*frame, n)) {
        return Fail("sink rejected video frame " + std::to_string(n));
      }
      last_crc = crc;
      ++result_.video_frames;

      if (composition_.audio) {
        const int64_t watermark = std::llround(static_cast<double>(n + 1) * sample_rate_ / fps_);
        if (!EmitAudioUntil(std::min(watermark, total_samples_))) {
          return result_;
        }
      }
    }
    CloseSegment(current_seg);

    if (composition_.audio && !EmitAudioUntil(total_samples_)) {
      return result_;
    }

    result_.ok = true;
    return result_;
  }

 private:
  RenderResult& Fail(const std::string& error) {
    result_.ok = false;
    result_.error = error;
    return result_;
  }

  void CloseSegment(size_t index) {
    const auto& segments = composition_.video.segments;
    if (index < segments.size() && segments[index].fragment) {
      segments[index].fragment->Close();
    }
  }

  const FillerFrames& Filler(int width, int height, const config::FillerColor& color) {
    for (const auto& f : fillers_) {
      if (f->Matches(width, height, color)) {
        return *f;
      }
    }
    fillers_.push_back(std::make_unique<FillerFrames>(width, height, color));
    return *fillers_.back();
  }

  void PrepareAudio(double duration) {
    const timeline::CompositeTrack& track = *composition_.audio;
    sample_rate_ = track.sample_rate;
    channels_ = track.channels;
    total_samples_ = std::llround(duration * sample_rate_);

    for (const auto& p : track.placements) {
      if (p.IsSilence()) {
        continue;
      }
      PlacementState state;
      state.placement = &p;
      state.start_sample = std::llround(p.start_s * sample_rate_);
      state.end_sample = state.start_sample + std::llround(p.duration_s * sample_rate_);
      placements_.push_back(std::move(state));
    }
  }

  bool EmitAudioUntil(int64_t target_sample) {
    while (audio_pos_ < target_sample) {
      const int64_t n = std::min<int64_t>(CompositionRenderer::kAudioChunkSamples,
                                          total_samples_ - audio_pos_);
      MixChunk(audio_pos_, n);
      if (!sink_.ConsumeAudio(audio_frame_)) {
        Fail("sink rejected audio at sample " + std::to_string(audio_pos_));
        return false;
      }
      audio_pos_ += n;
      result_.audio_samples += n;
    }
    return true;
  }

  void MixChunk(int64_t chunk_start, int64_t count) {
    const int64_t chunk_end = chunk_start + count;
    mix_.assign(static_cast<size_t>(count * channels_), 0.0f);

    for (auto& state : placements_) {
      if (state.done || state.start_sample >= chunk_end) {
        continue;
      }
      media::Fragment* fragment = state.placement->fragment;
      if (state.end_sample > chunk_start) {
        const int64_t from = std::max(chunk_start, state.start_sample);
        const int64_t to = std::min(chunk_end, state.end_sample);
        if (!state.cursor) {
          state.cursor = std::make_unique<AudioCursor>(fragment, channels_);
        }
        state.cursor->MixInto(mix_.data() + (from - chunk_start) * channels_, to - from);
      }
      if (state.end_sample <= chunk_end) {
        fragment->Close();
        state.cursor.reset();
        state.done = true;
      }
    }

    audio_frame_.sample_rate = sample_rate_;
    audio_frame_.channels = channels_;
    audio_frame_.nb_samples = static_cast<int>(count);
    audio_frame_.pts_us = chunk_start * 1'000'000 / sample_rate_;
    audio_frame_.data.resize(static_cast<size_t>(count * channels_) * sizeof(int16_t));

    int16_t* out = audio_frame_.MutableSamples();
    for (size_t i = 0; i < mix_.size(); ++i) {
      const float s = std::max(-32768.0f, std::min(32767.0f, mix_[i]));
      out[i] = static_cast<int16_t>(std::lrint(s));
    }
  }

  const timeline::Composition& composition_;
  IRenderSink& sink_;
  const int fps_;
  RenderResult result_;

  std::vector<std::unique_ptr<FillerFrames>> fillers_;

  int sample_rate_ = buffer::kHouseAudioSampleRate;
  int channels_ = buffer::kHouseAudioChannels;
  int64_t total_samples_ = 0;
  int64_t audio_pos_ = 0;
  std::vector<PlacementState> placements_;
  std::vector<float> mix_;
  buffer::AudioFrame audio_frame_;
};

}  // namespace

CompositionRenderer::CompositionRenderer(int fps) : fps_(fps) {}

RenderResult CompositionRenderer::Render(const timeline::Composition& composition,
                                         IRenderSink& sink) {
  if (fps_ <= 0) {
    return RenderResult::Failure("invalid frame rate " + std::to_string(fps_));
  }

  RenderSession session(composition, sink, fps_);
  RenderResult result = session.Run();

  std::ostringstream oss;
  oss << "[CompositionRenderer] " << (result.ok ? "Rendered " : "Render aborted after ")
      << result.video_frames << " video frames, " << result.audio_samples
      << " audio samples, " << result.seams.size() << " seams";
  if (!result.ok) {
    oss << ": " << result.error;
  }
  util::Logger::Debug(oss.str());
  return result;
}

}  // namespace seamline::render
