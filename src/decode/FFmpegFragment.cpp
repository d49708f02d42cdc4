// Repository: Seamline
// Component: FFmpeg Fragment Implementation
// Purpose: Decoder-backed fragment handle and opener.
// Copyright (c) 2025 Seamline Authors

#include "seamline/decode/FFmpegFragment.hpp"

#include "seamline/util/Logger.hpp"

namespace seamline::decode {

FFmpegFragment::FFmpegFragment(std::unique_ptr<FFmpegDecoder> decoder)
    : decoder_(std::move(decoder)),
      config_(decoder_->config()),
      kind_(config_.mode == DecodeMode::kVideo ? media::MediaKind::kVideo
                                                          : media::MediaKind::kAudio),
      uri_(config_.input_uri),
      duration_(decoder_->GetDuration()),
      width_(decoder_->GetVideoWidth()),
      height_(decoder_->GetVideoHeight()),
      sample_rate_(decoder_->GetSourceSampleRate()) {}

FFmpegFragment::~FFmpegFragment() {
  Close();
}

bool FFmpegFragment::NextVideoFrame(buffer::Frame& out) {
  if (!decoder_ || kind_ != media::MediaKind::kVideo) {
    return false;
  }
  return decoder_->DecodeFrameToBuffer(out);
}

bool FFmpegFragment::NextAudioFrame(buffer::AudioFrame& out) {
  if (!decoder_ || kind_ != media::MediaKind::kAudio) {
    return false;
  }
  return decoder_->DecodeAudioFrame(out);
}

std::unique_ptr<media::Fragment> FFmpegFragment::OpenNativeAudio() {
  if (kind_ != media::MediaKind::kVideo) {
    return nullptr;
  }
  DecoderConfig config = config_;
  config.mode = DecodeMode::kAudio;

  auto decoder = std::make_unique<FFmpegDecoder>(config);
  if (!decoder->Open()) {
    util::Logger::Debug("[FFmpegFragment] no native audio uri=" + uri_ + ": " +
                        decoder->last_error());
    return nullptr;
  }
  return std::make_unique<FFmpegFragment>(std::move(decoder));
}

void FFmpegFragment::Close() {
  if (decoder_) {
    decoder_->Close();
    decoder_.reset();
  }
}

FFmpegMediaOpener::FFmpegMediaOpener(int sample_rate, int channels)
    : sample_rate_(sample_rate), channels_(channels) {}

fragments::OpenResult FFmpegMediaOpener::OpenAsVideo(const std::string& path) {
  return OpenWithMode(path, DecodeMode::kVideo);
}

fragments::OpenResult FFmpegMediaOpener::OpenAsAudio(const std::string& path) {
  return OpenWithMode(path, DecodeMode::kAudio);
}

fragments::OpenResult FFmpegMediaOpener::OpenWithMode(const std::string& path, DecodeMode mode) {
  DecoderConfig config;
  config.input_uri = path;
  config.mode = mode;
  config.target_sample_rate = sample_rate_;
  config.target_channels = channels_;

  auto decoder = std::make_unique<FFmpegDecoder>(config);
  if (!decoder->Open()) {
    return fragments::OpenResult::Failure(decoder->last_error());
  }
  return fragments::OpenResult::Success(std::make_unique<FFmpegFragment>(std::move(decoder)));
}

}  // namespace seamline::decode
