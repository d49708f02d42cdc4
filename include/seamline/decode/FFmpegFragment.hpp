// Repository: Seamline
// Component: FFmpeg Fragment
// Purpose: Fragment handle backed by an FFmpegDecoder, plus the production
//          IMediaOpener that creates them.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_DECODE_FFMPEG_FRAGMENT_HPP_
#define SEAMLINE_DECODE_FFMPEG_FRAGMENT_HPP_

#include <memory>
#include <string>

#include "seamline/decode/FFmpegDecoder.h"
#include "seamline/fragments/MediaOpener.hpp"
#include "seamline/media/Fragment.hpp"

namespace seamline::decode {

// FFmpegFragment owns an opened decoder. Duration and geometry are captured
// at construction and stay readable after Close().
class FFmpegFragment : public media::Fragment {
 public:
  explicit FFmpegFragment(std::unique_ptr<FFmpegDecoder> decoder);
  ~FFmpegFragment() override;

  media::MediaKind Kind() const override { return kind_; }
  const std::string& Uri() const override { return uri_; }
  double Duration() const override { return duration_; }
  int Width() const override { return width_; }
  int Height() const override { return height_; }
  int SampleRate() const override { return sample_rate_; }

  bool NextVideoFrame(buffer::Frame& out) override;
  bool NextAudioFrame(buffer::AudioFrame& out) override;

  // Reopens the source in audio mode with the same output format.
  std::unique_ptr<media::Fragment> OpenNativeAudio() override;

  void Close() override;
  bool IsClosed() const override { return decoder_ == nullptr; }

 private:
  std::unique_ptr<FFmpegDecoder> decoder_;
  DecoderConfig config_;
  media::MediaKind kind_;
  std::string uri_;
  double duration_ = 0.0;
  int width_ = 0;
  int height_ = 0;
  int sample_rate_ = 0;
};

// Audio handles resample to sample_rate / channels, which must match the
// composite track they feed.
class FFmpegMediaOpener : public fragments::IMediaOpener {
 public:
  explicit FFmpegMediaOpener(int sample_rate = buffer::kHouseAudioSampleRate,
                             int channels = buffer::kHouseAudioChannels);

  fragments::OpenResult OpenAsVideo(const std::string& path) override;
  fragments::OpenResult OpenAsAudio(const std::string& path) override;

 private:
  fragments::OpenResult OpenWithMode(const std::string& path, DecodeMode mode);

  int sample_rate_;
  int channels_;
};

}  // namespace seamline::decode

#endif  // SEAMLINE_DECODE_FFMPEG_FRAGMENT_HPP_
