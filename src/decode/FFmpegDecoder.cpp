// Repository: Seamline
// Component: FFmpeg Decoder
// Purpose: Sequential fragment decoding using libavformat/libavcodec.
// Copyright (c) 2025 Seamline Authors

#include "seamline/decode/FFmpegDecoder.h"

#include <cstring>

#include "seamline/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace seamline::decode {

namespace {

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

const char* ModeName(DecodeMode mode) {
  return mode == DecodeMode::kVideo ? "video" : "audio";
}

}  // namespace

FFmpegDecoder::FFmpegDecoder(const DecoderConfig& config) : config_(config) {}

FFmpegDecoder::~FFmpegDecoder() {
  Close();
}

bool FFmpegDecoder::Fail(const std::string& step, int ret) {
  last_error_ = step + " failed";
  if (ret < 0) {
    last_error_ += ": " + AvErrorString(ret);
  }
  util::Logger::Debug("[FFmpegDecoder] DECODER_STEP " + step + " FAILED mode=" +
                      ModeName(config_.mode) + " uri=" + config_.input_uri +
                      (ret < 0 ? " err=" + AvErrorString(ret) : std::string()));
  return false;
}

bool FFmpegDecoder::Open() {
  if (IsOpen()) {
    return true;
  }
  last_error_.clear();

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  // avformat_open_input frees the context itself on failure.
  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    format_ctx_ = nullptr;
    return Fail("open_input", ret);
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    Fail("find_stream_info", ret);
    Close();
    return false;
  }

  if (!FindStream()) {
    Fail(std::string("find_") + ModeName(config_.mode) + "_stream (no " +
         ModeName(config_.mode) + " stream)");
    Close();
    return false;
  }

  if (!InitializeCodec()) {
    Close();
    return false;
  }

  if (config_.mode == DecodeMode::kVideo) {
    // YUV420P needs even dimensions.
    out_width_ = codec_ctx_->width & ~1;
    out_height_ = codec_ctx_->height & ~1;
    if (out_width_ <= 0 || out_height_ <= 0) {
      Fail("frame_size (" + std::to_string(codec_ctx_->width) + "x" +
           std::to_string(codec_ctx_->height) + ")");
      Close();
      return false;
    }
  }

  if (GetDuration() <= 0.0) {
    Fail("duration (unknown or zero)");
    Close();
    return false;
  }

  util::Logger::Debug("[FFmpegDecoder] DECODER_STEP open_input OK mode=" +
                      std::string(ModeName(config_.mode)) + " uri=" + config_.input_uri +
                      " duration=" + std::to_string(GetDuration()) + "s");
  return true;
}

void FFmpegDecoder::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }

  if (scaled_frame_) {
    av_frame_free(&scaled_frame_);
  }

  if (frame_) {
    av_frame_free(&frame_);
  }

  if (packet_) {
    av_packet_free(&packet_);
  }

  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }

  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }

  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }

  stream_index_ = -1;
  demux_eof_ = false;
  eof_reached_ = false;
  resampler_flushed_ = false;
  next_audio_pts_us_ = 0;
}

int FFmpegDecoder::GetSourceSampleRate() const {
  if (!codec_ctx_ || config_.mode != DecodeMode::kAudio) return 0;
  return codec_ctx_->sample_rate;
}

double FFmpegDecoder::GetDuration() const {
  if (!format_ctx_) return 0.0;

  if (format_ctx_->duration != AV_NOPTS_VALUE && format_ctx_->duration > 0) {
    return static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
  }

  if (stream_index_ >= 0) {
    AVStream* stream = format_ctx_->streams[stream_index_];
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
      return static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    }
  }

  return 0.0;
}

bool FFmpegDecoder::FindStream() {
  const AVMediaType wanted =
      config_.mode == DecodeMode::kVideo ? AVMEDIA_TYPE_VIDEO : AVMEDIA_TYPE_AUDIO;

  for (unsigned int i = 0; i < format_ctx_->nb_streams; i++) {
    AVStream* stream = format_ctx_->streams[i];
    if (stream->codecpar->codec_type != wanted) {
      continue;
    }
    // Embedded cover art is a still image, not a video track.
    if (wanted == AVMEDIA_TYPE_VIDEO && (stream->disposition & AV_DISPOSITION_ATTACHED_PIC)) {
      continue;
    }
    stream_index_ = static_cast<int>(i);
    time_base_ = av_q2d(stream->time_base);
    start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
    return true;
  }

  return false;
}

bool FFmpegDecoder::InitializeCodec() {
  AVStream* stream = format_ctx_->streams[stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    return Fail("find_decoder (codec " + std::string(avcodec_get_name(codecpar->codec_id)) + ")");
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    return Fail("alloc_codec_context");
  }

  int ret = avcodec_parameters_to_context(codec_ctx_, codecpar);
  if (ret < 0) {
    return Fail("parameters_to_context", ret);
  }

  if (config_.max_decode_threads > 0) {
    codec_ctx_->thread_count = config_.max_decode_threads;
  }
  if (config_.mode == DecodeMode::kVideo) {
    codec_ctx_->thread_type = FF_THREAD_FRAME;
  }

  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    return Fail("open_codec", ret);
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    return Fail("alloc_frame");
  }

  return true;
}

bool FFmpegDecoder::InitializeScaler(const AVFrame* src) {
  // Reuses the context while the source geometry is unchanged.
  sws_ctx_ = sws_getCachedContext(
      sws_ctx_,
      src->width, src->height, static_cast<AVPixelFormat>(src->format),
      out_width_, out_height_, AV_PIX_FMT_YUV420P,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    return Fail("initialize_scaler");
  }

  if (!scaled_frame_) {
    scaled_frame_ = av_frame_alloc();
    if (!scaled_frame_) {
      return Fail("alloc_scaled_frame");
    }
    scaled_frame_->width = out_width_;
    scaled_frame_->height = out_height_;
    scaled_frame_->format = AV_PIX_FMT_YUV420P;
    int ret = av_frame_get_buffer(scaled_frame_, 32);
    if (ret < 0) {
      av_frame_free(&scaled_frame_);
      return Fail("alloc_scaled_buffer", ret);
    }
  }
  return true;
}

bool FFmpegDecoder::InitializeResampler(const AVFrame* src) {
  AVChannelLayout src_ch_layout{};
  AVChannelLayout dst_ch_layout{};

  int src_channels = src->ch_layout.nb_channels > 0 ? src->ch_layout.nb_channels
                                                    : codec_ctx_->ch_layout.nb_channels;
  if (src_channels <= 0) {
    return Fail("initialize_resampler (no channels)");
  }

  // Streams without a declared layout get the default one for their count.
  if (src->ch_layout.nb_channels > 0 && src->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC) {
    if (av_channel_layout_copy(&src_ch_layout, &src->ch_layout) < 0) {
      return Fail("initialize_resampler (copy layout)");
    }
  } else {
    av_channel_layout_default(&src_ch_layout, src_channels);
  }
  av_channel_layout_default(&dst_ch_layout, config_.target_channels);

  int ret = swr_alloc_set_opts2(&swr_ctx_,
                                &dst_ch_layout, AV_SAMPLE_FMT_S16, config_.target_sample_rate,
                                &src_ch_layout, static_cast<AVSampleFormat>(src->format),
                                src->sample_rate,
                                0, nullptr);

  // swr_alloc_set_opts2 copies the layouts
  av_channel_layout_uninit(&src_ch_layout);
  av_channel_layout_uninit(&dst_ch_layout);

  if (ret < 0) {
    return Fail("initialize_resampler", ret);
  }

  ret = swr_init(swr_ctx_);
  if (ret < 0) {
    swr_free(&swr_ctx_);
    return Fail("initialize_resampler", ret);
  }
  return true;
}

bool FFmpegDecoder::ReceiveFrame() {
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == 0) {
      return true;
    }
    if (ret == AVERROR_EOF) {
      eof_reached_ = true;
      return false;
    }
    if (ret != AVERROR(EAGAIN)) {
      Fail("receive_frame", ret);
      eof_reached_ = true;
      return false;
    }

    // Codec needs input.
    if (demux_eof_) {
      eof_reached_ = true;
      return false;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret < 0) {
      // EOF or read error: drain whatever the codec still holds.
      if (ret != AVERROR_EOF) {
        util::Logger::Debug("[FFmpegDecoder] read_frame ended early uri=" + config_.input_uri +
                            " err=" + AvErrorString(ret));
      }
      demux_eof_ = true;
      avcodec_send_packet(codec_ctx_, nullptr);
      continue;
    }

    if (packet_->stream_index != stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      // Corrupt packet: skip it, keep decoding.
      util::Logger::Debug("[FFmpegDecoder] send_packet rejected uri=" + config_.input_uri +
                          " err=" + AvErrorString(ret));
    }
  }
}

bool FFmpegDecoder::DecodeFrameToBuffer(buffer::Frame& output_frame) {
  if (!IsOpen() || config_.mode != DecodeMode::kVideo || eof_reached_) {
    return false;
  }
  if (!ReceiveFrame()) {
    return false;
  }
  bool ok = ConvertFrame(frame_, output_frame);
  av_frame_unref(frame_);
  return ok;
}

bool FFmpegDecoder::ConvertFrame(AVFrame* av_frame, buffer::Frame& output_frame) {
  if (!InitializeScaler(av_frame)) {
    return false;
  }

  sws_scale(sws_ctx_,
            av_frame->data, av_frame->linesize, 0, av_frame->height,
            scaled_frame_->data, scaled_frame_->linesize);

  output_frame.width = out_width_;
  output_frame.height = out_height_;

  int64_t pts = av_frame->best_effort_timestamp != AV_NOPTS_VALUE
      ? av_frame->best_effort_timestamp : av_frame->pts;
  output_frame.metadata.pts = (pts != AV_NOPTS_VALUE)
      ? static_cast<int64_t>((pts - start_time_) * time_base_ * 1'000'000.0)
      : 0;
  output_frame.metadata.dts = av_frame->pkt_dts;
  output_frame.metadata.duration = static_cast<double>(av_frame->duration) * time_base_;
  output_frame.metadata.asset_uri = config_.input_uri;

  // Copy YUV420 planes, dropping the scaler's line padding.
  const size_t y_size = output_frame.YSize();
  const size_t uv_size = output_frame.UVSize();
  output_frame.data.resize(output_frame.ExpectedSize());

  uint8_t* dst = output_frame.data.data();
  for (int y = 0; y < out_height_; y++) {
    std::memcpy(dst + static_cast<size_t>(y) * out_width_,
                scaled_frame_->data[0] + y * scaled_frame_->linesize[0],
                out_width_);
  }

  const int half_w = out_width_ / 2;
  const int half_h = out_height_ / 2;
  dst += y_size;
  for (int y = 0; y < half_h; y++) {
    std::memcpy(dst + static_cast<size_t>(y) * half_w,
                scaled_frame_->data[1] + y * scaled_frame_->linesize[1],
                half_w);
  }

  dst += uv_size;
  for (int y = 0; y < half_h; y++) {
    std::memcpy(dst + static_cast<size_t>(y) * half_w,
                scaled_frame_->data[2] + y * scaled_frame_->linesize[2],
                half_w);
  }

  return true;
}

bool FFmpegDecoder::DecodeAudioFrame(buffer::AudioFrame& output_frame) {
  if (!IsOpen() || config_.mode != DecodeMode::kAudio) {
    return false;
  }

  while (!eof_reached_) {
    if (!ReceiveFrame()) {
      break;
    }
    bool ok = ConvertAudioFrame(frame_, output_frame);
    av_frame_unref(frame_);
    if (!ok) {
      return false;
    }
    // The resampler may buffer an entire input frame before emitting.
    if (output_frame.nb_samples > 0) {
      return true;
    }
  }

  return FlushResampler(output_frame);
}

bool FFmpegDecoder::ConvertAudioFrame(AVFrame* av_frame, buffer::AudioFrame& output_frame) {
  if (!swr_ctx_ && !InitializeResampler(av_frame)) {
    return false;
  }

  const int out_rate = config_.target_sample_rate;
  const int out_channels = config_.target_channels;
  const int out_sample_size = av_get_bytes_per_sample(AV_SAMPLE_FMT_S16);

  int64_t delay = swr_get_delay(swr_ctx_, av_frame->sample_rate);
  int64_t out_samples = av_rescale_rnd(delay + av_frame->nb_samples,
                                       out_rate, av_frame->sample_rate,
                                       AV_ROUND_UP);

  output_frame.data.resize(static_cast<size_t>(out_samples) * out_channels * out_sample_size);
  uint8_t* out_data[1] = { output_frame.data.data() };

  int samples_converted = swr_convert(swr_ctx_,
                                      out_data, static_cast<int>(out_samples),
                                      const_cast<const uint8_t**>(av_frame->extended_data),
                                      av_frame->nb_samples);
  if (samples_converted < 0) {
    return Fail("resample", samples_converted);
  }

  output_frame.sample_rate = out_rate;
  output_frame.channels = out_channels;
  output_frame.nb_samples = samples_converted;
  output_frame.pts_us = next_audio_pts_us_;
  output_frame.data.resize(static_cast<size_t>(samples_converted) * out_channels * out_sample_size);

  next_audio_pts_us_ += av_rescale(samples_converted, 1'000'000, out_rate);
  return true;
}

bool FFmpegDecoder::FlushResampler(buffer::AudioFrame& output_frame) {
  if (resampler_flushed_ || !swr_ctx_) {
    return false;
  }
  resampler_flushed_ = true;

  const int out_rate = config_.target_sample_rate;
  const int out_channels = config_.target_channels;
  const int out_sample_size = av_get_bytes_per_sample(AV_SAMPLE_FMT_S16);

  int64_t pending = swr_get_delay(swr_ctx_, out_rate) + 32;
  output_frame.data.resize(static_cast<size_t>(pending) * out_channels * out_sample_size);
  uint8_t* out_data[1] = { output_frame.data.data() };

  int samples_converted = swr_convert(swr_ctx_, out_data, static_cast<int>(pending), nullptr, 0);
  if (samples_converted <= 0) {
    output_frame.data.clear();
    output_frame.nb_samples = 0;
    return false;
  }

  output_frame.sample_rate = out_rate;
  output_frame.channels = out_channels;
  output_frame.nb_samples = samples_converted;
  output_frame.pts_us = next_audio_pts_us_;
  output_frame.data.resize(static_cast<size_t>(samples_converted) * out_channels * out_sample_size);
  next_audio_pts_us_ += av_rescale(samples_converted, 1'000'000, out_rate);
  return true;
}

}  // namespace seamline::decode
