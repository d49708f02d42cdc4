// Repository: Seamline
// Component: Encoder Pipeline
// Purpose: Owns FFmpeg encoder/muxer handles and manages the file encoding
//          lifecycle (H.264 video, AAC audio).
// Copyright (c) 2025 Seamline Authors

#include "seamline/encode/EncoderPipeline.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

#include "seamline/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace seamline::encode {

namespace {

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return errbuf;
}

// AAC reports 1024; encoders with variable frame size report 0.
constexpr int kDefaultAudioFrameSize = 1024;

}  // namespace

EncoderPipeline::EncoderPipeline(const config::EncodingProfile& profile)
    : profile_(profile) {}

EncoderPipeline::~EncoderPipeline() {
  close();
}

bool EncoderPipeline::Fail(const std::string& what, int ret) {
  last_error_ = what;
  if (ret < 0) {
    last_error_ += ": " + AvErrorString(ret);
  }
  util::Logger::Error("[EncoderPipeline] " + last_error_);
  return false;
}

bool EncoderPipeline::open(const EncoderPipelineConfig& config) {
  if (initialized_) {
    return true;  // Already initialized
  }
  last_error_.clear();
  config_ = config;
  video_frames_encoded_ = 0;
  audio_samples_encoded_ = 0;

  if (config_.width <= 0 || config_.height <= 0 ||
      config_.width % 2 != 0 || config_.height % 2 != 0) {
    return Fail("invalid output frame size " + std::to_string(config_.width) + "x" +
                std::to_string(config_.height));
  }
  if (profile_.fps <= 0) {
    return Fail("invalid frame rate " + std::to_string(profile_.fps));
  }

  av_log_set_level(AV_LOG_ERROR);

  // Container from the file extension; unknown extensions get MP4.
  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, nullptr,
                                           config_.output_path.c_str());
  if (ret < 0 || !format_ctx_) {
    format_ctx_ = nullptr;
    ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "mp4",
                                         config_.output_path.c_str());
    if (ret < 0 || !format_ctx_) {
      format_ctx_ = nullptr;
      return Fail("Failed to allocate output context", ret);
    }
  }

  if (!OpenVideoEncoder() || (config_.audio_enabled && !OpenAudioEncoder())) {
    ReleaseAll();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    ReleaseAll();
    return Fail("Failed to allocate packet");
  }

  if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&format_ctx_->pb, config_.output_path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      Fail("Failed to open output " + config_.output_path, ret);
      ReleaseAll();
      return false;
    }
  }

  ret = avformat_write_header(format_ctx_, nullptr);
  if (ret < 0) {
    Fail("Failed to write header", ret);
    ReleaseAll();
    return false;
  }
  header_written_ = true;
  initialized_ = true;

  std::ostringstream oss;
  oss << "[EncoderPipeline] open: " << config_.output_path
      << " format=" << format_ctx_->oformat->name
      << " " << config_.width << "x" << config_.height
      << " audio=" << (audio_stream_ ? "yes" : "no")
      << " " << profile_.ToString();
  util::Logger::Debug(oss.str());
  return true;
}

bool EncoderPipeline::OpenVideoEncoder() {
  const AVCodec* codec = avcodec_find_encoder_by_name(profile_.video_codec.c_str());
  if (!codec) {
    return Fail(profile_.video_codec + " encoder not found");
  }

  video_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!video_stream_) {
    return Fail("Failed to create video stream");
  }
  video_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    return Fail("Failed to allocate codec context");
  }

  codec_ctx_->width = config_.width;
  codec_ctx_->height = config_.height;
  codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  codec_ctx_->bit_rate = profile_.video_bitrate;
  codec_ctx_->time_base = AVRational{1, profile_.fps};
  codec_ctx_->framerate = AVRational{profile_.fps, 1};
  codec_ctx_->thread_count = profile_.threads;
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  AVDictionary* opts = nullptr;
  av_dict_set(&opts, "preset", profile_.preset.c_str(), 0);
  int ret = avcodec_open2(codec_ctx_, codec, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    return Fail("Failed to open " + profile_.video_codec, ret);
  }

  // After avcodec_open2 so extradata (SPS/PPS) reaches the container.
  ret = avcodec_parameters_from_context(video_stream_->codecpar, codec_ctx_);
  if (ret < 0) {
    return Fail("Failed to copy codec parameters", ret);
  }
  video_stream_->time_base = codec_ctx_->time_base;

  frame_ = av_frame_alloc();
  if (!frame_) {
    return Fail("Failed to allocate frame");
  }
  frame_->format = AV_PIX_FMT_YUV420P;
  frame_->width = config_.width;
  frame_->height = config_.height;
  ret = av_frame_get_buffer(frame_, 0);
  if (ret < 0) {
    return Fail("Failed to allocate frame buffer", ret);
  }
  return true;
}

bool EncoderPipeline::OpenAudioEncoder() {
  const AVCodec* codec = avcodec_find_encoder_by_name(profile_.audio_codec.c_str());
  if (!codec) {
    return Fail(profile_.audio_codec + " encoder not found");
  }

  audio_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!audio_stream_) {
    return Fail("Failed to create audio stream");
  }
  audio_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  audio_codec_ctx_ = avcodec_alloc_context3(codec);
  if (!audio_codec_ctx_) {
    return Fail("Failed to allocate audio codec context");
  }

  audio_codec_ctx_->sample_fmt = AV_SAMPLE_FMT_FLTP;  // AAC native format
  if (codec->sample_fmts) {
    audio_codec_ctx_->sample_fmt = codec->sample_fmts[0];
  }
  audio_codec_ctx_->sample_rate = config_.audio_sample_rate;
  av_channel_layout_default(&audio_codec_ctx_->ch_layout, config_.audio_channels);
  audio_codec_ctx_->bit_rate = profile_.audio_bitrate;
  audio_codec_ctx_->time_base = AVRational{1, config_.audio_sample_rate};
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    audio_codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  int ret = avcodec_open2(audio_codec_ctx_, codec, nullptr);
  if (ret < 0) {
    return Fail("Failed to open " + profile_.audio_codec, ret);
  }

  ret = avcodec_parameters_from_context(audio_stream_->codecpar, audio_codec_ctx_);
  if (ret < 0) {
    return Fail("Failed to copy audio codec parameters", ret);
  }
  audio_stream_->time_base = audio_codec_ctx_->time_base;

  audio_frame_size_ = audio_codec_ctx_->frame_size > 0 ? audio_codec_ctx_->frame_size
                                                       : kDefaultAudioFrameSize;

  audio_frame_ = av_frame_alloc();
  if (!audio_frame_) {
    return Fail("Failed to allocate audio frame");
  }
  audio_frame_->format = audio_codec_ctx_->sample_fmt;
  audio_frame_->sample_rate = audio_codec_ctx_->sample_rate;
  audio_frame_->nb_samples = audio_frame_size_;
  ret = av_channel_layout_copy(&audio_frame_->ch_layout, &audio_codec_ctx_->ch_layout);
  if (ret < 0) {
    return Fail("Failed to set audio frame layout", ret);
  }
  ret = av_frame_get_buffer(audio_frame_, 0);
  if (ret < 0) {
    return Fail("Failed to allocate audio frame buffer", ret);
  }

  // Same rate and layout on both sides: only the sample format changes.
  ret = swr_alloc_set_opts2(&swr_ctx_,
                            &audio_codec_ctx_->ch_layout, audio_codec_ctx_->sample_fmt,
                            audio_codec_ctx_->sample_rate,
                            &audio_codec_ctx_->ch_layout, AV_SAMPLE_FMT_S16,
                            audio_codec_ctx_->sample_rate,
                            0, nullptr);
  if (ret < 0 || (ret = swr_init(swr_ctx_)) < 0) {
    return Fail("Failed to initialize audio converter", ret);
  }

  audio_fifo_ = av_audio_fifo_alloc(AV_SAMPLE_FMT_S16, config_.audio_channels,
                                    audio_frame_size_ * 4);
  if (!audio_fifo_) {
    return Fail("Failed to allocate audio queue");
  }
  audio_staging_.resize(static_cast<size_t>(audio_frame_size_) * config_.audio_channels *
                        sizeof(int16_t));
  return true;
}

bool EncoderPipeline::encodeFrame(const buffer::Frame& frame, int64_t frame_index) {
  if (!initialized_) {
    return Fail("encodeFrame called before open");
  }
  if (frame.width <= 0 || frame.height <= 0 || frame.data.size() < frame.ExpectedSize()) {
    return Fail("invalid input frame " + std::to_string(frame.width) + "x" +
                std::to_string(frame.height));
  }

  // The encoder may still reference the previous buffer.
  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    return Fail("av_frame_make_writable failed", ret);
  }

  const size_t y_size = frame.YSize();
  const size_t uv_size = frame.UVSize();
  const int uv_w = frame.width / 2;
  const int uv_h = frame.height / 2;

  if (frame.width != config_.width || frame.height != config_.height) {
    sws_ctx_ = sws_getCachedContext(
        sws_ctx_,
        frame.width, frame.height, AV_PIX_FMT_YUV420P,
        config_.width, config_.height, AV_PIX_FMT_YUV420P,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!sws_ctx_) {
      return Fail("Failed to create scaler for " + std::to_string(frame.width) + "x" +
                  std::to_string(frame.height));
    }
    const uint8_t* src[3] = {
        frame.data.data(),
        frame.data.data() + y_size,
        frame.data.data() + y_size + uv_size
    };
    int src_stride[3] = { frame.width, uv_w, uv_w };
    sws_scale(sws_ctx_, src, src_stride, 0, frame.height, frame_->data, frame_->linesize);
  } else {
    const uint8_t* y_plane = frame.data.data();
    for (int y = 0; y < frame.height; ++y) {
      std::memcpy(frame_->data[0] + y * frame_->linesize[0], y_plane + y * frame.width,
                  static_cast<size_t>(frame.width));
    }
    const uint8_t* u_plane = frame.data.data() + y_size;
    for (int y = 0; y < uv_h; ++y) {
      std::memcpy(frame_->data[1] + y * frame_->linesize[1], u_plane + y * uv_w,
                  static_cast<size_t>(uv_w));
    }
    const uint8_t* v_plane = frame.data.data() + y_size + uv_size;
    for (int y = 0; y < uv_h; ++y) {
      std::memcpy(frame_->data[2] + y * frame_->linesize[2], v_plane + y * uv_w,
                  static_cast<size_t>(uv_w));
    }
  }

  // CFR: one tick of 1/fps per output frame.
  frame_->pts = frame_index;
  frame_->pict_type = AV_PICTURE_TYPE_NONE;

  if (!SendAndDrain(codec_ctx_, video_stream_, frame_)) {
    return false;
  }
  ++video_frames_encoded_;
  return true;
}

bool EncoderPipeline::encodeAudioFrame(const buffer::AudioFrame& audio_frame) {
  if (!initialized_) {
    return Fail("encodeAudioFrame called before open");
  }
  if (!audio_codec_ctx_) {
    return Fail("audio frame received but audio is disabled");
  }
  if (audio_frame.sample_rate != config_.audio_sample_rate ||
      audio_frame.channels != config_.audio_channels) {
    return Fail("unexpected audio format " + std::to_string(audio_frame.sample_rate) + "Hz/" +
                std::to_string(audio_frame.channels) + "ch");
  }
  if (audio_frame.nb_samples <= 0) {
    return true;
  }
  const size_t needed = static_cast<size_t>(audio_frame.nb_samples) * audio_frame.channels *
                        sizeof(int16_t);
  if (audio_frame.data.size() < needed) {
    return Fail("audio frame shorter than nb_samples");
  }

  void* in[1] = { const_cast<uint8_t*>(audio_frame.data.data()) };
  int written = av_audio_fifo_write(audio_fifo_, in, audio_frame.nb_samples);
  if (written < audio_frame.nb_samples) {
    return Fail("Failed to queue audio samples", written);
  }

  while (av_audio_fifo_size(audio_fifo_) >= audio_frame_size_) {
    if (!EncodeQueuedAudio(audio_frame_size_)) {
      return false;
    }
  }
  return true;
}

bool EncoderPipeline::EncodeQueuedAudio(int nb_samples) {
  void* staging[1] = { audio_staging_.data() };
  int got = av_audio_fifo_read(audio_fifo_, staging, nb_samples);
  if (got < nb_samples) {
    return Fail("Failed to dequeue audio samples", got);
  }

  // make_writable reallocates at the frame's current nb_samples.
  audio_frame_->nb_samples = audio_frame_size_;
  int ret = av_frame_make_writable(audio_frame_);
  if (ret < 0) {
    return Fail("av_frame_make_writable failed (audio)", ret);
  }

  const uint8_t* in[1] = { audio_staging_.data() };
  int converted = swr_convert(swr_ctx_, audio_frame_->extended_data, nb_samples,
                              in, nb_samples);
  if (converted < 0) {
    return Fail("Audio conversion failed", converted);
  }

  audio_frame_->nb_samples = converted;
  audio_frame_->pts = audio_samples_encoded_;
  if (!SendAndDrain(audio_codec_ctx_, audio_stream_, audio_frame_)) {
    return false;
  }
  audio_samples_encoded_ += converted;
  return true;
}

bool EncoderPipeline::SendAndDrain(AVCodecContext* ctx, AVStream* stream, AVFrame* frame) {
  int ret = avcodec_send_frame(ctx, frame);
  if (ret < 0 && !(frame == nullptr && ret == AVERROR_EOF)) {
    return Fail("Error sending frame to encoder", ret);
  }

  while (true) {
    ret = avcodec_receive_packet(ctx, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return true;
    }
    if (ret < 0) {
      return Fail("Error receiving packet from encoder", ret);
    }
    packet_->stream_index = stream->index;
    av_packet_rescale_ts(packet_, ctx->time_base, stream->time_base);
    // av_interleaved_write_frame takes ownership and unrefs the packet.
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    if (ret < 0) {
      return Fail("Error writing packet", ret);
    }
  }
}

bool EncoderPipeline::close() {
  if (!initialized_) {
    return true;
  }
  // Idempotent: prevent double-close (e.g. from destructor) from re-running teardown.
  initialized_ = false;

  bool ok = true;
  if (audio_codec_ctx_) {
    int remaining = av_audio_fifo_size(audio_fifo_);
    while (ok && remaining > 0) {
      int n = std::min(remaining, audio_frame_size_);
      ok = EncodeQueuedAudio(n);
      remaining -= n;
    }
    ok = SendAndDrain(audio_codec_ctx_, audio_stream_, nullptr) && ok;
  }
  if (codec_ctx_) {
    ok = SendAndDrain(codec_ctx_, video_stream_, nullptr) && ok;
  }

  if (header_written_) {
    int ret = av_write_trailer(format_ctx_);
    if (ret < 0) {
      ok = Fail("Error writing trailer", ret);
    }
  }

  std::ostringstream oss;
  oss << "[EncoderPipeline] close: " << config_.output_path
      << " video_frames=" << video_frames_encoded_
      << " audio_samples=" << audio_samples_encoded_
      << (ok ? "" : " (with errors)");
  util::Logger::Debug(oss.str());

  ReleaseAll();
  return ok;
}

void EncoderPipeline::ReleaseAll() {
  if (format_ctx_ && format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    avio_closep(&format_ctx_->pb);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (audio_frame_) {
    av_frame_free(&audio_frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (audio_codec_ctx_) {
    avcodec_free_context(&audio_codec_ctx_);
  }
  if (format_ctx_) {
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  video_stream_ = nullptr;  // Owned by format_ctx_
  audio_stream_ = nullptr;

  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
  if (audio_fifo_) {
    av_audio_fifo_free(audio_fifo_);
    audio_fifo_ = nullptr;
  }
  audio_staging_.clear();
  audio_frame_size_ = 0;
  header_written_ = false;
  initialized_ = false;
}

}  // namespace seamline::encode
