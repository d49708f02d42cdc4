// Repository: Seamline
// Component: Encoder Pipeline
// Purpose: Owns FFmpeg encoder/muxer handles and manages the file encoding
//          lifecycle (H.264 video, AAC audio).
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_ENCODE_ENCODER_PIPELINE_HPP_
#define SEAMLINE_ENCODE_ENCODER_PIPELINE_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "seamline/buffer/Frame.hpp"
#include "seamline/config/EncodingProfile.hpp"
#include "seamline/render/RenderSink.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVCodecContext;
struct AVFormatContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct AVAudioFifo;
struct SwsContext;
struct SwrContext;

namespace seamline::encode {

// Per-file output parameters. The encoder constants come from the
// EncodingProfile.
struct EncoderPipelineConfig {
  std::string output_path;      // Container chosen from the extension (mp4 fallback)
  int width = 0;                // Output frame size, fixed for the whole file
  int height = 0;
  bool audio_enabled = true;
  int audio_sample_rate = buffer::kHouseAudioSampleRate;
  int audio_channels = buffer::kHouseAudioChannels;
};

// EncoderPipeline owns FFmpeg encoder and muxer handles.
// It opens both encoders and writes the container header in open(),
// encodes frames as they are consumed, and flushes + writes the trailer
// in close().
//
// Video frames of any size are scaled to the configured size. Audio input
// (S16 interleaved) is queued and handed to the encoder in exactly
// frame_size chunks; the remainder goes out as a short final frame.
class EncoderPipeline : public render::IRenderSink {
 public:
  explicit EncoderPipeline(const config::EncodingProfile& profile);
  ~EncoderPipeline() override;

  // Disable copy and move
  EncoderPipeline(const EncoderPipeline&) = delete;
  EncoderPipeline& operator=(const EncoderPipeline&) = delete;
  EncoderPipeline(EncoderPipeline&&) = delete;
  EncoderPipeline& operator=(EncoderPipeline&&) = delete;

  // Initialize encoders and muxer, open the output file, write the header.
  // Returns true on success; on failure last_error() says why and no
  // resources are held.
  bool open(const EncoderPipelineConfig& config);

  // Encode a video frame. pts = frame_index in 1/fps units.
  bool encodeFrame(const buffer::Frame& frame, int64_t frame_index);

  // Queue audio samples and encode every complete encoder frame.
  bool encodeAudioFrame(const buffer::AudioFrame& audio_frame);

  // Flush queued audio and both encoders, write the trailer, release
  // everything. Safe to call multiple times; only the first call after a
  // successful open() does work. Returns false if flushing or the trailer
  // failed.
  bool close();

  bool IsInitialized() const { return initialized_; }

  // render::IRenderSink
  bool ConsumeVideo(const buffer::Frame& frame, int64_t frame_index) override {
    return encodeFrame(frame, frame_index);
  }
  bool ConsumeAudio(const buffer::AudioFrame& frame) override {
    return encodeAudioFrame(frame);
  }

  const std::string& last_error() const { return last_error_; }
  int64_t video_frames_encoded() const { return video_frames_encoded_; }
  int64_t audio_samples_encoded() const { return audio_samples_encoded_; }

 private:
  bool Fail(const std::string& what, int ret = 0);
  bool OpenVideoEncoder();
  bool OpenAudioEncoder();

  // Encode frame_size samples from the FIFO (or fewer when flushing).
  bool EncodeQueuedAudio(int nb_samples);

  // Send a frame (nullptr = flush) and write every packet produced.
  bool SendAndDrain(AVCodecContext* ctx, AVStream* stream, AVFrame* frame);

  void ReleaseAll();

  config::EncodingProfile profile_;
  EncoderPipelineConfig config_;
  std::string last_error_;
  bool initialized_ = false;
  bool header_written_ = false;

  AVFormatContext* format_ctx_ = nullptr;

  // Video
  AVCodecContext* codec_ctx_ = nullptr;
  AVStream* video_stream_ = nullptr;
  AVFrame* frame_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  // Audio
  AVCodecContext* audio_codec_ctx_ = nullptr;
  AVStream* audio_stream_ = nullptr;
  AVFrame* audio_frame_ = nullptr;
  ::SwrContext* swr_ctx_ = nullptr;      // S16 interleaved -> encoder sample format
  AVAudioFifo* audio_fifo_ = nullptr;    // S16 interleaved queue
  std::vector<uint8_t> audio_staging_;   // One encoder frame of S16 samples
  int audio_frame_size_ = 0;

  AVPacket* packet_ = nullptr;

  int64_t video_frames_encoded_ = 0;
  int64_t audio_samples_encoded_ = 0;
};

}  // namespace seamline::encode

#endif  // SEAMLINE_ENCODE_ENCODER_PIPELINE_HPP_
