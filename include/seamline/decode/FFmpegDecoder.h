// Repository: Seamline
// Component: FFmpeg Decoder
// Purpose: Sequential fragment decoding using libavformat/libavcodec.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_DECODE_FFMPEG_DECODER_H_
#define SEAMLINE_DECODE_FFMPEG_DECODER_H_

#include <cstdint>
#include <string>

#include "seamline/buffer/Frame.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;
struct SwrContext;

namespace seamline::decode {

// Which stream the decoder binds to. A decoder decodes exactly one stream;
// packets of every other stream are discarded.
enum class DecodeMode {
  kVideo,
  kAudio,
};

// DecoderConfig holds configuration for FFmpeg-based decoding.
struct DecoderConfig {
  std::string input_uri;        // Local file path
  DecodeMode mode = DecodeMode::kVideo;
  int max_decode_threads = 0;   // 0 = auto

  // Audio output format (house format by default).
  int target_sample_rate = buffer::kHouseAudioSampleRate;
  int target_channels = buffer::kHouseAudioChannels;
};

// FFmpegDecoder decodes one stream of a media file.
//
// Video mode:
// - Requires a video stream (cover-art streams do not count)
// - Frames keep their native size, rounded down to even; pixel format is
//   converted to YUV420P
//
// Audio mode:
// - Requires an audio stream
// - Output resampled to S16 interleaved at target rate/channels
//
// Both modes drain the codec at end of file so no trailing frames are lost.
//
// Lifecycle:
// 1. Construct with config
// 2. Call Open(); on false, last_error() says why
// 3. Call DecodeFrameToBuffer() / DecodeAudioFrame() until false
// 4. Call Close() or rely on destructor
//
// Not thread-safe: use from a single thread.
class FFmpegDecoder {
 public:
  explicit FFmpegDecoder(const DecoderConfig& config);
  ~FFmpegDecoder();

  // Disable copy and move
  FFmpegDecoder(const FFmpegDecoder&) = delete;
  FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

  // Opens the input file and initializes the decoder for the configured mode.
  // Fails when the stream is missing, the codec cannot be opened, or the
  // container reports no positive duration.
  bool Open();

  // Decodes the next video frame. Returns false at EOF or on error.
  bool DecodeFrameToBuffer(buffer::Frame& output_frame);

  // Decodes the next audio frame. Returns false at EOF or on error.
  bool DecodeAudioFrame(buffer::AudioFrame& output_frame);

  // Closes the decoder and releases resources. Safe to call repeatedly.
  void Close();

  bool IsOpen() const { return format_ctx_ != nullptr; }
  bool IsEOF() const { return eof_reached_; }

  // Output frame size (video mode).
  int GetVideoWidth() const { return out_width_; }
  int GetVideoHeight() const { return out_height_; }

  // Native sample rate of the audio stream (audio mode).
  int GetSourceSampleRate() const;

  // Seconds. Container duration, else stream duration, else 0.
  double GetDuration() const;

  const std::string& last_error() const { return last_error_; }
  const DecoderConfig& config() const { return config_; }

 private:
  bool Fail(const std::string& step, int ret = 0);

  bool FindStream();
  bool InitializeCodec();
  // Created on the first decoded frame, from that frame's actual format.
  bool InitializeScaler(const AVFrame* src);
  bool InitializeResampler(const AVFrame* src);

  // Receives one frame from the codec, feeding packets as needed and
  // draining the codec after EOF. Fills frame_.
  bool ReceiveFrame();

  bool ConvertFrame(AVFrame* av_frame, buffer::Frame& output_frame);
  bool ConvertAudioFrame(AVFrame* av_frame, buffer::AudioFrame& output_frame);

  // Emits samples still buffered inside the resampler after EOF.
  bool FlushResampler(buffer::AudioFrame& output_frame);

  DecoderConfig config_;
  std::string last_error_;

  // FFmpeg contexts (opaque pointers)
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVFrame* scaled_frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  ::SwrContext* swr_ctx_ = nullptr;  // Audio resampler (FFmpeg type, global scope)

  int stream_index_ = -1;
  bool demux_eof_ = false;          // av_read_frame hit EOF, codec flush sent
  bool eof_reached_ = false;        // codec fully drained
  bool resampler_flushed_ = false;

  int out_width_ = 0;
  int out_height_ = 0;

  // Timing
  int64_t start_time_ = 0;
  double time_base_ = 0.0;
  int64_t next_audio_pts_us_ = 0;
};

}  // namespace seamline::decode

#endif  // SEAMLINE_DECODE_FFMPEG_DECODER_H_
