// Repository: Seamline
// Component: Fragment
// Purpose: Opaque handle to one decodable media fragment plus its placement
//          on the master timeline.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_MEDIA_FRAGMENT_HPP_
#define SEAMLINE_MEDIA_FRAGMENT_HPP_

#include <memory>
#include <string>
#include <vector>

#include "seamline/buffer/Frame.hpp"

namespace seamline::media {

enum class MediaKind {
  kVideo,
  kAudio,
};

inline const char* MediaKindName(MediaKind kind) {
  switch (kind) {
    case MediaKind::kVideo: return "video";
    case MediaKind::kAudio: return "audio";
  }
  return "unknown";
}

// Fragment is a handle to decoded media with a known duration.
//
// Decoding is sequential: NextVideoFrame() / NextAudioFrame() return frames
// in presentation order and false at end of stream or on error. Video
// frames are native size (the encoder scales); audio frames are S16
// interleaved at the rate and channel count the opener was given (house
// format, 44100 Hz stereo, by default).
//
// Close() releases every decoder resource and is idempotent. After Close()
// the Next*() calls return false.
class Fragment {
 public:
  virtual ~Fragment() = default;

  virtual MediaKind Kind() const = 0;
  virtual const std::string& Uri() const = 0;

  // Seconds, >= 0.
  virtual double Duration() const = 0;

  // Video only; 0 for audio fragments.
  virtual int Width() const = 0;
  virtual int Height() const = 0;

  // Native sample rate of the source (audio only; 0 for video fragments).
  virtual int SampleRate() const = 0;

  virtual bool NextVideoFrame(buffer::Frame& out) = 0;
  virtual bool NextAudioFrame(buffer::AudioFrame& out) = 0;

  // Video fragments whose source also carries an audio stream: opens a
  // second, audio-mode handle on the same source. The caller owns and
  // closes it. Returns nullptr when there is no decodable audio, and always
  // for audio fragments.
  virtual std::unique_ptr<Fragment> OpenNativeAudio() = 0;

  virtual void Close() = 0;
  virtual bool IsClosed() const = 0;
};

// "This fragment begins playing at start_time on the master timeline."
struct TimedFragment {
  double start_time = 0.0;
  std::unique_ptr<Fragment> fragment;
};

using TimedFragments = std::vector<TimedFragment>;

}  // namespace seamline::media

#endif  // SEAMLINE_MEDIA_FRAGMENT_HPP_
