// Repository: Seamline
// Component: Media Writer
// Purpose: Encoder/writer boundary. Encodes a composition into a file.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_ENCODE_MEDIA_WRITER_HPP_
#define SEAMLINE_ENCODE_MEDIA_WRITER_HPP_

#include <string>

#include "seamline/config/EncodingProfile.hpp"
#include "seamline/timeline/TimelineTypes.hpp"

namespace seamline::encode {

struct WriteResult {
  bool ok = false;
  std::string error;

  static WriteResult Success() {
    WriteResult r;
    r.ok = true;
    return r;
  }
  static WriteResult Failure(std::string err) {
    WriteResult r;
    r.error = std::move(err);
    return r;
  }
};

class IMediaWriter {
 public:
  virtual ~IMediaWriter() = default;

  // Writes composition.Duration() seconds of output. Fragment handles in the
  // composition may be consumed (decoded to the end, or closed).
  virtual WriteResult WriteFile(const timeline::Composition& composition,
                                const std::string& output_path,
                                const config::EncodingProfile& profile) = 0;
};

// Production writer: CompositionRenderer into an EncoderPipeline. The output
// file is removed when writing fails.
class FFmpegMediaWriter : public IMediaWriter {
 public:
  WriteResult WriteFile(const timeline::Composition& composition,
                        const std::string& output_path,
                        const config::EncodingProfile& profile) override;
};

}  // namespace seamline::encode

#endif  // SEAMLINE_ENCODE_MEDIA_WRITER_HPP_
