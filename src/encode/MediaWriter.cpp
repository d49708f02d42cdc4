// Repository: Seamline
// Component: Media Writer Implementation
// Purpose: Render a composition through the encoder pipeline.
// Copyright (c) 2025 Seamline Authors

#include "seamline/encode/MediaWriter.hpp"

#include <filesystem>
#include <system_error>

#include "seamline/encode/EncoderPipeline.hpp"
#include "seamline/render/CompositionRenderer.hpp"

namespace seamline::encode {

namespace {

void RemovePartialOutput(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

WriteResult FFmpegMediaWriter::WriteFile(const timeline::Composition& composition,
                                         const std::string& output_path,
                                         const config::EncodingProfile& profile) {
  EncoderPipelineConfig config;
  config.output_path = output_path;
  config.width = composition.video.width;
  config.height = composition.video.height;
  config.audio_enabled = composition.audio.has_value();
  if (composition.audio) {
    config.audio_sample_rate = composition.audio->sample_rate;
    config.audio_channels = composition.audio->channels;
  }

  EncoderPipeline pipeline(profile);
  if (!pipeline.open(config)) {
    return WriteResult::Failure(pipeline.last_error());
  }

  render::CompositionRenderer renderer(profile.fps);
  render::RenderResult rendered = renderer.Render(composition, pipeline);
  if (!rendered.ok) {
    std::string error = pipeline.last_error().empty() ? rendered.error
                                                      : rendered.error + ": " + pipeline.last_error();
    // Render error wins over a close failure.
    (void)pipeline.close();
    RemovePartialOutput(output_path);
    return WriteResult::Failure(error);
  }

  if (!pipeline.close()) {
    RemovePartialOutput(output_path);
    return WriteResult::Failure(pipeline.last_error());
  }
  return WriteResult::Success();
}

}  // namespace seamline::encode
