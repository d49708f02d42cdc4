// Repository: Seamline
// Component: Seamline CLI
// Purpose: Load a recording manifest, fetch its fragments and compile them
//          into one continuous output file.
// Copyright (c) 2025 Seamline Authors
//
// Usage:
//   seamline --manifest recording.json --output out.mp4 \
//     [--workdir DIR] [--max-duration SECONDS] [--verbose]
//
// Exit codes: 0 ok, 1 usage, 2 bad manifest, 3 compile failure.

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "seamline/compile/Compiler.hpp"
#include "seamline/config/CompositionConfig.hpp"
#include "seamline/config/EncodingProfile.hpp"
#include "seamline/decode/FFmpegFragment.hpp"
#include "seamline/encode/MediaWriter.hpp"
#include "seamline/fragments/FragmentFetcher.hpp"
#include "seamline/fragments/FragmentLoader.hpp"
#include "seamline/manifest/RecordingManifest.hpp"
#include "seamline/util/Errors.hpp"
#include "seamline/util/Logger.hpp"
#include "seamline/util/Reporter.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitManifest = 2;
constexpr int kExitCompile = 3;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string manifest_path;
  std::string output_path;
  std::string workdir;          // Empty: <tmp>/seamline-fragments
  std::optional<double> max_duration;
  bool verbose = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Rebuild one continuous video from a recording manifest.\n"
            << "\n"
            << "  --manifest PATH       Recording manifest JSON (required)\n"
            << "  --output PATH         Output media file, container from extension (required)\n"
            << "  --workdir DIR         Where remote fragments are downloaded\n"
            << "                        (default: system temp dir)\n"
            << "  --max-duration SEC    Cut the output to at most SEC seconds\n"
            << "  --verbose             Enable debug logging\n"
            << "  --help                Show this help message\n"
            << "\n"
            << "EXAMPLE:\n"
            << "  " << program_name << " --manifest rec.json --output /tmp/rec.mp4 --max-duration 600\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--manifest" && i + 1 < argc) {
      args.manifest_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      args.output_path = argv[++i];
    } else if (arg == "--workdir" && i + 1 < argc) {
      args.workdir = argv[++i];
    } else if (arg == "--max-duration" && i + 1 < argc) {
      const std::string value = argv[++i];
      char* end = nullptr;
      const double seconds = std::strtod(value.c_str(), &end);
      if (value.empty() || end != value.c_str() + value.size() || !std::isfinite(seconds)) {
        args.error = "--max-duration expects a number of seconds, got '" + value + "'";
        return args;
      }
      args.max_duration = seconds;
    } else if (arg == "--verbose") {
      args.verbose = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.manifest_path.empty() || args.output_path.empty()) {
    args.error = "--manifest and --output are required";
    return args;
  }

  args.valid = true;
  return args;
}

std::string ResolveWorkdir(const CliArgs& args) {
  if (!args.workdir.empty()) {
    return args.workdir;
  }
  std::error_code ec;
  std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    tmp = std::filesystem::path(args.output_path).parent_path();
  }
  return (tmp / "seamline-fragments").string();
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  if (args.verbose) {
    seamline::util::Logger::SetDebugEnabled(true);
  }

  auto manifest = seamline::manifest::RecordingManifest::FromFile(args.manifest_path);
  if (!manifest) {
    seamline::util::Logger::Error("[Seamline] Cannot read manifest: " + args.manifest_path);
    return kExitManifest;
  }

  const seamline::config::CompositionConfig composition_config;
  seamline::util::LoggerReporter reporter;
  seamline::fragments::AvioFragmentFetcher fetcher;
  seamline::decode::FFmpegMediaOpener opener(composition_config.audio_sample_rate,
                                             composition_config.audio_channels);
  seamline::fragments::FragmentLoader loader(fetcher, opener, reporter);

  seamline::fragments::LoadedFragments loaded;
  try {
    loaded = loader.Load(*manifest, ResolveWorkdir(args));
  } catch (const seamline::MissingDurationError& e) {
    seamline::util::Logger::Error(std::string("[Seamline] ") + e.what());
    return kExitManifest;
  }

  const auto profile = seamline::config::EncodingProfile::Default();
  seamline::util::Logger::Debug("[Seamline] Encoding profile: " + profile.ToString());

  seamline::encode::FFmpegMediaWriter writer;
  seamline::compile::Compiler compiler(writer, reporter, composition_config, profile);
  try {
    compiler.Compile(loaded.total_duration, std::move(loaded.video), std::move(loaded.audio),
                     args.output_path, args.max_duration);
  } catch (const seamline::CompileError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitCompile;
  }

  std::cout << args.output_path << "\n";
  return kExitOk;
}
