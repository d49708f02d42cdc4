// Repository: Seamline
// Component: Fragment Loader Implementation
// Purpose: Fetch, classify and split manifest fragments.
// Copyright (c) 2025 Seamline Authors

#include "seamline/fragments/FragmentLoader.hpp"

#include <sstream>

#include "seamline/fragments/FragmentClassifier.hpp"

namespace seamline::fragments {

namespace {
constexpr const char* kComponent = "FragmentLoader";
}  // namespace

using util::ReportCode;

FragmentLoader::FragmentLoader(IFragmentFetcher& fetcher, IMediaOpener& opener,
                               util::IReporter& reporter)
    : fetcher_(fetcher), opener_(opener), reporter_(reporter) {}

LoadedFragments FragmentLoader::Load(const manifest::RecordingManifest& manifest,
                                     const std::string& dest_dir) {
  LoadedFragments result;
  result.total_duration = manifest.RequireDuration();

  for (const auto& event : manifest.events) {
    if (!event.url) {
      reporter_.Debug(ReportCode::kEventSkippedNoUrl, kComponent,
                      "Event " + std::to_string(event.index) + " has no url, skipped");
      continue;
    }
    const std::string& url = *event.url;

    if (event.relative_time_invalid) {
      reporter_.Warn(ReportCode::kStartTimeInvalid, kComponent,
                     "Event " + std::to_string(event.index) +
                     " has a non-numeric relativeTime, skipped: " + url);
      continue;
    }

    double start_time = event.relative_time;
    if (start_time < 0.0) {
      std::ostringstream oss;
      oss << "Negative relativeTime " << start_time << " clamped to 0: " << url;
      reporter_.Warn(ReportCode::kStartTimeClamped, kComponent, oss.str());
      start_time = 0.0;
    }

    std::optional<std::string> path = fetcher_.Fetch(url, dest_dir);
    if (!path) {
      reporter_.Warn(ReportCode::kFragmentFetchFailed, kComponent, "Failed to download: " + url);
      continue;
    }

    FragmentClassification classified = ClassifyFragment(*path, opener_);
    if (classified.kind != FragmentKind::kVideo) {
      reporter_.Warn(ReportCode::kFragmentVideoDecodeFailed, kComponent,
                     "Failed to load video " + *path + ", trying audio: " +
                     classified.video_error);
    }

    if (classified.kind == FragmentKind::kUnreadable) {
      reporter_.Error(ReportCode::kFragmentUnreadable, kComponent,
                      "Failed to load audio " + *path + ": " + classified.audio_error);
      continue;
    }

    std::ostringstream loaded;
    loaded << "Loaded " << FragmentKindName(classified.kind) << " fragment " << *path
           << " start=" << start_time << "s duration=" << classified.fragment->Duration() << "s";
    reporter_.Debug(ReportCode::kFragmentLoaded, kComponent, loaded.str());

    media::TimedFragment timed{start_time, std::move(classified.fragment)};
    if (classified.kind == FragmentKind::kVideo) {
      result.video.push_back(std::move(timed));
    } else {
      result.audio.push_back(std::move(timed));
    }
  }

  std::ostringstream total;
  total << "Total duration of clips: " << result.total_duration;
  reporter_.Info(ReportCode::kTotalDuration, kComponent, total.str());

  reporter_.Info(ReportCode::kFragmentsLoaded, kComponent,
                 "Loaded " + std::to_string(result.video.size()) + " video clips and " +
                 std::to_string(result.audio.size()) + " audio clips");
  return result;
}

}  // namespace seamline::fragments
