// Repository: Seamline
// Component: Fragment Loader
// Purpose: Turns a recording manifest into (start_time, fragment) pairs split
//          by kind. Per-fragment failures are reported and skipped.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_FRAGMENTS_FRAGMENT_LOADER_HPP_
#define SEAMLINE_FRAGMENTS_FRAGMENT_LOADER_HPP_

#include <string>

#include "seamline/fragments/FragmentFetcher.hpp"
#include "seamline/fragments/MediaOpener.hpp"
#include "seamline/manifest/RecordingManifest.hpp"
#include "seamline/media/Fragment.hpp"
#include "seamline/util/Reporter.hpp"

namespace seamline::fragments {

struct LoadedFragments {
  double total_duration = 0.0;
  media::TimedFragments video;   // Manifest order
  media::TimedFragments audio;   // Manifest order
};

// FragmentLoader walks the manifest events in order:
//   no usable url       → skipped (debug report only)
//   bad relativeTime    → warned, skipped
//   negative start      → clamped to 0, warned
//   fetch failure       → warned, skipped
//   not video           → warned, retried as audio
//   neither             → error report, skipped
//
// Only a missing/invalid manifest duration is fatal (MissingDurationError),
// and it is checked before any fetch happens.
class FragmentLoader {
 public:
  FragmentLoader(IFragmentFetcher& fetcher, IMediaOpener& opener, util::IReporter& reporter);

  LoadedFragments Load(const manifest::RecordingManifest& manifest, const std::string& dest_dir);

 private:
  IFragmentFetcher& fetcher_;
  IMediaOpener& opener_;
  util::IReporter& reporter_;
};

}  // namespace seamline::fragments

#endif  // SEAMLINE_FRAGMENTS_FRAGMENT_LOADER_HPP_
