// Repository: Seamline
// Component: Recording Manifest
// Purpose: Upstream input record: total duration plus the event log whose
//          entries point at media fragments.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_MANIFEST_RECORDING_MANIFEST_HPP_
#define SEAMLINE_MANIFEST_RECORDING_MANIFEST_HPP_

#include <optional>
#include <string>
#include <vector>

namespace seamline::manifest {

// One eventLogs entry, reduced to the fields the loader consumes.
struct ManifestEvent {
  // Index in the eventLogs array (for diagnostics).
  size_t index = 0;

  // data.url when present and a non-empty string.
  std::optional<std::string> url;

  // relativeTime in seconds. Absent → 0.0. Numeric strings are accepted.
  double relative_time = 0.0;

  // True when relativeTime is present but not a number.
  bool relative_time_invalid = false;
};

// Expected shape:
//   {
//     "duration": 3600.5,
//     "eventLogs": [
//       { "relativeTime": 12.0, "data": { "url": "https://.../chunk1.webm" } },
//       ...
//     ]
//   }
// Unknown members are ignored. eventLogs entries that are not objects, or
// whose "data" is not an object, produce no event.
struct RecordingManifest {
  // Total duration in seconds; nullopt when missing, zero, negative or not
  // a number.
  std::optional<double> duration;

  std::vector<ManifestEvent> events;

  // Parse from JSON text. Returns empty optional when the text is not a JSON
  // object.
  static std::optional<RecordingManifest> FromJson(const std::string& json_str);

  // Read and parse a file. Returns empty optional on read or parse failure.
  static std::optional<RecordingManifest> FromFile(const std::string& path);

  // Returns the duration or throws MissingDurationError.
  double RequireDuration() const;
};

}  // namespace seamline::manifest

#endif  // SEAMLINE_MANIFEST_RECORDING_MANIFEST_HPP_
