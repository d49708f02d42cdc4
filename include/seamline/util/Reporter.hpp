// Repository: Seamline
// Component: Reporter
// Purpose: Injectable observer for component events. Components report
//          through an IReporter reference instead of writing to the global
//          Logger, so tests can assert on emitted events deterministically.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_UTIL_REPORTER_HPP_
#define SEAMLINE_UTIL_REPORTER_HPP_

#include <string>

namespace seamline::util {

enum class ReportLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

// Every observable event a component may emit.
enum class ReportCode {
  // Fragment Loader
  kTotalDuration,               // Info: total duration read from manifest
  kEventSkippedNoUrl,           // Debug: event has no usable url
  kStartTimeClamped,            // Warn: negative relativeTime clamped to 0
  kStartTimeInvalid,            // Warn: non-numeric relativeTime, event skipped
  kFragmentFetchFailed,         // Warn: fetch returned no file
  kFragmentVideoDecodeFailed,   // Warn: not decodable as video, trying audio
  kFragmentUnreadable,          // Error: neither video nor audio
  kFragmentLoaded,              // Debug: fragment classified and kept
  kFragmentsLoaded,             // Info: per-kind counts

  // Timeline Builder / Audio Mixer
  kVideoTimelineBuilt,          // Info: final video timeline duration
  kAudioTrackBuilt,             // Info: final audio track duration
  kNativeAudioKept,             // Info: no audio fragments, video audio kept

  // Compiler
  kDurationCapped,              // Info: composition truncated to max duration
  kWritingOutput,               // Info: handing composition to the writer
  kOutputWritten,               // Info: writer finished
  kCompileFailed,               // Error: compile step failed
  kFragmentsReleased,           // Debug: all handles closed
};

const char* ReportCodeName(ReportCode code);
const char* ReportLevelName(ReportLevel level);

struct ReportEvent {
  ReportLevel level;
  ReportCode code;
  std::string component;  // e.g. "FragmentLoader"
  std::string message;
};

class IReporter {
 public:
  virtual ~IReporter() = default;

  virtual void Report(const ReportEvent& event) = 0;

  void Debug(ReportCode code, const std::string& component, const std::string& message) {
    Report({ReportLevel::kDebug, code, component, message});
  }
  void Info(ReportCode code, const std::string& component, const std::string& message) {
    Report({ReportLevel::kInfo, code, component, message});
  }
  void Warn(ReportCode code, const std::string& component, const std::string& message) {
    Report({ReportLevel::kWarn, code, component, message});
  }
  void Error(ReportCode code, const std::string& component, const std::string& message) {
    Report({ReportLevel::kError, code, component, message});
  }
};

// Production reporter: formats "[Component] message" and forwards to Logger
// at the matching level.
class LoggerReporter : public IReporter {
 public:
  void Report(const ReportEvent& event) override;
};

// Reporter that drops everything.
class NullReporter : public IReporter {
 public:
  void Report(const ReportEvent&) override {}
};

}  // namespace seamline::util

#endif  // SEAMLINE_UTIL_REPORTER_HPP_
