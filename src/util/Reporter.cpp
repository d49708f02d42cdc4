// Repository: Seamline
// Component: Reporter Implementation
// Purpose: Logger-backed reporter and event name tables.
// Copyright (c) 2025 Seamline Authors

#include "seamline/util/Reporter.hpp"

#include <sstream>

#include "seamline/util/Logger.hpp"

namespace seamline::util {

const char* ReportCodeName(ReportCode code) {
  switch (code) {
    case ReportCode::kTotalDuration:             return "TOTAL_DURATION";
    case ReportCode::kEventSkippedNoUrl:         return "EVENT_SKIPPED_NO_URL";
    case ReportCode::kStartTimeClamped:          return "START_TIME_CLAMPED";
    case ReportCode::kStartTimeInvalid:          return "START_TIME_INVALID";
    case ReportCode::kFragmentFetchFailed:       return "FRAGMENT_FETCH_FAILED";
    case ReportCode::kFragmentVideoDecodeFailed: return "FRAGMENT_VIDEO_DECODE_FAILED";
    case ReportCode::kFragmentUnreadable:        return "FRAGMENT_UNREADABLE";
    case ReportCode::kFragmentLoaded:            return "FRAGMENT_LOADED";
    case ReportCode::kFragmentsLoaded:           return "FRAGMENTS_LOADED";
    case ReportCode::kVideoTimelineBuilt:        return "VIDEO_TIMELINE_BUILT";
    case ReportCode::kAudioTrackBuilt:           return "AUDIO_TRACK_BUILT";
    case ReportCode::kNativeAudioKept:           return "NATIVE_AUDIO_KEPT";
    case ReportCode::kDurationCapped:            return "DURATION_CAPPED";
    case ReportCode::kWritingOutput:             return "WRITING_OUTPUT";
    case ReportCode::kOutputWritten:             return "OUTPUT_WRITTEN";
    case ReportCode::kCompileFailed:             return "COMPILE_FAILED";
    case ReportCode::kFragmentsReleased:         return "FRAGMENTS_RELEASED";
  }
  return "UNKNOWN";
}

const char* ReportLevelName(ReportLevel level) {
  switch (level) {
    case ReportLevel::kDebug: return "debug";
    case ReportLevel::kInfo:  return "info";
    case ReportLevel::kWarn:  return "warn";
    case ReportLevel::kError: return "error";
  }
  return "unknown";
}

void LoggerReporter::Report(const ReportEvent& event) {
  std::ostringstream oss;
  oss << "[" << event.component << "] " << event.message;
  switch (event.level) {
    case ReportLevel::kDebug:
      Logger::Debug(oss.str());
      break;
    case ReportLevel::kInfo:
      Logger::Info(oss.str());
      break;
    case ReportLevel::kWarn:
      Logger::Warn(oss.str());
      break;
    case ReportLevel::kError:
      Logger::Error(oss.str());
      break;
  }
}

}  // namespace seamline::util
