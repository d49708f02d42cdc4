// Repository: Seamline
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission without multi-thread interleave.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_UTIL_LOGGER_HPP_
#define SEAMLINE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace seamline::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so there is no interleave between concurrent callers
// (the compile thread and libx264 log callbacks).
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when SEAMLINE_DEBUG env is set or SetDebugEnabled(true)
// Warn  → stderr (degraded but recoverable conditions, e.g. skipped fragments)
// Error → stderr (unreadable fragments, compile failures)
//
// Test-only: the sink setters install a callback invoked for every line of
// that level (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Forces Debug() output on regardless of SEAMLINE_DEBUG (CLI --verbose).
  static void SetDebugEnabled(bool enabled);
  static bool IsDebugEnabled();

  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static bool debug_forced_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace seamline::util

#endif  // SEAMLINE_UTIL_LOGGER_HPP_
