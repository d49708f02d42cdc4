// Repository: Seamline
// Component: Fatal Errors
// Purpose: The two failures surfaced to callers. Per-fragment failures are
//          never raised; they are reported and the fragment is dropped.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_UTIL_ERRORS_HPP_
#define SEAMLINE_UTIL_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace seamline {

// Input record carries no usable total duration.
class MissingDurationError : public std::runtime_error {
 public:
  explicit MissingDurationError(const std::string& detail)
      : std::runtime_error("Duration not found in recording manifest: " + detail) {}
};

// Timeline assembly, rendering or encoding failed. cause() holds the
// underlying message; what() is "Failed to compile final video: <cause>".
class CompileError : public std::runtime_error {
 public:
  explicit CompileError(const std::string& cause)
      : std::runtime_error("Failed to compile final video: " + cause), cause_(cause) {}

  const std::string& cause() const { return cause_; }

 private:
  std::string cause_;
};

}  // namespace seamline

#endif  // SEAMLINE_UTIL_ERRORS_HPP_
