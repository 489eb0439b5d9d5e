#pragma once

#include <stdexcept>
#include <string>

namespace tracelens::util {

/*
  Central error types.

  These get translated later to gRPC status codes. Data-quality defects
  inside a trace are not errors; they are collected into the quality report.
*/

// Nothing to analyze: the trace carried no span records.
class EmptyTrace : public std::runtime_error {
 public:
  explicit EmptyTrace(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Population below the statistical minimum. Callers surface it as a
// skipped-analysis note.
class InsufficientData : public std::runtime_error {
 public:
  explicit InsufficientData(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace tracelens::util
