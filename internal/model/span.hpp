#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tracelens::model {

enum class SpanStatus : std::uint8_t {
  kUnset = 0,
  kOk    = 1,
  kError = 2,
};

constexpr std::string_view ToString(SpanStatus status) {
  switch (status) {
    case SpanStatus::kOk:
      return "ok";
    case SpanStatus::kError:
      return "error";
    case SpanStatus::kUnset:
    default:
      return "unset";
  }
}

// One raw span as supplied by the trace store. Nothing is validated yet.
struct SpanRecord {
  std::string span_id;
  std::string parent_span_id; // empty for roots

  std::string name;

  // Milliseconds since the epoch.
  std::optional<double> start_ms;
  std::optional<double> end_ms;

  SpanStatus status = SpanStatus::kUnset;

  std::map<std::string, std::string> attributes;
};

struct TraceRecord {
  std::string             trace_id;
  std::vector<SpanRecord> spans;
};

} // namespace tracelens::model
