#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/span.hpp"

namespace tracelens::model {

// ------------------------------------------------------------
// Trace diffs
// ------------------------------------------------------------

/*
  Identity of a span shared between a baseline and a target trace.

  key is the span_id when the traces were matched by id, otherwise
  "<name>#<ordinal>". One side's id is empty for structural changes.
*/
struct SpanIdentity {
  std::string key;
  std::string name;
  std::string baseline_span_id;
  std::string target_span_id;
};

struct LatencyDiff {
  SpanIdentity span;
  double       baseline_ms  = 0;
  double       target_ms    = 0;
  double       diff_ms      = 0;
  double       diff_percent = 0;
};

struct ErrorDiff {
  SpanIdentity span;
  SpanStatus   baseline_status = SpanStatus::kUnset;
  SpanStatus   target_status   = SpanStatus::kUnset;
  double       diff_ms         = 0;
  double       diff_percent    = 0;
};

enum class StructureChange : std::uint8_t {
  kAdded,
  kRemoved,
};

struct StructureDiff {
  SpanIdentity    span;
  StructureChange change       = StructureChange::kAdded;
  double          diff_ms      = 0;
  double          diff_percent = 0;
};

using DiffRecord = std::variant<LatencyDiff, ErrorDiff, StructureDiff>;

// ------------------------------------------------------------
// Anti-patterns
// ------------------------------------------------------------

enum class Impact : std::uint8_t {
  kLow,
  kMedium,
  kHigh,
  kCritical,
};

constexpr std::string_view ToString(Impact impact) {
  switch (impact) {
    case Impact::kLow:
      return "low";
    case Impact::kHigh:
      return "high";
    case Impact::kCritical:
      return "critical";
    case Impact::kMedium:
    default:
      return "medium";
  }
}

struct PatternSpans {
  std::vector<std::string> span_names;
  std::vector<std::string> span_ids;
  std::size_t              count             = 0;
  double                   total_duration_ms = 0;
  Impact                   impact            = Impact::kMedium;
  std::string              recommendation;
  std::string              description;
};

// Repeated identical sibling calls under one parent.
struct NPlusOne : PatternSpans {
  std::string parent_span_id;
};

// Independent spans executed back to back.
struct SerialChain : PatternSpans {
  double max_gap_ms = 0;
};

// The same operation repeated back to back, as a client retrying a failing
// dependency would.
struct RetryStorm : PatternSpans {
  bool has_exponential_backoff = false;
};

// Timeouts propagating up the call chain. span_ids run from the origin (the
// deepest timeout) to the outermost one.
struct CascadingTimeout : PatternSpans {
  std::string origin_span_id;
};

// Long waits on connection acquisition within one trace. The pool fields
// are taken from the attributes of the longest wait and may be empty.
struct ConnectionPoolIssue : PatternSpans {
  double      max_wait_ms    = 0;
  bool        pool_exhausted = false;
  std::string pool_size;
  std::string active_connections;
  std::string waiting_requests;
};

using AntiPatternFinding = std::variant<NPlusOne, SerialChain, RetryStorm, CascadingTimeout, ConnectionPoolIssue>;

// Metric label of the finding's kind, in variant order.
inline std::string_view KindName(const AntiPatternFinding& finding) {
  constexpr std::string_view kNames[] = {"n_plus_one", "serial_chain", "retry_storm", "cascading_timeout", "connection_pool"};
  return kNames[finding.index()];
}

inline const PatternSpans& Common(const AntiPatternFinding& finding) {
  return std::visit([](const auto& f) -> const PatternSpans& { return f; }, finding);
}

// ------------------------------------------------------------
// Root cause
// ------------------------------------------------------------

struct RootCauseCandidate {
  std::string span_id;
  std::string span_name;
  double      diff_ms              = 0;
  double      diff_percent         = 0;
  double      baseline_ms          = 0;
  double      target_ms            = 0;
  bool        on_critical_path     = false;
  double      self_time_ms         = 0;
  std::size_t depth                = 0;
  double      confidence_score     = 0;
  bool        is_likely_root_cause = false;
};

} // namespace tracelens::model
