#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/findings.hpp"
#include "internal/trace/trace_forest.hpp"

namespace tracelens::trace {

enum class MatchStrategy : std::uint8_t {
  kAuto,
  kSpanId,
  kNameOrdinal,
};

std::string_view ToString(MatchStrategy strategy);

struct ComparatorOptions {
  MatchStrategy strategy       = MatchStrategy::kAuto;
  double        noise_floor_ms = 1.0;
};

struct SpanMatch {
  model::SpanIdentity        identity;
  std::optional<std::size_t> baseline;
  std::optional<std::size_t> target;
};

struct StructureSummary {
  std::size_t baseline_span_count = 0;
  std::size_t target_span_count   = 0;
  std::size_t baseline_depth      = 0;
  std::size_t target_depth        = 0;
  long        depth_change        = 0;
};

struct TraceDiff {
  MatchStrategy                  strategy = MatchStrategy::kSpanId;
  std::vector<SpanMatch>         matches;
  std::vector<model::DiffRecord> diffs;
  StructureSummary               structure;

  std::vector<model::LatencyDiff>   LatencyDiffs() const;
  std::vector<model::ErrorDiff>     ErrorDiffs() const;
  std::vector<model::StructureDiff> StructureDiffs() const;
};

/*
  Span-level diff of a baseline trace against a target trace.

  Spans are matched by span_id when both traces share stable ids; in auto
  mode that means at least half of the smaller trace's ids occur in the
  other trace. Otherwise spans are matched by name plus ordinal occurrence
  in start-time order.
*/
class TraceComparator {
 public:
  explicit TraceComparator(ComparatorOptions options = {});

  TraceDiff Compare(const TraceForest& baseline, const TraceForest& target) const;

  MatchStrategy ResolveStrategy(const TraceForest& baseline, const TraceForest& target) const;

 private:
  std::vector<SpanMatch> MatchById(const TraceForest& baseline, const TraceForest& target) const;
  std::vector<SpanMatch> MatchByName(const TraceForest& baseline, const TraceForest& target) const;

  ComparatorOptions options_;
};

} // namespace tracelens::trace
