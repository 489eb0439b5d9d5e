#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/stats/statistics.hpp"
#include "internal/trace/trace_forest.hpp"

namespace tracelens::stats {

enum class SpanBehavior : std::uint8_t {
  kRecurringSlowdown, // consistently slow
  kIntermittent,      // sometimes fast, sometimes slow
  kHighVariance,      // unpredictable
};

std::string_view ToString(SpanBehavior behavior);

struct SpanVariability {
  std::string               span_name;
  std::size_t               occurrences              = 0;
  double                    mean_ms                  = 0;
  double                    stddev_ms                = 0;
  double                    coefficient_of_variation = 0;
  double                    p50_ms                   = 0;
  double                    p95_ms                   = 0;
  std::vector<SpanBehavior> behaviors;
};

// Per-service request totals across a batch of traces.
struct ServiceStats {
  std::string service;
  std::size_t request_count  = 0;
  double      error_rate_pct = 0; // rounded to two decimals
  double      avg_latency_ms = 0; // over timed spans only
};

// One (service, operation) pair ranked by its share of trace latency.
struct BottleneckOperation {
  std::string service;
  std::string operation;
  std::size_t trace_count          = 0;
  double      avg_contribution_pct = 0;
  double      p95_contribution_pct = 0;
  double      avg_duration_ms      = 0;
  double      p95_duration_ms      = 0;
  double      error_rate_pct       = 0;
  double      bottleneck_score     = 0;
};

constexpr std::size_t kMaxBottlenecks = 20;

struct SpanPatternReport {
  std::size_t                      trace_count = 0;
  std::vector<SpanVariability>     spans; // only spans with at least one behavior
  std::vector<BottleneckOperation> bottlenecks;
  TrendResult                      duration_trend;
};

/*
  Cross-trace span variability.

  Durations of every timed occurrence of a span name are pooled across the
  traces. Trace totals feed the trend detector in the given order, so
  callers pass traces oldest first.
*/
class SpanPatternAnalyzer {
 public:
  explicit SpanPatternAnalyzer(StatisticsOptions options = {});

  SpanPatternReport Analyze(const std::vector<trace::TraceForest>& traces) const;

  static std::vector<SpanBehavior> Classify(double mean_ms, double cv, std::size_t occurrences);

  // Every indexed span counts as a request. Sorted by request count, then name.
  static std::vector<ServiceStats> ServiceLevelStats(const std::vector<trace::TraceForest>& traces);

  /*
    Contribution is span duration over its trace's total duration. Pairs
    seen in fewer than min_traces traces, and spans of service "unknown",
    are left out.

    score = avg_contribution * 0.4 + p95_duration / 100 * 0.3 + trace_count / min_traces * 0.3
  */
  static std::vector<BottleneckOperation> FindBottlenecks(const std::vector<trace::TraceForest>& traces,
                                                          std::size_t                            min_traces = kMinSamples);

 private:
  StatisticsEngine engine_;
};

} // namespace tracelens::stats
