#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/findings.hpp"
#include "internal/trace/trace_forest.hpp"

namespace tracelens::trace {

struct AntiPatternThresholds {
  std::size_t n_plus_one_min_count        = 3;
  double      n_plus_one_min_total_ms     = 50.0;
  double      n_plus_one_high_impact_ms   = 200.0;
  std::size_t serial_chain_min_length     = 3;
  double      serial_chain_max_gap_ms     = 10.0;
  double      serial_chain_min_total_ms   = 100.0;
  double      serial_chain_high_impact_ms = 500.0;
  std::size_t retry_min_count             = 3;
  double      retry_max_gap_ms            = 1000.0;
  std::size_t retry_high_impact_count     = 5;
  double      timeout_threshold_ms        = 1000.0;
  double      pool_wait_threshold_ms      = 100.0;
};

/*
  Detects N+1 sibling fan-outs, serial chains of independent spans, retry
  storms, cascading timeouts and connection pool waits.

  Spans without usable timestamps still count toward N+1 and retry groups
  (with zero duration); serial chains need timestamps and skip them.

  Name and attribute matching is case-insensitive:
    retry      retry, attempt, backoff, reconnect
    timeout    timeout, deadline, exceeded, "timed out", "context deadline"
    connection connection, pool, acquire, checkout, wait
*/
class AntiPatternDetector {
 public:
  explicit AntiPatternDetector(AntiPatternThresholds thresholds = {});

  std::vector<model::AntiPatternFinding> Detect(const TraceForest& forest) const;

  std::vector<model::NPlusOne>    DetectNPlusOne(const TraceForest& forest) const;
  std::vector<model::SerialChain> DetectSerialChains(const TraceForest& forest) const;

  // One finding per span name whose spans repeat back to back, or whose
  // name marks it as a retry.
  std::vector<model::RetryStorm> DetectRetryStorms(const TraceForest& forest) const;

  // Timeout chains of two or more spans, longest first; a chain contained
  // in a longer one is dropped.
  std::vector<model::CascadingTimeout> DetectCascadingTimeouts(const TraceForest& forest) const;

  // At most one finding covering every slow connection wait in the trace.
  std::vector<model::ConnectionPoolIssue> DetectConnectionPoolIssues(const TraceForest& forest) const;

 private:
  AntiPatternThresholds thresholds_;
};

} // namespace tracelens::trace
