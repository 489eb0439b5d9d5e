#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "internal/trace/trace_forest.hpp"

namespace tracelens::trace {

struct CriticalPathNode {
  std::size_t index = 0;
  std::string span_id;
  std::string name;
  std::string service;
  double      self_time_ms              = 0;
  double      duration_ms               = 0;
  double      start_offset_ms           = 0;
  std::size_t depth                     = 0;
  double      contribution_pct          = 0;
  double      blocking_contribution_pct = 0;
};

// Sibling calls to one service under the same parent; savings_ms is what
// running them concurrently would save (sum minus the longest).
struct ParallelOpportunity {
  std::string              parent_span_id;
  std::string              service;
  std::size_t              span_count = 0;
  std::vector<std::string> span_names; // first three, in start order
  double                   total_sequential_ms = 0;
  double                   parallel_ms         = 0;
  double                   savings_ms          = 0;
  std::string              recommendation;
};

enum class Priority : std::uint8_t {
  kLow,
  kMedium,
  kHigh,
};

struct Recommendation {
  Priority                 priority = Priority::kMedium;
  std::string              kind;
  std::string              target;
  std::string              service;
  double                   current_ms = 0;
  std::string              recommendation;
  std::vector<std::string> investigation_steps;
};

struct CriticalPathReport {
  std::vector<CriticalPathNode> path;

  double critical_path_ms  = 0;
  double total_duration_ms = 0;
  double parallelism_ratio = 1.0;
  double parallelism_pct   = 0;

  // Per arena index; zero for spans outside the timeline (unusable, clock
  // skewed, or below a skewed span).
  std::vector<double> self_time_ms;

  // Span with the largest self-time on the path; empty when the path is.
  std::string bottleneck_span_id;

  // Largest savings first, at most five.
  std::vector<ParallelOpportunity> parallel_opportunities;

  std::vector<Recommendation> recommendations;

  bool OnPath(std::string_view span_id) const;
  bool OnPath(std::size_t index) const;

 private:
  friend class CriticalPathAnalyzer;
  std::unordered_set<std::size_t> on_path_;
};

/*
  Critical path analysis.

  The timeline is every span reachable from a timeline root over eligible
  edges. Self-time is a span's duration minus the union of its timeline
  children's intervals; spans off the timeline have none.

  The blocking child of a span is the child that ends latest and is not
  subsumed by a sibling: on equal end times the earlier start wins, then
  the lower arena index. Children ending after the blocking child starts
  ran concurrently with it and contribute nothing. The walk then continues
  backwards from the blocking child's start, so serial children all block.
  A span's chain is its self-time plus the chains of its blocking children.

  Timeline roots are selected the same way under a virtual parent that
  spans the whole trace. critical_path_ms is the chain of the selected
  roots, floored at the largest single self-time and capped at the trace
  duration.

  Parallel opportunities group each timeline span's children by service;
  groups of two or more saving over 10 ms are reported. Recommendations
  cover the bottleneck, the best opportunity, error spans and paths longer
  than five spans.
*/
class CriticalPathAnalyzer {
 public:
  CriticalPathReport Analyze(const TraceForest& forest) const;

  // Self-time of every span; spans off the timeline get zero.
  static std::vector<double> SelfTimes(const TraceForest& forest);

 private:
  struct Selection {
    double                   weight = 0;
    std::vector<std::size_t> chosen; // in start order
  };

  static Selection SelectBlocking(const TraceForest& forest, std::vector<std::size_t> candidates, const std::vector<double>& chain);
};

} // namespace tracelens::trace
