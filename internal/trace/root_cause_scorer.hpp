#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/findings.hpp"
#include "internal/trace/critical_path.hpp"
#include "internal/trace/trace_comparator.hpp"
#include "internal/trace/trace_forest.hpp"

namespace tracelens::trace {

struct ScorerOptions {
  // Candidates above this score with significant self-time are likely
  // causes even when not ranked first.
  double      likely_score_cutoff = 500.0;
  std::size_t max_candidates      = 10;
};

/*
  Ranks positive latency diffs by causal confidence.

    depth_factor             = min(1 + 0.1 * depth, 1.5)
    critical_path_multiplier = 2.0 on the target critical path, else 1.0
    self_time_multiplier     = 1.3 when self_time > 0.3 * diff, else 1.0
    score                    = diff * depth_factor * cp * self

  Depth, self-time and path membership are read from the target trace.
*/
class RootCauseScorer {
 public:
  explicit RootCauseScorer(ScorerOptions options = {});

  std::vector<model::RootCauseCandidate> Rank(const TraceDiff& diff, const TraceForest& target, const CriticalPathReport& target_path) const;

  static double Score(double diff_ms, std::size_t depth, bool on_critical_path, double self_time_ms);
  static bool   SelfTimeSignificant(double diff_ms, double self_time_ms);

 private:
  ScorerOptions options_;
};

} // namespace tracelens::trace
