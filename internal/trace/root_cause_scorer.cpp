#include "internal/trace/root_cause_scorer.hpp"

#include <algorithm>

namespace tracelens::trace {

RootCauseScorer::RootCauseScorer(ScorerOptions options) : options_(options) {
}

bool RootCauseScorer::SelfTimeSignificant(double diff_ms, double self_time_ms) {
  return self_time_ms > 0.3 * diff_ms;
}

double RootCauseScorer::Score(double diff_ms, std::size_t depth, bool on_critical_path, double self_time_ms) {
  const double depth_factor             = std::min(1.0 + static_cast<double>(depth) * 0.1, 1.5);
  const double critical_path_multiplier = on_critical_path ? 2.0 : 1.0;
  const double self_time_multiplier     = SelfTimeSignificant(diff_ms, self_time_ms) ? 1.3 : 1.0;
  return diff_ms * depth_factor * critical_path_multiplier * self_time_multiplier;
}

std::vector<model::RootCauseCandidate> RootCauseScorer::Rank(const TraceDiff& diff, const TraceForest& target,
                                                             const CriticalPathReport& target_path) const {
  std::vector<model::RootCauseCandidate> candidates;

  for (const auto& latency : diff.LatencyDiffs()) {
    if (latency.diff_ms <= 0) {
      continue;
    }
    auto index = target.Find(latency.span.target_span_id);
    if (!index) {
      continue;
    }

    model::RootCauseCandidate candidate;
    candidate.span_id          = latency.span.target_span_id;
    candidate.span_name        = latency.span.name;
    candidate.diff_ms          = latency.diff_ms;
    candidate.diff_percent     = latency.diff_percent;
    candidate.baseline_ms      = latency.baseline_ms;
    candidate.target_ms        = latency.target_ms;
    candidate.on_critical_path = target_path.OnPath(*index);
    candidate.self_time_ms     = *index < target_path.self_time_ms.size() ? target_path.self_time_ms[*index] : 0.0;
    candidate.depth            = target.at(*index).depth;
    candidate.confidence_score = Score(candidate.diff_ms, candidate.depth, candidate.on_critical_path, candidate.self_time_ms);
    candidates.push_back(std::move(candidate));
  }

  std::sort(candidates.begin(), candidates.end(), [](const model::RootCauseCandidate& a, const model::RootCauseCandidate& b) {
    if (a.confidence_score != b.confidence_score) return a.confidence_score > b.confidence_score;
    if (a.on_critical_path != b.on_critical_path) return a.on_critical_path;
    if (a.diff_ms != b.diff_ms) return a.diff_ms > b.diff_ms;
    return a.span_id < b.span_id;
  });

  if (options_.max_candidates > 0 && candidates.size() > options_.max_candidates) {
    candidates.resize(options_.max_candidates);
  }

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    auto&      c         = candidates[i];
    const bool top_on_cp = i == 0 && c.on_critical_path;
    const bool strong    = c.confidence_score > options_.likely_score_cutoff && SelfTimeSignificant(c.diff_ms, c.self_time_ms);
    c.is_likely_root_cause = top_on_cp || strong;
  }
  return candidates;
}

} // namespace tracelens::trace
