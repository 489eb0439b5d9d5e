#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "config/config.pb.h"
#include "internal/logs/log_template_miner.hpp"
#include "internal/logs/pattern_comparator.hpp"
#include "internal/stats/statistics.hpp"
#include "internal/trace/anti_patterns.hpp"
#include "internal/trace/root_cause_scorer.hpp"
#include "internal/trace/trace_comparator.hpp"

namespace tracelens::config {

struct CacheSettings {
  bool                      enabled     = true;
  std::size_t               max_entries = 256;
  std::chrono::milliseconds ttl{std::chrono::minutes(5)};
};

/*
  Engine options resolved from RuntimeConfig.

  A zero or unset field keeps the built-in default of the corresponding
  options struct.
*/
struct AnalysisSettings {
  std::size_t worker_threads = 0; // 0 = hardware concurrency

  trace::ComparatorOptions     comparator;
  trace::AntiPatternThresholds anti_patterns;
  trace::ScorerOptions         scorer;

  stats::StatisticsOptions statistics;

  logs::MinerOptions             miner;
  logs::PatternComparisonOptions log_comparison;
  std::size_t                    max_patterns = 20;

  CacheSettings cache;
};

// Throws util::InvalidConfig on negative thresholds or a similarity
// threshold outside (0, 1].
AnalysisSettings ResolveSettings(const tracelens::runtime::config::RuntimeConfig& config);

} // namespace tracelens::config
