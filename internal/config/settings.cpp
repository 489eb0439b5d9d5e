#include "internal/config/settings.hpp"

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace tracelens::config {

namespace {

using tracelens::runtime::config::TraceAnalysisConfig;

void Override(double& target, double value, std::string_view field) {
  if (value < 0) {
    throw util::InvalidConfig(std::string(field) + " must not be negative, got " + std::to_string(value));
  }
  if (value > 0) {
    target = value;
  }
}

template <typename Target>
void Override(Target& target, std::uint32_t value) {
  if (value > 0) {
    target = static_cast<Target>(value);
  }
}

void RequireFraction(double value, std::string_view field) {
  if (!(value > 0.0 && value <= 1.0)) {
    throw util::InvalidConfig(std::string(field) + " must be in (0, 1], got " + std::to_string(value));
  }
}

trace::MatchStrategy ToMatchStrategy(TraceAnalysisConfig::MatchStrategy strategy) {
  switch (strategy) {
    case TraceAnalysisConfig::MATCH_STRATEGY_SPAN_ID:
      return trace::MatchStrategy::kSpanId;
    case TraceAnalysisConfig::MATCH_STRATEGY_NAME_ORDINAL:
      return trace::MatchStrategy::kNameOrdinal;
    default:
      return trace::MatchStrategy::kAuto;
  }
}

} // namespace

AnalysisSettings ResolveSettings(const tracelens::runtime::config::RuntimeConfig& config) {
  AnalysisSettings settings;

  settings.worker_threads = config.analysis_workers().threads();

  // ------------------------------------------------------------
  // Traces
  // ------------------------------------------------------------

  const auto& traces           = config.trace_analysis();
  settings.comparator.strategy = ToMatchStrategy(traces.match_strategy());
  Override(settings.comparator.noise_floor_ms, traces.latency_noise_floor_ms(), "trace_analysis.latency_noise_floor_ms");

  auto& thresholds = settings.anti_patterns;
  Override(thresholds.n_plus_one_min_count, traces.n_plus_one().min_count());
  Override(thresholds.n_plus_one_min_total_ms, traces.n_plus_one().min_total_ms(), "trace_analysis.n_plus_one.min_total_ms");
  Override(thresholds.n_plus_one_high_impact_ms, traces.n_plus_one().high_impact_ms(), "trace_analysis.n_plus_one.high_impact_ms");
  Override(thresholds.serial_chain_min_length, traces.serial_chain().min_length());
  Override(thresholds.serial_chain_max_gap_ms, traces.serial_chain().max_gap_ms(), "trace_analysis.serial_chain.max_gap_ms");
  Override(thresholds.serial_chain_min_total_ms, traces.serial_chain().min_total_ms(), "trace_analysis.serial_chain.min_total_ms");
  Override(thresholds.serial_chain_high_impact_ms, traces.serial_chain().high_impact_ms(), "trace_analysis.serial_chain.high_impact_ms");
  Override(thresholds.retry_min_count, traces.retry_storm().min_count());
  Override(thresholds.retry_max_gap_ms, traces.retry_storm().max_gap_ms(), "trace_analysis.retry_storm.max_gap_ms");
  Override(thresholds.retry_high_impact_count, traces.retry_storm().high_impact_count());
  Override(thresholds.timeout_threshold_ms, traces.timeout_threshold_ms(), "trace_analysis.timeout_threshold_ms");
  Override(thresholds.pool_wait_threshold_ms, traces.pool_wait_threshold_ms(), "trace_analysis.pool_wait_threshold_ms");

  Override(settings.scorer.likely_score_cutoff, traces.root_cause().likely_score_cutoff(), "trace_analysis.root_cause.likely_score_cutoff");
  Override(settings.scorer.max_candidates, traces.root_cause().max_candidates());

  // ------------------------------------------------------------
  // Statistics
  // ------------------------------------------------------------

  const auto& statistics = config.statistics();
  Override(settings.statistics.z_score_threshold, statistics.z_score_threshold(), "statistics.z_score_threshold");
  Override(settings.statistics.trend_threshold_pct, statistics.trend_threshold_pct(), "statistics.trend_threshold_pct");
  Override(settings.statistics.outlier_z_threshold, statistics.outlier_z_threshold(), "statistics.outlier_z_threshold");
  Override(settings.statistics.window_shift_threshold_pct, statistics.window_shift_threshold_pct(), "statistics.window_shift_threshold_pct");

  // ------------------------------------------------------------
  // Logs
  // ------------------------------------------------------------

  const auto& log_patterns = config.log_patterns();
  if (log_patterns.similarity_threshold() != 0) {
    RequireFraction(log_patterns.similarity_threshold(), "log_patterns.similarity_threshold");
    settings.miner.similarity_threshold     = log_patterns.similarity_threshold();
    settings.log_comparison.match_threshold = log_patterns.similarity_threshold();
  }
  Override(settings.miner.max_clusters, log_patterns.max_clusters());
  Override(settings.log_comparison.significance_threshold, log_patterns.significance_threshold(), "log_patterns.significance_threshold");
  Override(settings.log_comparison.negligible_baseline_rate, log_patterns.negligible_baseline_rate(), "log_patterns.negligible_baseline_rate");
  Override(settings.max_patterns, log_patterns.max_patterns());

  // ------------------------------------------------------------
  // Cache
  // ------------------------------------------------------------

  // an absent cache block keeps the cache on with defaults
  if (config.has_cache()) {
    settings.cache.enabled = config.cache().enabled();
    Override(settings.cache.max_entries, config.cache().max_entries());
    if (config.cache().ttl_seconds() > 0) {
      settings.cache.ttl = std::chrono::seconds(config.cache().ttl_seconds());
    }
  }

  return settings;
}

} // namespace tracelens::config
