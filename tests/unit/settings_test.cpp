#include "internal/config/settings.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using tracelens::config::ConfigLoader;
using tracelens::config::ResolveSettings;
using tracelens::runtime::config::RuntimeConfig;

bool Rejects(const RuntimeConfig& config) {
  try {
    (void)ResolveSettings(config);
  } catch (const tracelens::util::InvalidConfig&) {
    return true;
  }
  return false;
}

void TestDefaultsSurviveEmptyConfig() {
  const auto settings = ResolveSettings(RuntimeConfig{});

  assert(settings.worker_threads == 0);
  assert(settings.comparator.strategy == tracelens::trace::MatchStrategy::kAuto);
  assert(settings.comparator.noise_floor_ms == 1.0);
  assert(settings.anti_patterns.n_plus_one_min_count == 3);
  assert(settings.anti_patterns.serial_chain_max_gap_ms == 10.0);
  assert(settings.scorer.max_candidates == 10);
  assert(settings.statistics.z_score_threshold == 2.0);
  assert(settings.miner.similarity_threshold == 0.5);
  assert(settings.max_patterns == 20);
  assert(settings.cache.enabled);
  assert(settings.cache.max_entries == 256);
  assert(settings.cache.ttl == std::chrono::minutes(5));
}

void TestOverridesApply() {
  const auto config = ConfigLoader::ParseYaml(R"(analysis_workers:
  threads: 6
trace_analysis:
  match_strategy: MATCH_STRATEGY_SPAN_ID
  latency_noise_floor_ms: 5
  serial_chain:
    min_length: 4
  retry_storm:
    max_gap_ms: 250
  pool_wait_threshold_ms: 40
  root_cause:
    likely_score_cutoff: 900
statistics:
  z_score_threshold: 3
log_patterns:
  similarity_threshold: 0.8
  max_clusters: 50
  max_patterns: 5
cache:
  max_entries: 10
  ttl_seconds: 30
)");

  const auto settings = ResolveSettings(config);
  assert(settings.worker_threads == 6);
  assert(settings.comparator.strategy == tracelens::trace::MatchStrategy::kSpanId);
  assert(settings.comparator.noise_floor_ms == 5.0);
  assert(settings.anti_patterns.serial_chain_min_length == 4);
  assert(settings.anti_patterns.n_plus_one_min_count == 3);
  assert(settings.anti_patterns.retry_max_gap_ms == 250.0);
  assert(settings.anti_patterns.retry_min_count == 3);
  assert(settings.anti_patterns.pool_wait_threshold_ms == 40.0);
  assert(settings.anti_patterns.timeout_threshold_ms == 1000.0);
  assert(settings.scorer.likely_score_cutoff == 900.0);
  assert(settings.statistics.z_score_threshold == 3.0);
  assert(settings.statistics.trend_threshold_pct == 15.0);
  assert(settings.miner.similarity_threshold == 0.8);
  assert(settings.log_comparison.match_threshold == 0.8);
  assert(settings.miner.max_clusters == 50);
  assert(settings.max_patterns == 5);
  // a cache block without enabled: true turns the cache off
  assert(!settings.cache.enabled);
  assert(settings.cache.max_entries == 10);
  assert(settings.cache.ttl == std::chrono::seconds(30));
}

void TestInvalidValuesAreRejected() {
  RuntimeConfig negative;
  negative.mutable_statistics()->set_z_score_threshold(-1.0);
  assert(Rejects(negative));

  RuntimeConfig similarity;
  similarity.mutable_log_patterns()->set_similarity_threshold(1.5);
  assert(Rejects(similarity));

  RuntimeConfig gap;
  gap.mutable_trace_analysis()->mutable_serial_chain()->set_max_gap_ms(-0.5);
  assert(Rejects(gap));

  RuntimeConfig full_similarity;
  full_similarity.mutable_log_patterns()->set_similarity_threshold(1.0);
  assert(!Rejects(full_similarity));
}

} // namespace

int main() {
  TestDefaultsSurviveEmptyConfig();
  TestOverridesApply();
  TestInvalidValuesAreRejected();

  std::cout << "tracelens_unit_settings: pass\n";
  return 0;
}
