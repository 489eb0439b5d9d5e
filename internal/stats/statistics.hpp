#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tracelens::stats {

// Populations below this size raise util::InsufficientData.
constexpr std::size_t kMinSamples = 3;

struct Percentiles {
  double p50 = 0;
  double p90 = 0;
  double p95 = 0;
  double p99 = 0;
};

struct SummaryStatistics {
  std::size_t count  = 0;
  double      min    = 0;
  double      max    = 0;
  double      mean   = 0;
  double      stddev = 0; // sample (n - 1)
  Percentiles percentiles;
};

struct ZScoreResult {
  double z_score           = 0;
  bool   is_anomaly        = false;
  double current_mean      = 0;
  double historical_mean   = 0;
  double historical_stddev = 0;
};

enum class Trend : std::uint8_t {
  kStable,
  kDegrading,
  kImproving,
};

std::string_view ToString(Trend trend);

struct TrendResult {
  Trend  trend            = Trend::kStable;
  double first_half_mean  = 0;
  double second_half_mean = 0;
  double pct_change       = 0; // percent
};

struct Outlier {
  std::size_t index   = 0;
  double      value   = 0;
  double      z_score = 0;
};

struct WindowComparison {
  double baseline_mean = 0;
  double target_mean   = 0;
  double shift         = 0;
  double shift_pct     = 0;
  bool   significant   = false;
};

struct StatisticsOptions {
  double z_score_threshold          = 2.0;
  double trend_threshold_pct        = 15.0;
  double outlier_z_threshold        = 3.0;
  double window_shift_threshold_pct = 10.0;
};

double Mean(const std::vector<double>& values);
double SampleStddev(const std::vector<double>& values);

// Linear interpolation between order statistics; q in [0, 1].
double Percentile(std::vector<double> values, double q);

/*
  Statistical anomaly engine.

  All calls are pure. Each analysis requires kMinSamples values and throws
  util::InsufficientData below that.
*/
class StatisticsEngine {
 public:
  explicit StatisticsEngine(StatisticsOptions options = {});

  SummaryStatistics Summarize(const std::vector<double>& values) const;
  Percentiles       ComputePercentiles(const std::vector<double>& values) const;

  // z = (mean(current) - mean(historical)) / stddev(historical).
  ZScoreResult ZScore(const std::vector<double>& current, const std::vector<double>& historical) const;

  // series must be in time order.
  TrendResult DetectTrend(const std::vector<double>& series) const;

  std::vector<Outlier> DetectOutliers(const std::vector<double>& values) const;

  WindowComparison CompareWindows(const std::vector<double>& baseline, const std::vector<double>& target) const;

  const StatisticsOptions& options() const { return options_; }

 private:
  StatisticsOptions options_;
};

} // namespace tracelens::stats
