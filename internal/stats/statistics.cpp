#include "internal/stats/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

#include "internal/util/errors.hpp"

namespace tracelens::stats {

namespace {

// Above this size percentiles use selection instead of a full sort.
constexpr std::size_t kSelectionThreshold = 100'000;

// z-score reported when the historical population has no spread but the
// means differ.
constexpr double kDegenerateZScore = 100.0;

void RequireSamples(const std::vector<double>& values, std::string_view what) {
  if (values.size() < kMinSamples) {
    throw util::InsufficientData(std::string(what) + " needs at least " + std::to_string(kMinSamples) + " samples, got " +
                                 std::to_string(values.size()));
  }
}

double InterpolateSorted(const std::vector<double>& sorted, double q) {
  const double pos  = q * static_cast<double>(sorted.size() - 1);
  const auto   lo   = static_cast<std::size_t>(std::floor(pos));
  const auto   hi   = static_cast<std::size_t>(std::ceil(pos));
  const double frac = pos - static_cast<double>(lo);
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

double InterpolateSelect(std::vector<double>& values, double q) {
  const double pos  = q * static_cast<double>(values.size() - 1);
  const auto   lo   = static_cast<std::size_t>(std::floor(pos));
  const double frac = pos - static_cast<double>(lo);

  std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(lo), values.end());
  const double lower = values[lo];
  if (frac == 0.0 || lo + 1 >= values.size()) {
    return lower;
  }
  const double upper = *std::min_element(values.begin() + static_cast<std::ptrdiff_t>(lo + 1), values.end());
  return lower + (upper - lower) * frac;
}

} // namespace

std::string_view ToString(Trend trend) {
  switch (trend) {
    case Trend::kDegrading:
      return "degrading";
    case Trend::kImproving:
      return "improving";
    case Trend::kStable:
    default:
      return "stable";
  }
}

double Mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double SampleStddev(const std::vector<double>& values) {
  if (values.size() < 2) {
    return 0.0;
  }
  const double mean = Mean(values);
  double       sum  = 0.0;
  for (double v : values) {
    sum += (v - mean) * (v - mean);
  }
  return std::sqrt(sum / static_cast<double>(values.size() - 1));
}

double Percentile(std::vector<double> values, double q) {
  if (values.empty()) {
    throw util::InsufficientData("percentile of an empty population");
  }
  q = std::clamp(q, 0.0, 1.0);

  if (values.size() > kSelectionThreshold) {
    return InterpolateSelect(values, q);
  }
  std::sort(values.begin(), values.end());
  return InterpolateSorted(values, q);
}

StatisticsEngine::StatisticsEngine(StatisticsOptions options) : options_(options) {
}

// ------------------------------------------------------------
// Distribution
// ------------------------------------------------------------

Percentiles StatisticsEngine::ComputePercentiles(const std::vector<double>& values) const {
  RequireSamples(values, "percentiles");

  Percentiles p;
  if (values.size() > kSelectionThreshold) {
    p.p50 = Percentile(values, 0.50);
    p.p90 = Percentile(values, 0.90);
    p.p95 = Percentile(values, 0.95);
    p.p99 = Percentile(values, 0.99);
    return p;
  }

  std::vector<double> sorted(values);
  std::sort(sorted.begin(), sorted.end());
  p.p50 = InterpolateSorted(sorted, 0.50);
  p.p90 = InterpolateSorted(sorted, 0.90);
  p.p95 = InterpolateSorted(sorted, 0.95);
  p.p99 = InterpolateSorted(sorted, 0.99);
  return p;
}

SummaryStatistics StatisticsEngine::Summarize(const std::vector<double>& values) const {
  RequireSamples(values, "summary statistics");

  SummaryStatistics summary;
  summary.count       = values.size();
  summary.min         = *std::min_element(values.begin(), values.end());
  summary.max         = *std::max_element(values.begin(), values.end());
  summary.mean        = Mean(values);
  summary.stddev      = SampleStddev(values);
  summary.percentiles = ComputePercentiles(values);
  return summary;
}

// ------------------------------------------------------------
// Anomaly detection
// ------------------------------------------------------------

ZScoreResult StatisticsEngine::ZScore(const std::vector<double>& current, const std::vector<double>& historical) const {
  RequireSamples(historical, "z-score baseline");
  if (current.empty()) {
    throw util::InsufficientData("z-score needs at least one current sample");
  }

  ZScoreResult result;
  result.current_mean      = Mean(current);
  result.historical_mean   = Mean(historical);
  result.historical_stddev = SampleStddev(historical);

  const double delta = result.current_mean - result.historical_mean;
  if (result.historical_stddev > 0) {
    result.z_score = delta / result.historical_stddev;
  } else if (delta != 0) {
    result.z_score = delta > 0 ? kDegenerateZScore : -kDegenerateZScore;
  }
  result.is_anomaly = std::fabs(result.z_score) > options_.z_score_threshold;
  return result;
}

TrendResult StatisticsEngine::DetectTrend(const std::vector<double>& series) const {
  RequireSamples(series, "trend detection");

  const auto                mid = series.size() / 2;
  const std::vector<double> first(series.begin(), series.begin() + static_cast<std::ptrdiff_t>(mid));
  const std::vector<double> second(series.begin() + static_cast<std::ptrdiff_t>(mid), series.end());

  TrendResult result;
  result.first_half_mean  = Mean(first);
  result.second_half_mean = Mean(second);
  if (result.first_half_mean != 0) {
    result.pct_change = (result.second_half_mean - result.first_half_mean) / result.first_half_mean * 100.0;
  }

  if (result.pct_change > options_.trend_threshold_pct) {
    result.trend = Trend::kDegrading;
  } else if (result.pct_change < -options_.trend_threshold_pct) {
    result.trend = Trend::kImproving;
  }
  return result;
}

std::vector<Outlier> StatisticsEngine::DetectOutliers(const std::vector<double>& values) const {
  RequireSamples(values, "outlier detection");

  const double mean   = Mean(values);
  const double stddev = SampleStddev(values);

  std::vector<Outlier> outliers;
  if (stddev == 0) {
    return outliers;
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    const double z = (values[i] - mean) / stddev;
    if (std::fabs(z) > options_.outlier_z_threshold) {
      outliers.push_back({i, values[i], z});
    }
  }
  return outliers;
}

WindowComparison StatisticsEngine::CompareWindows(const std::vector<double>& baseline, const std::vector<double>& target) const {
  RequireSamples(baseline, "window comparison baseline");
  RequireSamples(target, "window comparison target");

  WindowComparison result;
  result.baseline_mean = Mean(baseline);
  result.target_mean   = Mean(target);
  result.shift         = result.target_mean - result.baseline_mean;
  if (result.baseline_mean != 0) {
    result.shift_pct = result.shift / result.baseline_mean * 100.0;
  }
  result.significant = std::fabs(result.shift_pct) > options_.window_shift_threshold_pct;
  return result;
}

} // namespace tracelens::stats
