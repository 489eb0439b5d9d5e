#include "internal/stats/statistics.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using tracelens::stats::StatisticsEngine;
using tracelens::stats::Trend;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestSummaryOfSmallPopulation() {
  const StatisticsEngine engine;
  const auto             summary = engine.Summarize({10, 20, 30, 40, 50});

  assert(summary.count == 5);
  assert(Near(summary.min, 10));
  assert(Near(summary.max, 50));
  assert(Near(summary.mean, 30));
  assert(Near(summary.stddev, std::sqrt(250.0)));
  assert(Near(summary.percentiles.p50, 30));
  // position 0.9 * 4 = 3.6 between 40 and 50
  assert(Near(summary.percentiles.p90, 46));
}

void TestPercentileSelectionMatchesSort() {
  std::vector<double> values;
  for (int i = 0; i < 100'001; ++i) {
    values.push_back(static_cast<double>((i * 7919) % 100'001));
  }
  const auto p = StatisticsEngine().ComputePercentiles(values);
  assert(Near(p.p50, 50'000));
  assert(Near(p.p99, 99'000));
}

void TestTooFewSamplesThrow() {
  bool threw = false;
  try {
    (void)StatisticsEngine().Summarize({1.0, 2.0});
  } catch (const tracelens::util::InsufficientData&) {
    threw = true;
  }
  assert(threw && "two samples are below the minimum");
}

void TestIdenticalDistributionsHaveZeroZScore() {
  const std::vector<double> series = {100, 110, 90, 105, 95};
  const auto                result = StatisticsEngine().ZScore(series, series);
  assert(result.z_score == 0.0);
  assert(!result.is_anomaly);
}

void TestShiftedMeanIsAnomaly() {
  const auto result = StatisticsEngine().ZScore({200, 210, 190}, {100, 110, 90, 105, 95});
  assert(result.is_anomaly);
  assert(result.z_score > 2.0);
}

void TestFlatHistoryUsesDegenerateZScore() {
  const auto result = StatisticsEngine().ZScore({60}, {50, 50, 50});
  assert(Near(result.z_score, 100.0));
  assert(result.is_anomaly);
}

void TestTrendDirections() {
  const StatisticsEngine engine;
  assert(engine.DetectTrend({100, 100, 100, 150, 150, 150}).trend == Trend::kDegrading);
  assert(engine.DetectTrend({150, 150, 150, 100, 100, 100}).trend == Trend::kImproving);

  const auto stable = engine.DetectTrend({100, 102, 98, 101});
  assert(stable.trend == Trend::kStable);
  assert(std::string(tracelens::stats::ToString(stable.trend)) == "stable");
}

void TestOutlierDetection() {
  std::vector<double> values(20, 100.0);
  values[7] = 1000.0;

  const auto outliers = StatisticsEngine().DetectOutliers(values);
  assert(outliers.size() == 1);
  assert(outliers[0].index == 7);
  assert(outliers[0].z_score > 3.0);

  assert(StatisticsEngine().DetectOutliers({5, 5, 5, 5}).empty());
}

void TestWindowComparison() {
  const auto shifted = StatisticsEngine().CompareWindows({100, 100, 100}, {120, 120, 120});
  assert(Near(shifted.shift, 20));
  assert(Near(shifted.shift_pct, 20));
  assert(shifted.significant);

  const auto steady = StatisticsEngine().CompareWindows({100, 100, 100}, {105, 105, 105});
  assert(!steady.significant);
}

} // namespace

int main() {
  TestSummaryOfSmallPopulation();
  TestPercentileSelectionMatchesSort();
  TestTooFewSamplesThrow();
  TestIdenticalDistributionsHaveZeroZScore();
  TestShiftedMeanIsAnomaly();
  TestFlatHistoryUsesDegenerateZScore();
  TestTrendDirections();
  TestOutlierDetection();
  TestWindowComparison();

  std::cout << "tracelens_unit_statistics: pass\n";
  return 0;
}
