#include "internal/logs/pattern_comparator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "internal/logs/token_masker.hpp"

namespace {

using tracelens::logs::AlertLevel;
using tracelens::logs::PatternComparator;
using tracelens::model::LogPattern;

LogPattern MakePattern(const std::string& line, std::uint64_t count, const std::string& severity = "INFO") {
  LogPattern pattern;
  pattern.template_tokens = tracelens::logs::Tokenize(line);
  pattern.pattern_id      = pattern.Template();
  pattern.count           = count;
  pattern.severity_counts[severity] = count;
  return pattern;
}

void TestClassification() {
  const std::vector<LogPattern> baseline = {MakePattern("User <*> logged in", 100), MakePattern("Cache miss <*>", 50),
                                            MakePattern("Old job ran", 10)};
  const std::vector<LogPattern> comparison = {MakePattern("User <*> logged in", 100), MakePattern("Cache miss <*>", 150),
                                              MakePattern("Payment failed <*>", 20, "ERROR")};

  const auto result = PatternComparator().Compare(baseline, 0, comparison, 0);

  assert(result.baseline_total == 160);
  assert(result.comparison_total == 270);

  assert(result.new_patterns.size() == 1);
  assert(result.new_patterns[0].Template() == "Payment failed <*>");

  assert(result.increased.size() == 1);
  assert(result.increased[0].pattern.Template() == "Cache miss <*>");
  assert(result.increased[0].baseline_count == 50);
  assert(result.increased[0].comparison_count == 150);
  assert(std::fabs(result.increased[0].rate_change_pct - 77.777777) < 1e-3);

  // 62.5 % -> 37 % of traffic is a 41 % drop, inside the 50 % band
  assert(result.stable.size() == 1);
  assert(result.decreased.empty());

  assert(result.disappeared.size() == 1);
  assert(result.disappeared[0].Template() == "Old job ran");

  assert(result.alert_level == AlertLevel::kHigh);
}

void TestUniformGrowthIsStable() {
  const std::vector<LogPattern> baseline   = {MakePattern("GET /health ok", 100), MakePattern("Worker <*> idle", 50)};
  const std::vector<LogPattern> comparison = {MakePattern("GET /health ok", 1000), MakePattern("Worker <*> idle", 500)};

  const auto result = PatternComparator().Compare(baseline, 0, comparison, 0);
  assert(result.new_patterns.empty());
  assert(result.increased.empty());
  assert(result.decreased.empty());
  assert(result.stable.size() == 2);
  assert(result.alert_level == AlertLevel::kLow);
}

void TestSurgeRaisesMediumAlert() {
  const std::vector<LogPattern> baseline   = {MakePattern("Retrying request <*>", 10), MakePattern("Served page", 90)};
  const std::vector<LogPattern> comparison = {MakePattern("Retrying request <*>", 60), MakePattern("Served page", 40)};

  const auto result = PatternComparator().Compare(baseline, 100, comparison, 100);
  assert(result.increased.size() == 1);
  assert(result.increased[0].rate_change_pct > 200.0);
  assert(result.decreased.size() == 1);
  assert(result.alert_level == AlertLevel::kMedium);
}

void TestNegligibleBaselineCountsAsNew() {
  const std::vector<LogPattern> baseline   = {MakePattern("Disk nearly full", 1)};
  const std::vector<LogPattern> comparison = {MakePattern("Disk nearly full", 40)};

  const auto result = PatternComparator().Compare(baseline, 10'000, comparison, 100);
  assert(result.new_patterns.size() == 1);
  assert(result.disappeared.empty());
}

void TestManyNewPatternsRaiseMediumAlert() {
  std::vector<LogPattern> comparison;
  for (int i = 0; i < 6; ++i) {
    comparison.push_back(MakePattern("feature flag" + std::string(static_cast<std::size_t>(i + 1), 'x') + " enabled", 5));
  }

  const auto result = PatternComparator().Compare({}, 0, comparison, 0);
  assert(result.new_patterns.size() == 6);
  assert(result.alert_level == AlertLevel::kMedium);
}

void TestTemplateSimilarity() {
  const auto a = tracelens::logs::Tokenize("Connection to <*> closed");
  const auto b = tracelens::logs::Tokenize("Connection to db closed");
  const auto c = tracelens::logs::Tokenize("Connection from db opened");

  assert(PatternComparator::TemplateSimilarity(a, b) == 1.0);
  assert(PatternComparator::TemplateSimilarity(b, c) == 0.5);
  assert(PatternComparator::TemplateSimilarity(a, tracelens::logs::Tokenize("Connection closed")) == 0.0);
}

} // namespace

int main() {
  TestClassification();
  TestUniformGrowthIsStable();
  TestSurgeRaisesMediumAlert();
  TestNegligibleBaselineCountsAsNew();
  TestManyNewPatternsRaiseMediumAlert();
  TestTemplateSimilarity();

  std::cout << "tracelens_unit_pattern_comparator: pass\n";
  return 0;
}
