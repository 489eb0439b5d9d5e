#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "internal/model/log_record.hpp"

namespace tracelens::logs {

enum class AlertLevel : std::uint8_t {
  kLow,
  kMedium,
  kHigh,
};

std::string_view ToString(AlertLevel level);

struct PatternComparisonOptions {
  // Templates of equal length match when this share of the positions that
  // are literal on both sides agree.
  double match_threshold = 0.5;
  // Relative rate change beyond which a pattern counts as increased or
  // decreased (0.5 = 50 %).
  double significance_threshold = 0.5;
  // A baseline share at or below this is treated as absent.
  double negligible_baseline_rate = 0.001;
};

struct PatternChange {
  model::LogPattern pattern; // comparison-window pattern
  std::uint64_t     baseline_count   = 0;
  std::uint64_t     comparison_count = 0;
  double            rate_change_pct  = 0;
};

struct PatternComparison {
  std::vector<model::LogPattern> new_patterns;
  std::vector<PatternChange>     increased;
  std::vector<PatternChange>     decreased;
  std::vector<model::LogPattern> stable;
  std::vector<model::LogPattern> disappeared;
  std::uint64_t                  baseline_total   = 0;
  std::uint64_t                  comparison_total = 0;
  AlertLevel                     alert_level      = AlertLevel::kLow;
};

/*
  Compares pattern sets mined independently over a baseline and a
  comparison window. Counts are normalized by each window's traffic so
  uniform growth is not reported as change.
*/
class PatternComparator {
 public:
  explicit PatternComparator(PatternComparisonOptions options = {});

  // Totals of zero fall back to the sum of pattern counts.
  PatternComparison Compare(const std::vector<model::LogPattern>& baseline, std::uint64_t baseline_total,
                            const std::vector<model::LogPattern>& comparison, std::uint64_t comparison_total) const;

  // Share of aligned positions, literal on both sides, that agree. 0 when
  // the lengths differ.
  static double TemplateSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b);

  static AlertLevel DetermineAlertLevel(const PatternComparison& comparison);

 private:
  PatternComparisonOptions options_;
};

} // namespace tracelens::logs
