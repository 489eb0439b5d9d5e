#include "internal/logs/pattern_comparator.hpp"

#include <algorithm>
#include <optional>

#include "internal/logs/token_masker.hpp"

namespace tracelens::logs {

namespace {

std::uint64_t SumCounts(const std::vector<model::LogPattern>& patterns) {
  std::uint64_t total = 0;
  for (const auto& p : patterns) {
    total += p.count;
  }
  return total;
}

int DominantRank(const model::LogPattern& pattern) {
  return model::SeverityRank(pattern.DominantSeverity());
}

} // namespace

std::string_view ToString(AlertLevel level) {
  switch (level) {
    case AlertLevel::kHigh:
      return "high";
    case AlertLevel::kMedium:
      return "medium";
    case AlertLevel::kLow:
    default:
      return "low";
  }
}

PatternComparator::PatternComparator(PatternComparisonOptions options) : options_(options) {
}

double PatternComparator::TemplateSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  if (a.size() != b.size()) {
    return 0.0;
  }
  std::size_t considered = 0;
  std::size_t matched    = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (IsWildcard(a[i]) || IsWildcard(b[i])) {
      continue;
    }
    ++considered;
    if (a[i] == b[i]) {
      ++matched;
    }
  }
  return considered == 0 ? 1.0 : static_cast<double>(matched) / static_cast<double>(considered);
}

AlertLevel PatternComparator::DetermineAlertLevel(const PatternComparison& comparison) {
  const bool new_errors = std::any_of(comparison.new_patterns.begin(), comparison.new_patterns.end(),
                                      [](const model::LogPattern& p) { return p.HasErrorSeverity(); });
  if (new_errors) {
    return AlertLevel::kHigh;
  }
  if (comparison.new_patterns.size() > 5) {
    return AlertLevel::kMedium;
  }
  const bool surge = std::any_of(comparison.increased.begin(), comparison.increased.end(),
                                 [](const PatternChange& change) { return change.rate_change_pct > 200.0; });
  return surge ? AlertLevel::kMedium : AlertLevel::kLow;
}

PatternComparison PatternComparator::Compare(const std::vector<model::LogPattern>& baseline, std::uint64_t baseline_total,
                                             const std::vector<model::LogPattern>& comparison, std::uint64_t comparison_total) const {
  PatternComparison result;
  result.baseline_total   = baseline_total > 0 ? baseline_total : SumCounts(baseline);
  result.comparison_total = comparison_total > 0 ? comparison_total : SumCounts(comparison);

  const double total1 = static_cast<double>(std::max<std::uint64_t>(result.baseline_total, 1));
  const double total2 = static_cast<double>(std::max<std::uint64_t>(result.comparison_total, 1));

  std::vector<bool> baseline_matched(baseline.size(), false);

  for (const auto& pattern : comparison) {
    std::optional<std::size_t> match;
    double                     best = -1.0;
    for (std::size_t i = 0; i < baseline.size(); ++i) {
      double similarity = baseline[i].pattern_id == pattern.pattern_id ? 1.0 : TemplateSimilarity(baseline[i].template_tokens, pattern.template_tokens);
      if (similarity >= options_.match_threshold && similarity > best) {
        best  = similarity;
        match = i;
      }
    }

    if (!match) {
      result.new_patterns.push_back(pattern);
      continue;
    }
    baseline_matched[*match] = true;

    const auto&  previous = baseline[*match];
    const double rate1    = static_cast<double>(previous.count) / total1;
    const double rate2    = static_cast<double>(pattern.count) / total2;

    if (rate1 <= options_.negligible_baseline_rate) {
      result.new_patterns.push_back(pattern);
      continue;
    }

    const double change = (rate2 - rate1) / rate1;

    PatternChange delta;
    delta.pattern          = pattern;
    delta.baseline_count   = previous.count;
    delta.comparison_count = pattern.count;
    delta.rate_change_pct  = change * 100.0;

    if (change > options_.significance_threshold) {
      result.increased.push_back(std::move(delta));
    } else if (change < -options_.significance_threshold) {
      result.decreased.push_back(std::move(delta));
    } else {
      result.stable.push_back(pattern);
    }
  }

  for (std::size_t i = 0; i < baseline.size(); ++i) {
    if (!baseline_matched[i]) {
      result.disappeared.push_back(baseline[i]);
    }
  }

  std::stable_sort(result.new_patterns.begin(), result.new_patterns.end(), [](const model::LogPattern& a, const model::LogPattern& b) {
    if (a.count != b.count) return a.count > b.count;
    return DominantRank(a) > DominantRank(b);
  });
  std::stable_sort(result.increased.begin(), result.increased.end(),
                   [](const PatternChange& a, const PatternChange& b) { return a.rate_change_pct > b.rate_change_pct; });
  std::stable_sort(result.decreased.begin(), result.decreased.end(),
                   [](const PatternChange& a, const PatternChange& b) { return a.rate_change_pct < b.rate_change_pct; });

  result.alert_level = DetermineAlertLevel(result);
  return result;
}

} // namespace tracelens::logs
