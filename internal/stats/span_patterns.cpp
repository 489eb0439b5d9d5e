#include "internal/stats/span_patterns.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <utility>

#include "internal/util/errors.hpp"

namespace tracelens::stats {

std::string_view ToString(SpanBehavior behavior) {
  switch (behavior) {
    case SpanBehavior::kRecurringSlowdown:
      return "recurring_slowdown";
    case SpanBehavior::kIntermittent:
      return "intermittent";
    case SpanBehavior::kHighVariance:
      return "high_variance";
  }
  return "unknown";
}

SpanPatternAnalyzer::SpanPatternAnalyzer(StatisticsOptions options) : engine_(options) {
}

std::vector<SpanBehavior> SpanPatternAnalyzer::Classify(double mean_ms, double cv, std::size_t occurrences) {
  std::vector<SpanBehavior> behaviors;
  if (mean_ms > 100.0 && cv < 0.3) {
    behaviors.push_back(SpanBehavior::kRecurringSlowdown);
  }
  if (cv > 0.5 && mean_ms > 50.0) {
    behaviors.push_back(SpanBehavior::kIntermittent);
  }
  if (cv > 0.7 && occurrences >= 3) {
    behaviors.push_back(SpanBehavior::kHighVariance);
  }
  return behaviors;
}

SpanPatternReport SpanPatternAnalyzer::Analyze(const std::vector<trace::TraceForest>& traces) const {
  if (traces.size() < kMinSamples) {
    throw util::InsufficientData("span pattern analysis needs at least " + std::to_string(kMinSamples) + " traces, got " +
                                 std::to_string(traces.size()));
  }

  SpanPatternReport report;
  report.trace_count = traces.size();

  std::map<std::string, std::vector<double>> durations;
  std::vector<double>                        totals;
  totals.reserve(traces.size());

  for (const auto& forest : traces) {
    totals.push_back(forest.TotalDurationMs());
    for (const auto& node : forest.spans()) {
      if (node.temporal_valid) {
        durations[node.name].push_back(node.DurationMs());
      }
    }
  }

  for (const auto& [name, values] : durations) {
    if (values.size() < 2) {
      continue;
    }

    SpanVariability variability;
    variability.span_name                = name;
    variability.occurrences              = values.size();
    variability.mean_ms                  = Mean(values);
    variability.stddev_ms                = SampleStddev(values);
    variability.coefficient_of_variation = variability.mean_ms > 0 ? variability.stddev_ms / variability.mean_ms : 0.0;
    variability.p50_ms                   = Percentile(values, 0.50);
    variability.p95_ms                   = Percentile(values, 0.95);
    variability.behaviors                = Classify(variability.mean_ms, variability.coefficient_of_variation, variability.occurrences);

    if (!variability.behaviors.empty()) {
      report.spans.push_back(std::move(variability));
    }
  }

  std::sort(report.spans.begin(), report.spans.end(), [](const SpanVariability& a, const SpanVariability& b) {
    const double impact_a = a.mean_ms * static_cast<double>(a.occurrences);
    const double impact_b = b.mean_ms * static_cast<double>(b.occurrences);
    if (impact_a != impact_b) return impact_a > impact_b;
    return a.span_name < b.span_name;
  });

  report.bottlenecks    = FindBottlenecks(traces);
  report.duration_trend = engine_.DetectTrend(totals);
  return report;
}

std::vector<ServiceStats> SpanPatternAnalyzer::ServiceLevelStats(const std::vector<trace::TraceForest>& traces) {
  struct Totals {
    std::size_t requests = 0;
    std::size_t errors   = 0;
    std::size_t timed    = 0;
    double      duration = 0;
  };
  std::map<std::string, Totals> by_service;

  for (const auto& forest : traces) {
    for (const auto& node : forest.spans()) {
      auto& totals = by_service[node.service];
      ++totals.requests;
      if (node.error) {
        ++totals.errors;
      }
      if (node.temporal_valid) {
        ++totals.timed;
        totals.duration += node.DurationMs();
      }
    }
  }

  std::vector<ServiceStats> out;
  out.reserve(by_service.size());
  for (const auto& [service, totals] : by_service) {
    ServiceStats stats;
    stats.service        = service;
    stats.request_count  = totals.requests;
    stats.error_rate_pct = std::round(static_cast<double>(totals.errors) / static_cast<double>(totals.requests) * 10000.0) / 100.0;
    stats.avg_latency_ms = totals.timed > 0 ? totals.duration / static_cast<double>(totals.timed) : 0.0;
    out.push_back(std::move(stats));
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const ServiceStats& a, const ServiceStats& b) { return a.request_count > b.request_count; });
  return out;
}

std::vector<BottleneckOperation> SpanPatternAnalyzer::FindBottlenecks(const std::vector<trace::TraceForest>& traces,
                                                                      std::size_t                            min_traces) {
  struct Samples {
    std::set<std::size_t> traces;
    std::vector<double>   durations;
    std::vector<double>   contributions;
    std::size_t           errors = 0;
  };
  std::map<std::pair<std::string, std::string>, Samples> by_operation;

  for (std::size_t t = 0; t < traces.size(); ++t) {
    const auto& forest = traces[t];
    const double total = forest.TotalDurationMs();
    if (total <= 0 || forest.spans().size() < 2) {
      continue;
    }
    for (const auto& node : forest.spans()) {
      if (!node.temporal_valid || node.service == "unknown") {
        continue;
      }
      auto& samples = by_operation[{node.service, node.name}];
      samples.traces.insert(t);
      samples.durations.push_back(node.DurationMs());
      samples.contributions.push_back(node.DurationMs() / total * 100.0);
      if (node.error) {
        ++samples.errors;
      }
    }
  }

  const double floor = static_cast<double>(std::max<std::size_t>(min_traces, 1));

  std::vector<BottleneckOperation> out;
  for (const auto& [key, samples] : by_operation) {
    if (samples.traces.size() < min_traces) {
      continue;
    }

    BottleneckOperation op;
    op.service              = key.first;
    op.operation            = key.second;
    op.trace_count          = samples.traces.size();
    op.avg_contribution_pct = Mean(samples.contributions);
    op.p95_contribution_pct = Percentile(samples.contributions, 0.95);
    op.avg_duration_ms      = Mean(samples.durations);
    op.p95_duration_ms      = Percentile(samples.durations, 0.95);
    op.error_rate_pct       = static_cast<double>(samples.errors) / static_cast<double>(samples.durations.size()) * 100.0;
    op.bottleneck_score     = op.avg_contribution_pct * 0.4 + op.p95_duration_ms / 100.0 * 0.3 +
                          static_cast<double>(op.trace_count) / floor * 0.3;
    out.push_back(std::move(op));
  }

  std::stable_sort(out.begin(), out.end(), [](const BottleneckOperation& a, const BottleneckOperation& b) {
    return a.bottleneck_score > b.bottleneck_score;
  });
  if (out.size() > kMaxBottlenecks) {
    out.resize(kMaxBottlenecks);
  }
  return out;
}

} // namespace tracelens::stats
