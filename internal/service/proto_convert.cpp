#include "internal/service/proto_convert.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace tracelens::service {

namespace v1 = tracelens::v1;

namespace {

model::SpanStatus FromProto(v1::SpanStatus status) {
  switch (status) {
    case v1::SPAN_STATUS_OK:
      return model::SpanStatus::kOk;
    case v1::SPAN_STATUS_ERROR:
      return model::SpanStatus::kError;
    default:
      return model::SpanStatus::kUnset;
  }
}

v1::SpanStatus ToProto(model::SpanStatus status) {
  switch (status) {
    case model::SpanStatus::kOk:
      return v1::SPAN_STATUS_OK;
    case model::SpanStatus::kError:
      return v1::SPAN_STATUS_ERROR;
    case model::SpanStatus::kUnset:
    default:
      return v1::SPAN_STATUS_UNSET;
  }
}

v1::IssueKind ToProto(trace::IssueKind kind) {
  switch (kind) {
    case trace::IssueKind::kMalformedSpan:
      return v1::ISSUE_KIND_MALFORMED_SPAN;
    case trace::IssueKind::kOrphanedSpan:
      return v1::ISSUE_KIND_ORPHANED_SPAN;
    case trace::IssueKind::kNegativeDuration:
      return v1::ISSUE_KIND_NEGATIVE_DURATION;
    case trace::IssueKind::kClockSkew:
      return v1::ISSUE_KIND_CLOCK_SKEW;
  }
  return v1::ISSUE_KIND_UNSPECIFIED;
}

v1::Trend ToProto(stats::Trend trend) {
  switch (trend) {
    case stats::Trend::kDegrading:
      return v1::TREND_DEGRADING;
    case stats::Trend::kImproving:
      return v1::TREND_IMPROVING;
    case stats::Trend::kStable:
    default:
      return v1::TREND_STABLE;
  }
}

v1::SpanBehavior ToProto(stats::SpanBehavior behavior) {
  switch (behavior) {
    case stats::SpanBehavior::kRecurringSlowdown:
      return v1::SPAN_BEHAVIOR_RECURRING_SLOWDOWN;
    case stats::SpanBehavior::kIntermittent:
      return v1::SPAN_BEHAVIOR_INTERMITTENT;
    case stats::SpanBehavior::kHighVariance:
      return v1::SPAN_BEHAVIOR_HIGH_VARIANCE;
  }
  return v1::SPAN_BEHAVIOR_UNSPECIFIED;
}

v1::Impact ToProto(model::Impact impact) {
  switch (impact) {
    case model::Impact::kLow:
      return v1::IMPACT_LOW;
    case model::Impact::kMedium:
      return v1::IMPACT_MEDIUM;
    case model::Impact::kHigh:
      return v1::IMPACT_HIGH;
    case model::Impact::kCritical:
      return v1::IMPACT_CRITICAL;
  }
  return v1::IMPACT_UNSPECIFIED;
}

v1::Recommendation::Priority ToProto(trace::Priority priority) {
  switch (priority) {
    case trace::Priority::kLow:
      return v1::Recommendation::PRIORITY_LOW;
    case trace::Priority::kMedium:
      return v1::Recommendation::PRIORITY_MEDIUM;
    case trace::Priority::kHigh:
      return v1::Recommendation::PRIORITY_HIGH;
  }
  return v1::Recommendation::PRIORITY_UNSPECIFIED;
}

void FillPatternSpans(const model::PatternSpans& common, v1::AntiPatternFinding* out) {
  for (const auto& name : common.span_names) {
    out->add_span_names(name);
  }
  for (const auto& id : common.span_ids) {
    out->add_span_ids(id);
  }
  out->set_count(static_cast<std::uint32_t>(common.count));
  out->set_total_duration_ms(common.total_duration_ms);
  out->set_impact(ToProto(common.impact));
  out->set_recommendation(common.recommendation);
  out->set_description(common.description);
}

} // namespace

// ------------------------------------------------------------
// Inbound
// ------------------------------------------------------------

model::TraceRecord FromProto(const v1::Trace& trace) {
  model::TraceRecord record;
  record.trace_id = trace.trace_id();
  record.spans.reserve(static_cast<std::size_t>(trace.spans_size()));

  for (const auto& span : trace.spans()) {
    model::SpanRecord out;
    out.span_id        = span.span_id();
    out.parent_span_id = span.parent_span_id();
    out.name           = span.name();
    out.status         = FromProto(span.status());
    if (span.has_start_time()) {
      out.start_ms = util::ToEpochMillis(span.start_time());
    }
    if (span.has_end_time()) {
      out.end_ms = util::ToEpochMillis(span.end_time());
    }
    out.attributes.insert(span.attributes().begin(), span.attributes().end());
    record.spans.push_back(std::move(out));
  }
  return record;
}

model::LogWindow FromProto(const v1::LogWindow& window) {
  model::LogWindow out;
  out.window_id = window.window_id();
  out.records.reserve(static_cast<std::size_t>(window.records_size()));

  for (const auto& record : window.records()) {
    model::LogRecord log;
    if (record.has_timestamp()) {
      log.timestamp = util::FromProto(record.timestamp());
    }
    log.severity = record.severity();
    log.message  = record.message();
    log.resource = record.resource();
    out.records.push_back(std::move(log));
  }
  return out;
}

std::vector<v1::Sample> OrderedSamples(const v1::SampleSeries& series) {
  std::vector<v1::Sample> samples(series.samples().begin(), series.samples().end());

  const bool timed = !samples.empty() && std::all_of(samples.begin(), samples.end(), [](const v1::Sample& s) { return s.has_timestamp(); });
  if (timed) {
    std::stable_sort(samples.begin(), samples.end(), [](const v1::Sample& a, const v1::Sample& b) {
      return util::ToEpochMillis(a.timestamp()) < util::ToEpochMillis(b.timestamp());
    });
  }
  return samples;
}

std::vector<double> Values(const std::vector<v1::Sample>& samples) {
  std::vector<double> values;
  values.reserve(samples.size());
  for (const auto& sample : samples) {
    values.push_back(sample.value());
  }
  return values;
}

// ------------------------------------------------------------
// Traces
// ------------------------------------------------------------

v1::DataQualityReport ToProto(const trace::TraceForest& forest) {
  const auto& quality = forest.quality();

  v1::DataQualityReport out;
  out.set_trace_id(forest.trace_id());
  out.set_valid(quality.valid());
  out.set_issue_count(static_cast<std::uint32_t>(quality.issue_count()));
  out.set_span_count(static_cast<std::uint32_t>(forest.size()));
  for (const auto& issue : quality.issues) {
    auto* item = out.add_issues();
    item->set_kind(ToProto(issue.kind));
    item->set_span_id(issue.span_id);
    item->set_message(issue.message);
  }
  return out;
}

v1::CriticalPathNode ToProto(const trace::CriticalPathNode& node) {
  v1::CriticalPathNode out;
  out.set_span_id(node.span_id);
  out.set_name(node.name);
  out.set_self_time_ms(node.self_time_ms);
  out.set_duration_ms(node.duration_ms);
  out.set_contribution_pct(node.contribution_pct);
  out.set_blocking_contribution_pct(node.blocking_contribution_pct);
  out.set_depth(static_cast<std::uint32_t>(node.depth));
  out.set_start_offset_ms(node.start_offset_ms);
  out.set_service(node.service);
  return out;
}

v1::ParallelOpportunity ToProto(const trace::ParallelOpportunity& opportunity) {
  v1::ParallelOpportunity out;
  out.set_parent_span_id(opportunity.parent_span_id);
  out.set_service(opportunity.service);
  out.set_span_count(static_cast<std::uint32_t>(opportunity.span_count));
  for (const auto& name : opportunity.span_names) {
    out.add_span_names(name);
  }
  out.set_total_sequential_ms(opportunity.total_sequential_ms);
  out.set_parallel_ms(opportunity.parallel_ms);
  out.set_savings_ms(opportunity.savings_ms);
  out.set_recommendation(opportunity.recommendation);
  return out;
}

v1::Recommendation ToProto(const trace::Recommendation& recommendation) {
  v1::Recommendation out;
  out.set_priority(ToProto(recommendation.priority));
  out.set_kind(recommendation.kind);
  out.set_target(recommendation.target);
  out.set_service(recommendation.service);
  out.set_current_ms(recommendation.current_ms);
  out.set_recommendation(recommendation.recommendation);
  for (const auto& step : recommendation.investigation_steps) {
    out.add_investigation_steps(step);
  }
  return out;
}

v1::CriticalPathReport ToProto(const trace::CriticalPathReport& report) {
  v1::CriticalPathReport out;
  for (const auto& node : report.path) {
    *out.add_path() = ToProto(node);
  }
  out.set_critical_path_ms(report.critical_path_ms);
  out.set_total_duration_ms(report.total_duration_ms);
  out.set_parallelism_ratio(report.parallelism_ratio);
  out.set_parallelism_pct(report.parallelism_pct);
  out.set_bottleneck_span_id(report.bottleneck_span_id);
  for (const auto& opportunity : report.parallel_opportunities) {
    *out.add_parallel_opportunities() = ToProto(opportunity);
  }
  for (const auto& recommendation : report.recommendations) {
    *out.add_recommendations() = ToProto(recommendation);
  }
  return out;
}

v1::AntiPatternFinding ToProto(const model::AntiPatternFinding& finding) {
  v1::AntiPatternFinding out;
  FillPatternSpans(model::Common(finding), &out);

  if (const auto* n_plus_one = std::get_if<model::NPlusOne>(&finding)) {
    out.mutable_n_plus_one()->set_parent_span_id(n_plus_one->parent_span_id);
  } else if (const auto* chain = std::get_if<model::SerialChain>(&finding)) {
    out.mutable_serial_chain()->set_max_gap_ms(chain->max_gap_ms);
  } else if (const auto* storm = std::get_if<model::RetryStorm>(&finding)) {
    out.mutable_retry_storm()->set_has_exponential_backoff(storm->has_exponential_backoff);
  } else if (const auto* cascade = std::get_if<model::CascadingTimeout>(&finding)) {
    out.mutable_cascading_timeout()->set_origin_span_id(cascade->origin_span_id);
  } else if (const auto* pool = std::get_if<model::ConnectionPoolIssue>(&finding)) {
    auto* detail = out.mutable_connection_pool();
    detail->set_max_wait_ms(pool->max_wait_ms);
    detail->set_pool_exhausted(pool->pool_exhausted);
    detail->set_pool_size(pool->pool_size);
    detail->set_active_connections(pool->active_connections);
    detail->set_waiting_requests(pool->waiting_requests);
  }
  return out;
}

v1::SpanIdentity ToProto(const model::SpanIdentity& identity) {
  v1::SpanIdentity out;
  out.set_key(identity.key);
  out.set_name(identity.name);
  out.set_baseline_span_id(identity.baseline_span_id);
  out.set_target_span_id(identity.target_span_id);
  return out;
}

v1::RootCauseCandidate ToProto(const model::RootCauseCandidate& candidate) {
  v1::RootCauseCandidate out;
  out.set_span_id(candidate.span_id);
  out.set_span_name(candidate.span_name);
  out.set_diff_ms(candidate.diff_ms);
  out.set_diff_percent(candidate.diff_percent);
  out.set_baseline_ms(candidate.baseline_ms);
  out.set_target_ms(candidate.target_ms);
  out.set_on_critical_path(candidate.on_critical_path);
  out.set_self_time_ms(candidate.self_time_ms);
  out.set_depth(static_cast<std::uint32_t>(candidate.depth));
  out.set_confidence_score(candidate.confidence_score);
  out.set_is_likely_root_cause(candidate.is_likely_root_cause);
  return out;
}

v1::StructureSummary ToProto(const trace::StructureSummary& structure, trace::MatchStrategy strategy) {
  v1::StructureSummary out;
  out.set_baseline_span_count(static_cast<std::uint32_t>(structure.baseline_span_count));
  out.set_target_span_count(static_cast<std::uint32_t>(structure.target_span_count));
  out.set_baseline_depth(static_cast<std::uint32_t>(structure.baseline_depth));
  out.set_target_depth(static_cast<std::uint32_t>(structure.target_depth));
  out.set_depth_change(static_cast<std::int32_t>(structure.depth_change));
  out.set_match_strategy(std::string(trace::ToString(strategy)));
  return out;
}

void AppendDiffs(const trace::TraceDiff& diff, v1::ComparisonReport* report) {
  for (const auto& record : diff.diffs) {
    if (const auto* latency = std::get_if<model::LatencyDiff>(&record)) {
      auto* out            = report->add_latency_diffs();
      *out->mutable_span() = ToProto(latency->span);
      out->set_baseline_ms(latency->baseline_ms);
      out->set_target_ms(latency->target_ms);
      out->set_diff_ms(latency->diff_ms);
      out->set_diff_percent(latency->diff_percent);
    } else if (const auto* error = std::get_if<model::ErrorDiff>(&record)) {
      auto* out            = report->add_error_diffs();
      *out->mutable_span() = ToProto(error->span);
      out->set_baseline_status(ToProto(error->baseline_status));
      out->set_target_status(ToProto(error->target_status));
      out->set_diff_ms(error->diff_ms);
      out->set_diff_percent(error->diff_percent);
    } else if (const auto* structure = std::get_if<model::StructureDiff>(&record)) {
      auto* out            = report->add_structure_diffs();
      *out->mutable_span() = ToProto(structure->span);
      out->set_change(structure->change == model::StructureChange::kAdded ? v1::StructureDiff::CHANGE_ADDED : v1::StructureDiff::CHANGE_REMOVED);
      out->set_diff_ms(structure->diff_ms);
      out->set_diff_percent(structure->diff_percent);
    }
  }
}

// ------------------------------------------------------------
// Statistics
// ------------------------------------------------------------

v1::SummaryStatistics ToProto(const stats::SummaryStatistics& summary) {
  v1::SummaryStatistics out;
  out.set_count(summary.count);
  out.set_min(summary.min);
  out.set_max(summary.max);
  out.set_mean(summary.mean);
  out.set_stddev(summary.stddev);
  out.set_p50(summary.percentiles.p50);
  out.set_p90(summary.percentiles.p90);
  out.set_p95(summary.percentiles.p95);
  out.set_p99(summary.percentiles.p99);
  return out;
}

v1::ZScoreResult ToProto(const stats::ZScoreResult& result) {
  v1::ZScoreResult out;
  out.set_z_score(result.z_score);
  out.set_is_anomaly(result.is_anomaly);
  out.set_current_mean(result.current_mean);
  out.set_historical_mean(result.historical_mean);
  out.set_historical_stddev(result.historical_stddev);
  return out;
}

v1::TrendResult ToProto(const stats::TrendResult& result) {
  v1::TrendResult out;
  out.set_trend(ToProto(result.trend));
  out.set_first_half_mean(result.first_half_mean);
  out.set_second_half_mean(result.second_half_mean);
  out.set_pct_change(result.pct_change);
  return out;
}

v1::WindowComparison ToProto(const stats::WindowComparison& result) {
  v1::WindowComparison out;
  out.set_baseline_mean(result.baseline_mean);
  out.set_target_mean(result.target_mean);
  out.set_shift(result.shift);
  out.set_shift_pct(result.shift_pct);
  out.set_significant(result.significant);
  return out;
}

v1::SpanVariability ToProto(const stats::SpanVariability& variability) {
  v1::SpanVariability out;
  out.set_span_name(variability.span_name);
  out.set_occurrences(variability.occurrences);
  out.set_mean_ms(variability.mean_ms);
  out.set_stddev_ms(variability.stddev_ms);
  out.set_coefficient_of_variation(variability.coefficient_of_variation);
  out.set_p50_ms(variability.p50_ms);
  out.set_p95_ms(variability.p95_ms);
  for (auto behavior : variability.behaviors) {
    out.add_behaviors(ToProto(behavior));
  }
  return out;
}

v1::ServiceStats ToProto(const stats::ServiceStats& service) {
  v1::ServiceStats out;
  out.set_service(service.service);
  out.set_request_count(service.request_count);
  out.set_error_rate_pct(service.error_rate_pct);
  out.set_avg_latency_ms(service.avg_latency_ms);
  return out;
}

v1::BottleneckOperation ToProto(const stats::BottleneckOperation& operation) {
  v1::BottleneckOperation out;
  out.set_service(operation.service);
  out.set_operation(operation.operation);
  out.set_trace_count(static_cast<std::uint32_t>(operation.trace_count));
  out.set_avg_contribution_pct(operation.avg_contribution_pct);
  out.set_p95_contribution_pct(operation.p95_contribution_pct);
  out.set_avg_duration_ms(operation.avg_duration_ms);
  out.set_p95_duration_ms(operation.p95_duration_ms);
  out.set_error_rate_pct(operation.error_rate_pct);
  out.set_bottleneck_score(operation.bottleneck_score);
  return out;
}

// ------------------------------------------------------------
// Logs
// ------------------------------------------------------------

v1::LogPattern ToProto(const model::LogPattern& pattern) {
  v1::LogPattern out;
  out.set_cluster_id(pattern.cluster_id);
  out.set_pattern_id(pattern.pattern_id);
  out.set_template_(pattern.Template());
  out.set_count(pattern.count);
  for (const auto& [severity, count] : pattern.severity_counts) {
    (*out.mutable_severity_counts())[severity] = count;
  }
  if (pattern.first_seen) {
    *out.mutable_first_seen() = util::ToProto(*pattern.first_seen);
  }
  if (pattern.last_seen) {
    *out.mutable_last_seen() = util::ToProto(*pattern.last_seen);
  }
  for (const auto& sample : pattern.sample_messages) {
    out.add_sample_messages(sample);
  }
  return out;
}

v1::PatternChange ToProto(const logs::PatternChange& change) {
  v1::PatternChange out;
  *out.mutable_pattern() = ToProto(change.pattern);
  out.set_baseline_count(change.baseline_count);
  out.set_comparison_count(change.comparison_count);
  out.set_rate_change_pct(change.rate_change_pct);
  return out;
}

v1::LogPatternSummary ToProto(const logs::PatternSummary& summary) {
  v1::LogPatternSummary out;
  out.set_total_logs(summary.total_logs);
  out.set_unique_patterns(summary.unique_patterns);
  out.set_unmatched_logs(summary.unmatched_logs);
  for (const auto& [severity, count] : summary.severity_distribution) {
    (*out.mutable_severity_distribution())[severity] = count;
  }
  out.set_compression_ratio(summary.compression_ratio);
  for (const auto& pattern : summary.top_patterns) {
    *out.add_top_patterns() = ToProto(pattern);
  }
  for (const auto& pattern : summary.error_patterns) {
    *out.add_error_patterns() = ToProto(pattern);
  }
  return out;
}

v1::AlertLevel ToProto(logs::AlertLevel level) {
  switch (level) {
    case logs::AlertLevel::kHigh:
      return v1::ALERT_LEVEL_HIGH;
    case logs::AlertLevel::kMedium:
      return v1::ALERT_LEVEL_MEDIUM;
    case logs::AlertLevel::kLow:
    default:
      return v1::ALERT_LEVEL_LOW;
  }
}

} // namespace tracelens::service
