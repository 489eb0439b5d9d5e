#pragma once

#include <string>
#include <vector>

#include "internal/logs/log_template_miner.hpp"
#include "internal/logs/pattern_comparator.hpp"
#include "internal/model/findings.hpp"
#include "internal/model/log_record.hpp"
#include "internal/model/span.hpp"
#include "internal/stats/span_patterns.hpp"
#include "internal/stats/statistics.hpp"
#include "internal/trace/critical_path.hpp"
#include "internal/trace/trace_comparator.hpp"
#include "internal/trace/trace_forest.hpp"
#include "tracelens/v1.hpp"

namespace tracelens::service {

/*
  Wire <-> domain conversion.

  Inbound conversion never validates; the analyzers report defects. Spans
  without a start or end timestamp keep the corresponding field unset.
*/

// ------------------------------------------------------------
// Inbound
// ------------------------------------------------------------

model::TraceRecord FromProto(const tracelens::v1::Trace& trace);
model::LogWindow   FromProto(const tracelens::v1::LogWindow& window);

// Samples ordered by timestamp when every sample carries one, otherwise in
// the order given.
std::vector<tracelens::v1::Sample> OrderedSamples(const tracelens::v1::SampleSeries& series);
std::vector<double>                Values(const std::vector<tracelens::v1::Sample>& samples);

// ------------------------------------------------------------
// Traces
// ------------------------------------------------------------

tracelens::v1::DataQualityReport  ToProto(const trace::TraceForest& forest);
tracelens::v1::CriticalPathNode   ToProto(const trace::CriticalPathNode& node);
tracelens::v1::ParallelOpportunity ToProto(const trace::ParallelOpportunity& opportunity);
tracelens::v1::Recommendation     ToProto(const trace::Recommendation& recommendation);
tracelens::v1::CriticalPathReport ToProto(const trace::CriticalPathReport& report);
tracelens::v1::AntiPatternFinding ToProto(const model::AntiPatternFinding& finding);
tracelens::v1::SpanIdentity       ToProto(const model::SpanIdentity& identity);
tracelens::v1::RootCauseCandidate ToProto(const model::RootCauseCandidate& candidate);
tracelens::v1::StructureSummary   ToProto(const trace::StructureSummary& structure, trace::MatchStrategy strategy);

// Splits the tagged diffs into the report's typed lists.
void AppendDiffs(const trace::TraceDiff& diff, tracelens::v1::ComparisonReport* report);

// ------------------------------------------------------------
// Statistics
// ------------------------------------------------------------

tracelens::v1::SummaryStatistics ToProto(const stats::SummaryStatistics& summary);
tracelens::v1::ZScoreResult      ToProto(const stats::ZScoreResult& result);
tracelens::v1::TrendResult       ToProto(const stats::TrendResult& result);
tracelens::v1::WindowComparison  ToProto(const stats::WindowComparison& result);
tracelens::v1::SpanVariability   ToProto(const stats::SpanVariability& variability);
tracelens::v1::ServiceStats      ToProto(const stats::ServiceStats& service);
tracelens::v1::BottleneckOperation ToProto(const stats::BottleneckOperation& operation);

// ------------------------------------------------------------
// Logs
// ------------------------------------------------------------

tracelens::v1::LogPattern        ToProto(const model::LogPattern& pattern);
tracelens::v1::PatternChange     ToProto(const logs::PatternChange& change);
tracelens::v1::LogPatternSummary ToProto(const logs::PatternSummary& summary);
tracelens::v1::AlertLevel        ToProto(logs::AlertLevel level);

} // namespace tracelens::service
