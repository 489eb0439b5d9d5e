#include "trace_analysis_service.hpp"

#include <future>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/fan_out.hpp"
#include "internal/service/observe.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/stats/span_patterns.hpp"
#include "internal/trace/anti_patterns.hpp"
#include "internal/trace/critical_path.hpp"
#include "internal/trace/root_cause_scorer.hpp"
#include "internal/trace/trace_comparator.hpp"
#include "internal/trace/trace_forest.hpp"
#include "internal/util/errors.hpp"

namespace tracelens::service {

using namespace tracelens::v1;

namespace {

void RecordFindingMetrics(const std::vector<model::AntiPatternFinding>& findings) {
  std::map<std::string_view, std::uint64_t> by_kind;
  for (const auto& finding : findings) {
    ++by_kind[model::KindName(finding)];
  }
  for (const auto& [kind, count] : by_kind) {
    observability::Metrics::Instance().RecordFindings(kind, count);
  }
}

const Trace& RequireTrace(bool present, const Trace& trace, const char* field) {
  if (!present) {
    throw util::InvalidArgument(std::string(field) + " trace is required");
  }
  return trace;
}

} // namespace

TraceAnalysisService::TraceAnalysisService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------
// Comparison
// ------------------------------------------------------------

CompareTracesResponse TraceAnalysisService::CompareTraces(const CompareTracesRequest& req) {
  return ObserveAnalysis("TraceAnalysisService.CompareTraces", [&] {
    const auto baseline_record = FromProto(RequireTrace(req.has_baseline(), req.baseline(), "baseline"));
    const auto target_record   = FromProto(RequireTrace(req.has_target(), req.target(), "target"));

    FanOut fan(ctx_.workers.get());

    // Either trace being empty fails the whole comparison.
    std::vector<std::future<trace::TraceForest>> building;
    building.push_back(fan.Submit([&] { return trace::TraceForest::Build(baseline_record); }));
    building.push_back(fan.Submit([&] { return trace::TraceForest::Build(target_record); }));
    const auto  forests  = GetAll(building);
    const auto& baseline = forests[0];
    const auto& target   = forests[1];

    const auto& settings = ctx_.settings;

    auto baseline_cp_future = fan.Submit([&] { return trace::CriticalPathAnalyzer().Analyze(baseline); });
    auto target_cp_future   = fan.Submit([&] { return trace::CriticalPathAnalyzer().Analyze(target); });
    auto findings_future    = fan.Submit([&] { return trace::AntiPatternDetector(settings.anti_patterns).Detect(target); });
    auto diff_future        = fan.Submit([&] { return trace::TraceComparator(settings.comparator).Compare(baseline, target); });

    WaitGuard pending;
    pending.Track(baseline_cp_future);
    pending.Track(target_cp_future);
    pending.Track(findings_future);
    pending.Track(diff_future);

    CompareTracesResponse resp;
    auto*                 notes = resp.mutable_notes();

    auto baseline_cp = Collect(baseline_cp_future, "baseline_critical_path", notes);
    auto target_cp   = Collect(target_cp_future, "target_critical_path", notes);
    auto findings    = Collect(findings_future, "anti_patterns", notes);
    auto diff        = Collect(diff_future, "trace_diff", notes);

    auto* report = resp.mutable_report();
    report->set_baseline_trace_id(baseline.trace_id());
    report->set_target_trace_id(target.trace_id());

    if (diff) {
      AppendDiffs(*diff, report);
      *report->mutable_structure() = ToProto(diff->structure, diff->strategy);
    }

    if (baseline_cp) {
      *report->mutable_baseline_critical_path() = ToProto(*baseline_cp);
    }
    if (target_cp) {
      *report->mutable_target_critical_path() = ToProto(*target_cp);
      for (const auto& node : target_cp->path) {
        *report->add_critical_path() = ToProto(node);
      }
      report->set_parallelism_ratio(target_cp->parallelism_ratio);
      report->set_parallelism_pct(target_cp->parallelism_pct);
    }

    if (findings) {
      for (const auto& finding : *findings) {
        *report->add_anti_patterns() = ToProto(finding);
      }
      RecordFindingMetrics(*findings);
    }

    if (diff && target_cp) {
      const auto candidates = trace::RootCauseScorer(settings.scorer).Rank(*diff, target, *target_cp);
      for (const auto& candidate : candidates) {
        *report->add_root_cause_candidates() = ToProto(candidate);
      }
      observability::Metrics::Instance().RecordFindings("root_cause_candidate", candidates.size());
    } else {
      AddNote(notes, "root_cause", "requires both the trace diff and the target critical path");
    }

    *resp.mutable_baseline_quality() = ToProto(baseline);
    *resp.mutable_target_quality()   = ToProto(target);

    TRACELENS_LOG_DEBUG("Traces compared", {observability::StringField("baseline", baseline.trace_id()),
                                            observability::StringField("target", target.trace_id()),
                                            observability::IntField("diffs", diff ? static_cast<std::int64_t>(diff->diffs.size()) : 0),
                                            observability::IntField("notes", resp.notes_size())});
    return resp;
  });
}

// ------------------------------------------------------------
// Single trace
// ------------------------------------------------------------

AnalyzeTraceResponse TraceAnalysisService::AnalyzeTrace(const AnalyzeTraceRequest& req) {
  return ObserveAnalysis("TraceAnalysisService.AnalyzeTrace", [&] {
    const auto forest = trace::TraceForest::Build(FromProto(RequireTrace(req.has_trace(), req.trace(), "analyzed")));

    FanOut fan(ctx_.workers.get());
    auto   cp_future       = fan.Submit([&] { return trace::CriticalPathAnalyzer().Analyze(forest); });
    auto   findings_future = fan.Submit([&] { return trace::AntiPatternDetector(ctx_.settings.anti_patterns).Detect(forest); });

    WaitGuard pending;
    pending.Track(cp_future);
    pending.Track(findings_future);

    AnalyzeTraceResponse resp;
    if (auto cp = Collect(cp_future, "critical_path", resp.mutable_notes())) {
      *resp.mutable_critical_path() = ToProto(*cp);
    }
    if (auto findings = Collect(findings_future, "anti_patterns", resp.mutable_notes())) {
      for (const auto& finding : *findings) {
        *resp.add_anti_patterns() = ToProto(finding);
      }
      RecordFindingMetrics(*findings);
    }
    *resp.mutable_quality() = ToProto(forest);
    return resp;
  });
}

ValidateTraceResponse TraceAnalysisService::ValidateTrace(const ValidateTraceRequest& req) {
  return ObserveAnalysis("TraceAnalysisService.ValidateTrace", [&] {
    const auto forest = trace::TraceForest::Build(FromProto(RequireTrace(req.has_trace(), req.trace(), "validated")));

    ValidateTraceResponse resp;
    *resp.mutable_quality() = ToProto(forest);
    if (!forest.quality().valid()) {
      TRACELENS_LOG_INFO("Trace has data-quality issues",
                         {observability::StringField("trace_id", forest.trace_id()),
                          observability::IntField("issues", static_cast<std::int64_t>(forest.quality().issue_count()))});
    }
    return resp;
  });
}

// ------------------------------------------------------------
// Cross-trace patterns
// ------------------------------------------------------------

AnalyzeSpanPatternsResponse TraceAnalysisService::AnalyzeSpanPatterns(const AnalyzeSpanPatternsRequest& req) {
  return ObserveAnalysis("TraceAnalysisService.AnalyzeSpanPatterns", [&] {
    std::vector<model::TraceRecord> records;
    records.reserve(static_cast<std::size_t>(req.traces_size()));
    for (const auto& trace : req.traces()) {
      records.push_back(FromProto(trace));
    }

    FanOut                                       fan(ctx_.workers.get());
    std::vector<std::future<trace::TraceForest>> building;
    building.reserve(records.size());
    for (const auto& record : records) {
      building.push_back(fan.Submit([&record] { return trace::TraceForest::Build(record); }));
    }
    WaitGuard pending;
    for (const auto& future : building) {
      pending.Track(future);
    }

    AnalyzeSpanPatternsResponse resp;
    auto*                       report = resp.mutable_report();

    // An empty trace is skipped; the remaining traces are still analyzed.
    std::vector<trace::TraceForest> forests;
    forests.reserve(building.size());
    for (std::size_t i = 0; i < building.size(); ++i) {
      if (auto forest = Collect(building[i], "trace " + records[i].trace_id, report->mutable_notes())) {
        forests.push_back(std::move(*forest));
      }
    }

    report->set_trace_count(static_cast<std::uint32_t>(forests.size()));
    for (const auto& service : stats::SpanPatternAnalyzer::ServiceLevelStats(forests)) {
      *report->add_services() = ToProto(service);
    }
    try {
      const auto patterns = stats::SpanPatternAnalyzer(ctx_.settings.statistics).Analyze(forests);
      for (const auto& span : patterns.spans) {
        *report->add_spans() = ToProto(span);
      }
      for (const auto& bottleneck : patterns.bottlenecks) {
        *report->add_bottlenecks() = ToProto(bottleneck);
      }
      *report->mutable_duration_trend() = ToProto(patterns.duration_trend);
    } catch (const util::InsufficientData& e) {
      AddNote(report->mutable_notes(), "span_patterns", e.what());
    }
    return resp;
  });
}

} // namespace tracelens::service
