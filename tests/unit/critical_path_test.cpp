#include "internal/trace/critical_path.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

namespace {

using tracelens::model::SpanRecord;
using tracelens::model::TraceRecord;
using tracelens::model::SpanStatus;
using tracelens::trace::CriticalPathAnalyzer;
using tracelens::trace::Priority;
using tracelens::trace::TraceForest;

SpanRecord MakeSpan(const std::string& id, const std::string& parent, double start, double end) {
  SpanRecord span;
  span.span_id        = id;
  span.parent_span_id = parent;
  span.name           = id;
  span.start_ms       = start;
  span.end_ms         = end;
  return span;
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

double MaxSelfTime(const std::vector<double>& self) {
  return *std::max_element(self.begin(), self.end());
}

void TestSerialChildrenFormOneChain() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", 0, 100), MakeSpan("a", "root", 0, 30), MakeSpan("b", "root", 30, 60), MakeSpan("c", "root", 60, 90)};

  const auto forest = TraceForest::Build(trace);
  const auto report = CriticalPathAnalyzer().Analyze(forest);

  assert(Near(report.critical_path_ms, 100.0));
  assert(Near(report.total_duration_ms, 100.0));
  assert(Near(report.parallelism_ratio, 1.0));
  assert(report.path.size() == 4);
  assert(report.path[0].span_id == "root");
  assert(report.path[1].span_id == "a");
  assert(report.path[2].span_id == "b");
  assert(report.path[3].span_id == "c");
  assert(Near(report.path[0].self_time_ms, 10.0));
  assert(Near(report.path[2].start_offset_ms, 30.0));
  assert(Near(report.path[1].contribution_pct, 30.0));
  assert(report.bottleneck_span_id == "a");
}

void TestParallelChildrenContributeOnce() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", 0, 100), MakeSpan("a", "root", 0, 80), MakeSpan("b", "root", 0, 80), MakeSpan("c", "root", 0, 80)};

  const auto forest = TraceForest::Build(trace);
  const auto report = CriticalPathAnalyzer().Analyze(forest);

  assert(report.critical_path_ms <= report.total_duration_ms);
  assert(report.critical_path_ms >= MaxSelfTime(report.self_time_ms));
  assert(Near(report.critical_path_ms, 100.0));
  assert(report.path.size() == 2);
  // 20 ms of root work plus three 80 ms children over a 100 ms path
  assert(Near(report.parallelism_ratio, 2.6));
  assert(report.parallelism_ratio >= 1.0);
}

void TestOverlappingChildrenNeverMakeSelfTimeNegative() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", 0, 100), MakeSpan("a", "root", 10, 50), MakeSpan("b", "root", 30, 70), MakeSpan("full", "a", 10, 50)};

  const auto forest = TraceForest::Build(trace);
  const auto self   = CriticalPathAnalyzer::SelfTimes(forest);

  for (double value : self) {
    assert(value >= 0.0);
  }
  // union of [10, 50] and [30, 70]
  assert(Near(self[*forest.Find("root")], 40.0));
  assert(Near(self[*forest.Find("a")], 0.0));
}

void TestLaterEndingChildBlocks() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", 0, 60), MakeSpan("early", "root", 0, 40), MakeSpan("late", "root", 10, 50)};

  const auto forest = TraceForest::Build(trace);
  const auto report = CriticalPathAnalyzer().Analyze(forest);

  assert(report.OnPath(std::string_view("late")));
  assert(!report.OnPath(std::string_view("early")));
  assert(report.OnPath(*forest.Find("root")));
}

void TestConcurrentChildEndingEarlierIsNotBlocking() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", 0, 100), MakeSpan("a", "root", 0, 95), MakeSpan("b", "root", 50, 100)};

  const auto forest = TraceForest::Build(trace);
  const auto report = CriticalPathAnalyzer().Analyze(forest);

  assert(report.OnPath(std::string_view("b")));
  assert(!report.OnPath(std::string_view("a")));
  assert(report.path.size() == 2);
  assert(Near(report.self_time_ms[*forest.Find("root")], 0.0));
  assert(report.critical_path_ms >= MaxSelfTime(report.self_time_ms));
  assert(report.critical_path_ms <= report.total_duration_ms);
}

void TestSerialRootsShareOneTimeline() {
  TraceRecord trace;
  trace.spans = {MakeSpan("first", "", 0, 50), MakeSpan("second", "", 50, 100)};

  const auto forest = TraceForest::Build(trace);
  const auto report = CriticalPathAnalyzer().Analyze(forest);

  assert(Near(report.critical_path_ms, 100.0));
  assert(report.path.size() == 2);
  assert(Near(report.parallelism_pct, 0.0));
}

void TestSkewedChildIsExcludedFromParentChain() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", 0, 100), MakeSpan("skewed", "root", 80, 150)};

  const auto forest = TraceForest::Build(trace);
  const auto report = CriticalPathAnalyzer().Analyze(forest);

  assert(Near(report.self_time_ms[*forest.Find("root")], 100.0));
  assert(report.critical_path_ms <= report.total_duration_ms);
}

void TestSkewedSubtreeHasNoSelfTime() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", 0, 100), MakeSpan("skewed", "root", 50, 1000), MakeSpan("below", "skewed", 60, 70)};

  const auto forest = TraceForest::Build(trace);
  const auto report = CriticalPathAnalyzer().Analyze(forest);

  assert(Near(report.self_time_ms[*forest.Find("skewed")], 0.0));
  assert(Near(report.self_time_ms[*forest.Find("below")], 0.0));
  assert(Near(report.critical_path_ms, 100.0));
  assert(report.critical_path_ms >= MaxSelfTime(report.self_time_ms));
  assert(!report.OnPath(std::string_view("skewed")));
}

SpanRecord WithService(SpanRecord span, const std::string& service) {
  span.attributes["service.name"] = service;
  return span;
}

void TestSameServiceSiblingsAreParallelOpportunity() {
  TraceRecord trace;
  trace.spans = {WithService(MakeSpan("root", "", 0, 400), "api"), WithService(MakeSpan("inv0", "root", 0, 100), "inventory"),
                 WithService(MakeSpan("inv1", "root", 100, 200), "inventory"), WithService(MakeSpan("inv2", "root", 200, 300), "inventory"),
                 WithService(MakeSpan("price", "root", 300, 350), "pricing")};

  const auto forest = TraceForest::Build(trace);
  const auto report = CriticalPathAnalyzer().Analyze(forest);

  assert(report.parallel_opportunities.size() == 1);
  const auto& opportunity = report.parallel_opportunities[0];
  assert(opportunity.parent_span_id == "root");
  assert(opportunity.service == "inventory");
  assert(opportunity.span_count == 3);
  assert(opportunity.span_names[0] == "inv0");
  assert(Near(opportunity.total_sequential_ms, 300.0));
  assert(Near(opportunity.parallel_ms, 100.0));
  assert(Near(opportunity.savings_ms, 200.0));
  assert(opportunity.recommendation == "Consider batching or parallelizing 3 calls to inventory");

  assert(report.path[1].service == "inventory");
  assert(report.recommendations.size() == 2);
  assert(report.recommendations[0].kind == "bottleneck_optimization");
  assert(report.recommendations[0].priority == Priority::kHigh);
  assert(report.recommendations[0].target == "inv0");
  assert(Near(report.recommendations[0].current_ms, 100.0));
  assert(report.recommendations[1].kind == "parallelization");
  assert(report.recommendations[1].priority == Priority::kMedium);
  assert(report.recommendations[1].service == "inventory");
}

void TestDeepPathWithErrorsGetsRecommendations() {
  TraceRecord trace;
  for (int i = 0; i < 7; ++i) {
    trace.spans.push_back(MakeSpan("s" + std::to_string(i), i == 0 ? "" : "s" + std::to_string(i - 1), i, 100 - i));
  }
  trace.spans[6]        = WithService(trace.spans[6], "db");
  trace.spans[6].status = SpanStatus::kError;

  const auto forest = TraceForest::Build(trace);
  const auto report = CriticalPathAnalyzer().Analyze(forest);

  assert(report.path.size() == 7);
  assert(report.parallel_opportunities.empty());
  assert(report.recommendations.size() == 3);
  assert(report.recommendations[0].kind == "bottleneck_optimization");
  assert(report.recommendations[1].kind == "error_investigation");
  assert(report.recommendations[1].service == "db");
  assert(report.recommendations[2].kind == "architecture_review");
  assert(report.recommendations[2].priority == Priority::kLow);
}

void TestTraceWithoutTimestampsHasEmptyPath() {
  TraceRecord trace;
  SpanRecord  span;
  span.span_id = "untimed";
  span.name    = "untimed";
  trace.spans  = {span};

  const auto forest = TraceForest::Build(trace);
  const auto report = CriticalPathAnalyzer().Analyze(forest);

  assert(report.path.empty());
  assert(report.critical_path_ms == 0.0);
  assert(report.bottleneck_span_id.empty());
  assert(report.parallelism_ratio == 1.0);
}

} // namespace

int main() {
  TestSerialChildrenFormOneChain();
  TestParallelChildrenContributeOnce();
  TestOverlappingChildrenNeverMakeSelfTimeNegative();
  TestLaterEndingChildBlocks();
  TestConcurrentChildEndingEarlierIsNotBlocking();
  TestSerialRootsShareOneTimeline();
  TestSkewedChildIsExcludedFromParentChain();
  TestSkewedSubtreeHasNoSelfTime();
  TestTraceWithoutTimestampsHasEmptyPath();
  TestSameServiceSiblingsAreParallelOpportunity();
  TestDeepPathWithErrorsGetsRecommendations();

  std::cout << "tracelens_unit_critical_path: pass\n";
  return 0;
}
