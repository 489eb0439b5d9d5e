#include "internal/trace/trace_comparator.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

namespace {

using tracelens::model::SpanRecord;
using tracelens::model::SpanStatus;
using tracelens::model::StructureChange;
using tracelens::model::TraceRecord;
using tracelens::trace::ComparatorOptions;
using tracelens::trace::MatchStrategy;
using tracelens::trace::TraceComparator;
using tracelens::trace::TraceForest;

SpanRecord MakeSpan(const std::string& id, const std::string& parent, const std::string& name, double start, double end) {
  SpanRecord span;
  span.span_id        = id;
  span.parent_span_id = parent;
  span.name           = name;
  span.start_ms       = start;
  span.end_ms         = end;
  return span;
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestSharedIdsMatchById() {
  TraceRecord baseline;
  baseline.trace_id = "base";
  baseline.spans    = {MakeSpan("root", "", "GET /", 0, 100), MakeSpan("a", "root", "query", 0, 50), MakeSpan("c", "root", "legacy", 50, 60)};

  TraceRecord target;
  target.trace_id = "target";
  target.spans    = {MakeSpan("root", "", "GET /", 0, 150), MakeSpan("a", "root", "query", 0, 100), MakeSpan("b", "root", "audit", 100, 120)};

  const auto diff = TraceComparator().Compare(TraceForest::Build(baseline), TraceForest::Build(target));
  assert(diff.strategy == MatchStrategy::kSpanId);

  const auto latency = diff.LatencyDiffs();
  assert(latency.size() == 2);
  const auto query = std::find_if(latency.begin(), latency.end(), [](const auto& d) { return d.span.key == "a"; });
  assert(query != latency.end());
  assert(Near(query->diff_ms, 50.0));
  assert(Near(query->diff_percent, 100.0));
  assert(query->span.baseline_span_id == "a" && query->span.target_span_id == "a");

  const auto structure = diff.StructureDiffs();
  assert(structure.size() == 2);
  for (const auto& change : structure) {
    if (change.change == StructureChange::kAdded) {
      assert(change.span.key == "b");
      assert(change.span.baseline_span_id.empty());
      assert(Near(change.diff_ms, 20.0));
      assert(Near(change.diff_percent, 100.0));
    } else {
      assert(change.span.key == "c");
      assert(change.span.target_span_id.empty());
      assert(Near(change.diff_ms, -10.0));
      assert(Near(change.diff_percent, -100.0));
    }
  }

  assert(diff.structure.baseline_span_count == 3);
  assert(diff.structure.target_span_count == 3);
  assert(diff.structure.depth_change == 0);
}

void TestUnrelatedIdsMatchByNameOrdinal() {
  TraceRecord baseline;
  baseline.spans = {MakeSpan("b-root", "", "root", 0, 100), MakeSpan("b-db1", "b-root", "db", 10, 20), MakeSpan("b-db2", "b-root", "db", 30, 40)};

  TraceRecord target;
  target.spans = {MakeSpan("t-root", "", "root", 0, 100), MakeSpan("t-db2", "t-root", "db", 30, 40), MakeSpan("t-db1", "t-root", "db", 10, 30)};

  const TraceComparator comparator;
  const auto            b    = TraceForest::Build(baseline);
  const auto            t    = TraceForest::Build(target);
  const auto            diff = comparator.Compare(b, t);

  assert(comparator.ResolveStrategy(b, t) == MatchStrategy::kNameOrdinal);
  assert(diff.strategy == MatchStrategy::kNameOrdinal);

  const auto latency = diff.LatencyDiffs();
  assert(latency.size() == 1);
  assert(latency[0].span.key == "db#0");
  assert(latency[0].span.baseline_span_id == "b-db1");
  assert(latency[0].span.target_span_id == "t-db1");
  assert(Near(latency[0].diff_ms, 10.0));
  assert(diff.StructureDiffs().empty());
}

void TestStatusFlipIsErrorDiff() {
  TraceRecord baseline;
  baseline.spans = {MakeSpan("root", "", "root", 0, 100), MakeSpan("pay", "root", "payment", 10, 60)};

  TraceRecord target = baseline;
  target.spans[1].status = SpanStatus::kError;

  const auto diff   = TraceComparator().Compare(TraceForest::Build(baseline), TraceForest::Build(target));
  const auto errors = diff.ErrorDiffs();

  assert(errors.size() == 1);
  assert(errors[0].span.key == "pay");
  assert(errors[0].baseline_status == SpanStatus::kOk);
  assert(errors[0].target_status == SpanStatus::kError);
  assert(diff.LatencyDiffs().empty());
}

void TestChangesBelowNoiseFloorAreDropped() {
  TraceRecord baseline;
  baseline.spans = {MakeSpan("root", "", "root", 0, 100)};
  TraceRecord target;
  target.spans = {MakeSpan("root", "", "root", 0, 100.5)};

  const auto b = TraceForest::Build(baseline);
  const auto t = TraceForest::Build(target);
  assert(TraceComparator().Compare(b, t).diffs.empty());

  ComparatorOptions sensitive;
  sensitive.noise_floor_ms = 0.1;
  assert(TraceComparator(sensitive).Compare(b, t).LatencyDiffs().size() == 1);
}

void TestChangeEqualToNoiseFloorIsDropped() {
  TraceRecord baseline;
  baseline.spans = {MakeSpan("root", "", "root", 0, 100)};
  TraceRecord target;
  target.spans = {MakeSpan("root", "", "root", 0, 101)};

  const auto b = TraceForest::Build(baseline);
  const auto t = TraceForest::Build(target);
  assert(TraceComparator().Compare(b, t).LatencyDiffs().empty());

  target.spans = {MakeSpan("root", "", "root", 0, 101.5)};
  assert(TraceComparator().Compare(b, TraceForest::Build(target)).LatencyDiffs().size() == 1);
}

void TestForcedStrategyIsHonoured() {
  TraceRecord baseline;
  baseline.spans = {MakeSpan("x", "", "root", 0, 100)};
  TraceRecord target;
  target.spans = {MakeSpan("x", "", "other", 0, 100)};

  ComparatorOptions options;
  options.strategy = MatchStrategy::kNameOrdinal;

  const auto diff = TraceComparator(options).Compare(TraceForest::Build(baseline), TraceForest::Build(target));
  assert(diff.strategy == MatchStrategy::kNameOrdinal);
  // different names under name matching: one added, one removed
  assert(diff.StructureDiffs().size() == 2);
}

} // namespace

int main() {
  TestSharedIdsMatchById();
  TestUnrelatedIdsMatchByNameOrdinal();
  TestStatusFlipIsErrorDiff();
  TestChangesBelowNoiseFloorAreDropped();
  TestChangeEqualToNoiseFloorIsDropped();
  TestForcedStrategyIsHonoured();

  std::cout << "tracelens_unit_trace_comparator: pass\n";
  return 0;
}
