#include "internal/trace/anti_patterns.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

namespace {

using tracelens::model::Impact;
using tracelens::model::NPlusOne;
using tracelens::model::RetryStorm;
using tracelens::model::SerialChain;
using tracelens::model::SpanRecord;
using tracelens::model::TraceRecord;
using tracelens::trace::AntiPatternDetector;
using tracelens::trace::AntiPatternThresholds;
using tracelens::trace::TraceForest;

SpanRecord MakeSpan(const std::string& id, const std::string& parent, const std::string& name, std::optional<double> start,
                    std::optional<double> end) {
  SpanRecord span;
  span.span_id        = id;
  span.parent_span_id = parent;
  span.name           = name;
  span.start_ms       = start;
  span.end_ms         = end;
  return span;
}

void TestRepeatedQueriesAreNPlusOne() {
  TraceRecord trace;
  trace.spans.push_back(MakeSpan("root", "", "GET /users", 0, 500));
  for (int i = 0; i < 15; ++i) {
    trace.spans.push_back(MakeSpan("q" + std::to_string(i), "root", "SELECT user", i * 30.0, i * 30.0 + 30.0));
  }

  const auto forest   = TraceForest::Build(trace);
  const auto findings = AntiPatternDetector().DetectNPlusOne(forest);

  assert(findings.size() == 1);
  const auto& finding = findings[0];
  assert(finding.count == 15);
  assert(finding.parent_span_id == "root");
  assert(finding.span_names.size() == 1 && finding.span_names[0] == "SELECT user");
  assert(finding.span_ids.size() == 15);
  assert(std::fabs(finding.total_duration_ms - 450.0) < 1e-9);
  assert(finding.impact == Impact::kHigh);
  assert(!finding.recommendation.empty());
}

void TestFifteenDatabaseQueriesAreHighImpact() {
  TraceRecord trace;
  trace.spans.push_back(MakeSpan("api", "", "GET /orders", 0, 460));
  for (int i = 0; i < 15; ++i) {
    trace.spans.push_back(MakeSpan("db" + std::to_string(i), "api", "db.query", 5 + i * 30.0, 5 + i * 30.0 + 30.0));
  }

  const auto forest   = TraceForest::Build(trace);
  const auto findings = AntiPatternDetector().DetectNPlusOne(forest);

  assert(findings.size() == 1);
  assert(findings[0].count == 15);
  assert(findings[0].span_names[0] == "db.query");
  assert(findings[0].impact == Impact::kHigh);
}

void TestUntimedSiblingsStillCount() {
  TraceRecord trace;
  trace.spans.push_back(MakeSpan("root", "", "handler", 0, 200));
  for (int i = 0; i < 3; ++i) {
    trace.spans.push_back(MakeSpan("q" + std::to_string(i), "root", "fetch", i * 40.0, i * 40.0 + 30.0));
  }
  trace.spans.push_back(MakeSpan("q3", "root", "fetch", std::nullopt, std::nullopt));

  const auto forest   = TraceForest::Build(trace);
  const auto findings = AntiPatternDetector().DetectNPlusOne(forest);

  assert(findings.size() == 1);
  assert(findings[0].count == 4);
  assert(findings[0].impact == Impact::kMedium);
}

void TestCheapRepetitionIsIgnored() {
  TraceRecord trace;
  trace.spans.push_back(MakeSpan("root", "", "handler", 0, 100));
  for (int i = 0; i < 5; ++i) {
    trace.spans.push_back(MakeSpan("q" + std::to_string(i), "root", "ping", i * 10.0, i * 10.0 + 5.0));
  }

  const auto forest = TraceForest::Build(trace);
  assert(AntiPatternDetector().DetectNPlusOne(forest).empty());
}

void TestBackToBackSpansAreSerialChain() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", "checkout", 0, 700), MakeSpan("a", "root", "reserve stock", 0, 200),
                 MakeSpan("b", "root", "charge card", 205, 430), MakeSpan("c", "root", "send receipt", 435, 660)};

  const auto forest = TraceForest::Build(trace);
  const auto chains = AntiPatternDetector().DetectSerialChains(forest);

  assert(chains.size() == 1);
  const auto& chain = chains[0];
  assert(chain.count == 3);
  assert(std::fabs(chain.total_duration_ms - 650.0) < 1e-9);
  assert(std::fabs(chain.max_gap_ms - 5.0) < 1e-9);
  assert(chain.impact == Impact::kHigh);
  assert(chain.span_ids[0] == "a" && chain.span_ids[2] == "c");
}

void TestNestedWorkInsideChainMemberKeepsChain() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", "checkout", 0, 600), MakeSpan("a", "root", "reserve stock", 0, 200),
                 MakeSpan("a1", "a", "lock row", 0, 185), MakeSpan("b", "root", "charge card", 205, 400),
                 MakeSpan("c", "root", "send receipt", 405, 600)};

  const auto forest = TraceForest::Build(trace);
  const auto chains = AntiPatternDetector().DetectSerialChains(forest);

  assert(chains.size() == 1);
  const auto& chain = chains[0];
  assert(chain.count == 3);
  assert(chain.span_ids[0] == "a" && chain.span_ids[1] == "b" && chain.span_ids[2] == "c");
  assert(std::fabs(chain.total_duration_ms - 590.0) < 1e-9);
}

void TestWideGapBreaksChain() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", "job", 0, 700), MakeSpan("a", "root", "step a", 0, 100), MakeSpan("b", "root", "step b", 105, 200),
                 MakeSpan("c", "root", "step c", 260, 400)};

  const auto forest = TraceForest::Build(trace);
  assert(AntiPatternDetector().DetectSerialChains(forest).empty());
}

void TestNestedSpansAreNotSerial() {
  TraceRecord trace;
  trace.spans = {MakeSpan("a", "", "outer", 0, 300), MakeSpan("b", "a", "middle", 0, 200), MakeSpan("c", "b", "inner", 0, 100)};

  const auto forest = TraceForest::Build(trace);
  assert(AntiPatternDetector().DetectSerialChains(forest).empty());
}

void TestDetectReturnsEveryKindFound() {
  TraceRecord trace;
  trace.spans.push_back(MakeSpan("root", "", "batch", 0, 1000));
  for (int i = 0; i < 4; ++i) {
    trace.spans.push_back(MakeSpan("s" + std::to_string(i), "root", "upload", i * 101.0, i * 101.0 + 100.0));
  }

  const auto forest   = TraceForest::Build(trace);
  const auto findings = AntiPatternDetector().Detect(forest);

  // four back-to-back uploads are also a short retry storm
  assert(findings.size() == 3);
  assert(std::holds_alternative<NPlusOne>(findings[0]));
  assert(std::holds_alternative<SerialChain>(findings[1]));
  assert(std::holds_alternative<RetryStorm>(findings[2]));
  assert(tracelens::model::Common(findings[1]).count == 4);
  assert(tracelens::model::KindName(findings[2]) == "retry_storm");
}

void TestRepeatedAttemptsAreRetryStorm() {
  TraceRecord trace;
  trace.spans.push_back(MakeSpan("root", "", "checkout", 0, 3000));
  const double durations[] = {50, 75, 110, 165, 250};
  double       start       = 0;
  for (int i = 0; i < 5; ++i) {
    trace.spans.push_back(MakeSpan("p" + std::to_string(i), "root", "charge attempt", start, start + durations[i]));
    start += durations[i] + 100;
  }
  // shrinking attempts are not a backoff
  trace.spans.push_back(MakeSpan("c0", "root", "cache.get", 1500, 1800));
  trace.spans.push_back(MakeSpan("c1", "root", "cache.get", 1810, 1910));
  trace.spans.push_back(MakeSpan("c2", "root", "cache.get", 1920, 1970));
  trace.spans.push_back(MakeSpan("r0", "root", "redis reconnect", 2000, 2010));

  const auto forest = TraceForest::Build(trace);
  const auto storms = AntiPatternDetector().DetectRetryStorms(forest);

  assert(storms.size() == 3);
  assert(storms[0].span_names[0] == "charge attempt");
  assert(storms[0].count == 5);
  assert(storms[0].impact == Impact::kHigh);
  assert(storms[0].has_exponential_backoff);
  assert(std::fabs(storms[0].total_duration_ms - 650.0) < 1e-9);

  assert(storms[1].span_names[0] == "cache.get");
  assert(storms[1].impact == Impact::kMedium);
  assert(!storms[1].has_exponential_backoff);

  // named as a retry, so one span is enough
  assert(storms[2].span_names[0] == "redis reconnect");
  assert(storms[2].count == 1);
}

void TestSpreadOutRepeatsAreNotRetryStorm() {
  TraceRecord trace;
  trace.spans.push_back(MakeSpan("root", "", "poller", 0, 10000));
  for (int i = 0; i < 4; ++i) {
    trace.spans.push_back(MakeSpan("t" + std::to_string(i), "root", "tick", i * 2000.0, i * 2000.0 + 10.0));
  }

  const auto forest = TraceForest::Build(trace);
  assert(AntiPatternDetector().DetectRetryStorms(forest).empty());
}

void TestTimeoutPropagatesToCallers() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", "GET /checkout", 0, 3000), MakeSpan("pay", "root", "payment.authorize", 100, 2600),
                 MakeSpan("bank", "pay", "bank.call", 200, 700), MakeSpan("stock", "root", "inventory", 10, 60)};
  trace.spans[2].attributes["error.type"] = "timeout";

  const auto forest   = TraceForest::Build(trace);
  const auto cascades = AntiPatternDetector().DetectCascadingTimeouts(forest);

  assert(cascades.size() == 1);
  const auto& cascade = cascades[0];
  assert(cascade.count == 3);
  assert(cascade.origin_span_id == "bank");
  assert(cascade.span_ids[0] == "bank" && cascade.span_ids[1] == "pay" && cascade.span_ids[2] == "root");
  assert(cascade.impact == Impact::kCritical);
  assert(std::fabs(cascade.total_duration_ms - 6000.0) < 1e-9);
}

void TestSingleTimeoutIsNotCascade() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", "GET /", 0, 500), MakeSpan("db", "root", "db deadline exceeded", 10, 20)};

  const auto forest = TraceForest::Build(trace);
  assert(AntiPatternDetector().DetectCascadingTimeouts(forest).empty());
}

void TestSlowConnectionWaitsAreReported() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", "GET /report", 0, 2000), MakeSpan("acq", "root", "db.connection.acquire", 100, 700),
                 MakeSpan("chk", "root", "pool checkout", 800, 950), MakeSpan("quick", "root", "connection check", 960, 1000)};
  trace.spans[1].attributes["pool.size"]    = "10";
  trace.spans[1].attributes["pool.active"]  = "10";
  trace.spans[1].attributes["pool.waiting"] = "4";

  const auto forest = TraceForest::Build(trace);
  const auto issues = AntiPatternDetector().DetectConnectionPoolIssues(forest);

  assert(issues.size() == 1);
  const auto& issue = issues[0];
  assert(issue.count == 2);
  assert(issue.span_ids[0] == "acq" && issue.span_ids[1] == "chk");
  assert(std::fabs(issue.total_duration_ms - 750.0) < 1e-9);
  assert(std::fabs(issue.max_wait_ms - 600.0) < 1e-9);
  assert(issue.pool_exhausted);
  assert(issue.impact == Impact::kHigh);
  assert(issue.pool_size == "10");
  assert(issue.active_connections == "10");
  assert(issue.waiting_requests == "4");
}

void TestWaitSeverityFollowsThreshold() {
  TraceRecord trace;
  trace.spans = {MakeSpan("root", "", "GET /", 0, 300), MakeSpan("acq", "root", "connection acquire", 0, 120)};

  const auto forest = TraceForest::Build(trace);
  const auto issues = AntiPatternDetector().DetectConnectionPoolIssues(forest);
  assert(issues.size() == 1);
  assert(issues[0].impact == Impact::kLow);
  assert(!issues[0].pool_exhausted);
  assert(issues[0].pool_size.empty());

  AntiPatternThresholds strict;
  strict.pool_wait_threshold_ms = 200;
  assert(AntiPatternDetector(strict).DetectConnectionPoolIssues(forest).empty());
}

} // namespace

int main() {
  TestRepeatedQueriesAreNPlusOne();
  TestFifteenDatabaseQueriesAreHighImpact();
  TestUntimedSiblingsStillCount();
  TestCheapRepetitionIsIgnored();
  TestBackToBackSpansAreSerialChain();
  TestNestedWorkInsideChainMemberKeepsChain();
  TestWideGapBreaksChain();
  TestNestedSpansAreNotSerial();
  TestDetectReturnsEveryKindFound();
  TestRepeatedAttemptsAreRetryStorm();
  TestSpreadOutRepeatsAreNotRetryStorm();
  TestTimeoutPropagatesToCallers();
  TestSingleTimeoutIsNotCascade();
  TestSlowConnectionWaitsAreReported();
  TestWaitSeverityFollowsThreshold();

  std::cout << "tracelens_unit_anti_patterns: pass\n";
  return 0;
}
