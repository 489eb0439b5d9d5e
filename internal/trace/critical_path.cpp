#include "internal/trace/critical_path.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <queue>
#include <set>
#include <utility>

namespace tracelens::trace {

bool CriticalPathReport::OnPath(std::string_view span_id) const {
  return std::any_of(path.begin(), path.end(), [&](const CriticalPathNode& node) { return node.span_id == span_id; });
}

bool CriticalPathReport::OnPath(std::size_t index) const {
  return on_path_.count(index) > 0;
}

namespace {

// BFS over eligible edges from the timeline roots. Spans below a skewed or
// unusable span never enter the timeline.
std::vector<std::size_t> TimelineOrder(const TraceForest& forest, std::vector<bool>& in_timeline) {
  in_timeline.assign(forest.size(), false);

  std::vector<std::size_t> order;
  std::queue<std::size_t>  queue;
  for (auto root : forest.TimelineRoots()) {
    in_timeline[root] = true;
    queue.push(root);
  }
  while (!queue.empty()) {
    const auto current = queue.front();
    queue.pop();
    order.push_back(current);
    for (auto child : forest.at(current).children) {
      if (forest.Eligible(child) && !in_timeline[child]) {
        in_timeline[child] = true;
        queue.push(child);
      }
    }
  }
  return order;
}

std::vector<double> TimelineSelfTimes(const TraceForest& forest, const std::vector<bool>& in_timeline) {
  std::vector<double> self(forest.size(), 0.0);

  std::vector<std::pair<double, double>> intervals;
  for (std::size_t i = 0; i < forest.size(); ++i) {
    if (!in_timeline[i]) {
      continue;
    }
    const auto& node = forest.at(i);

    intervals.clear();
    for (auto child : node.children) {
      if (!in_timeline[child]) {
        continue;
      }
      const auto& c = forest.at(child);
      intervals.emplace_back(std::max(c.start_ms, node.start_ms), std::min(c.end_ms, node.end_ms));
    }
    std::sort(intervals.begin(), intervals.end());

    double covered   = 0.0;
    double cur_start = 0.0;
    double cur_end   = 0.0;
    bool   open      = false;
    for (const auto& [start, end] : intervals) {
      if (open && start <= cur_end) {
        cur_end = std::max(cur_end, end);
        continue;
      }
      if (open) {
        covered += cur_end - cur_start;
      }
      cur_start = start;
      cur_end   = end;
      open      = true;
    }
    if (open) {
      covered += cur_end - cur_start;
    }

    self[i] = std::max(0.0, node.DurationMs() - covered);
  }
  return self;
}

constexpr double      kMinParallelSavingsMs     = 10.0;
constexpr std::size_t kMaxParallelOpportunities = 5;
constexpr std::size_t kLongPathSpans            = 5;

std::string WholeMs(double ms) {
  return std::to_string(static_cast<long long>(std::llround(ms)));
}

std::vector<ParallelOpportunity> FindParallelOpportunities(const TraceForest& forest, const std::vector<bool>& in_timeline) {
  std::vector<ParallelOpportunity> opportunities;
  for (std::size_t i = 0; i < forest.size(); ++i) {
    if (!in_timeline[i]) {
      continue;
    }

    std::map<std::string, std::vector<std::size_t>> by_service;
    for (auto child : forest.at(i).children) {
      if (in_timeline[child]) {
        by_service[forest.at(child).service].push_back(child);
      }
    }

    for (auto& [service, group] : by_service) {
      if (group.size() < 2) {
        continue;
      }
      std::stable_sort(group.begin(), group.end(), [&](std::size_t a, std::size_t b) { return forest.at(a).start_ms < forest.at(b).start_ms; });

      ParallelOpportunity opportunity;
      opportunity.parent_span_id = forest.at(i).span_id;
      opportunity.service        = service;
      opportunity.span_count     = group.size();
      for (auto idx : group) {
        const double duration = forest.at(idx).DurationMs();
        opportunity.total_sequential_ms += duration;
        opportunity.parallel_ms = std::max(opportunity.parallel_ms, duration);
        if (opportunity.span_names.size() < 3) {
          opportunity.span_names.push_back(forest.at(idx).name);
        }
      }
      opportunity.savings_ms = opportunity.total_sequential_ms - opportunity.parallel_ms;
      if (opportunity.savings_ms <= kMinParallelSavingsMs) {
        continue;
      }
      opportunity.recommendation = "Consider batching or parallelizing " + std::to_string(group.size()) + " calls to " + service;
      opportunities.push_back(std::move(opportunity));
    }
  }

  std::stable_sort(opportunities.begin(), opportunities.end(),
                   [](const ParallelOpportunity& a, const ParallelOpportunity& b) { return a.savings_ms > b.savings_ms; });
  if (opportunities.size() > kMaxParallelOpportunities) {
    opportunities.resize(kMaxParallelOpportunities);
  }
  return opportunities;
}

std::vector<Recommendation> Recommend(const TraceForest& forest, const CriticalPathReport& report) {
  std::vector<Recommendation> recommendations;

  if (auto bottleneck = forest.Find(report.bottleneck_span_id)) {
    const auto&    node = forest.at(*bottleneck);
    Recommendation rec;
    rec.priority       = Priority::kHigh;
    rec.kind           = "bottleneck_optimization";
    rec.target         = node.name;
    rec.service        = node.service;
    rec.current_ms     = report.self_time_ms[*bottleneck];
    rec.recommendation = "The span '" + node.name + "' is the primary bottleneck, contributing " + WholeMs(rec.current_ms) +
                         " ms of self-time. Focus optimization efforts here for maximum impact.";
    rec.investigation_steps = {"Check whether this operation issues database queries", "Look for N+1 query patterns",
                               "Consider caching frequently accessed data", "Profile the code for CPU-intensive work"};
    recommendations.push_back(std::move(rec));
  }

  if (!report.parallel_opportunities.empty()) {
    const auto&    top = report.parallel_opportunities.front();
    Recommendation rec;
    rec.priority            = Priority::kMedium;
    rec.kind                = "parallelization";
    rec.target              = top.service;
    rec.service             = top.service;
    rec.current_ms          = top.total_sequential_ms;
    rec.recommendation      = top.recommendation;
    rec.investigation_steps = {"Verify the spans are independent of each other", "Consider async or concurrent execution",
                               "Look for a batch API endpoint", "Check whether ordering matters to the business logic"};
    recommendations.push_back(std::move(rec));
  }

  std::size_t           errors = 0;
  std::set<std::string> error_services;
  for (const auto& node : forest.spans()) {
    if (node.reachable && node.error) {
      ++errors;
      error_services.insert(node.service);
    }
  }
  if (errors > 0) {
    Recommendation rec;
    rec.priority = Priority::kHigh;
    rec.kind     = "error_investigation";
    for (const auto& service : error_services) {
      rec.service += rec.service.empty() ? service : ", " + service;
    }
    rec.recommendation      = "Found " + std::to_string(errors) + " error spans in the trace. Errors often cause retries and increased latency.";
    rec.investigation_steps = {"Examine error span attributes for messages", "Check logs correlated with this trace",
                               "Look for timeout or connection errors", "Verify downstream service health"};
    recommendations.push_back(std::move(rec));
  }

  if (report.path.size() > kLongPathSpans) {
    Recommendation rec;
    rec.priority            = Priority::kLow;
    rec.kind                = "architecture_review";
    rec.current_ms          = report.critical_path_ms;
    rec.recommendation      = "The critical path is " + std::to_string(report.path.size()) + " spans deep. Consider whether the call chain can be simplified.";
    rec.investigation_steps = {"Review whether intermediate services add value", "Consider direct service-to-service calls",
                               "Evaluate caching at different layers", "Look for unnecessary transformations"};
    recommendations.push_back(std::move(rec));
  }
  return recommendations;
}

} // namespace

// ------------------------------------------------------------
// Self-time
// ------------------------------------------------------------

std::vector<double> CriticalPathAnalyzer::SelfTimes(const TraceForest& forest) {
  std::vector<bool> in_timeline;
  TimelineOrder(forest, in_timeline);
  return TimelineSelfTimes(forest, in_timeline);
}

// ------------------------------------------------------------
// Blocking child selection
// ------------------------------------------------------------

CriticalPathAnalyzer::Selection CriticalPathAnalyzer::SelectBlocking(const TraceForest& forest, std::vector<std::size_t> candidates,
                                                                     const std::vector<double>& chain) {
  // Latest end first; on equal end the earlier start covers the other.
  std::sort(candidates.begin(), candidates.end(), [&](std::size_t a, std::size_t b) {
    const auto& na = forest.at(a);
    const auto& nb = forest.at(b);
    if (na.end_ms != nb.end_ms) return na.end_ms > nb.end_ms;
    if (na.start_ms != nb.start_ms) return na.start_ms < nb.start_ms;
    return a < b;
  });

  Selection selection;
  double    boundary = std::numeric_limits<double>::infinity();
  for (auto idx : candidates) {
    const auto& node = forest.at(idx);
    if (node.end_ms > boundary) {
      continue;
    }
    selection.weight += chain[idx];
    selection.chosen.push_back(idx);
    boundary = node.start_ms;
  }

  std::reverse(selection.chosen.begin(), selection.chosen.end());
  return selection;
}

// ------------------------------------------------------------
// Analyze
// ------------------------------------------------------------

CriticalPathReport CriticalPathAnalyzer::Analyze(const TraceForest& forest) const {
  CriticalPathReport report;
  report.total_duration_ms = forest.TotalDurationMs();

  // Reverse timeline order finalizes every child chain before its parent.
  std::vector<bool> in_timeline;
  const auto        order = TimelineOrder(forest, in_timeline);
  report.self_time_ms     = TimelineSelfTimes(forest, in_timeline);

  const auto roots = forest.TimelineRoots();
  if (roots.empty()) {
    return report;
  }

  std::vector<double>                   chain(forest.size(), 0.0);
  std::vector<std::vector<std::size_t>> blocking(forest.size());

  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    const auto               idx = *it;
    std::vector<std::size_t> children;
    for (auto child : forest.at(idx).children) {
      if (in_timeline[child]) {
        children.push_back(child);
      }
    }

    auto selection = SelectBlocking(forest, std::move(children), chain);
    chain[idx]     = report.self_time_ms[idx] + selection.weight;
    blocking[idx]  = std::move(selection.chosen);
  }

  auto top = SelectBlocking(forest, roots, chain);

  double trace_start = std::numeric_limits<double>::max();
  for (auto root : roots) {
    trace_start = std::min(trace_start, forest.at(root).start_ms);
  }

  double total_work    = 0.0;
  double max_self_time = 0.0;
  for (std::size_t i = 0; i < forest.size(); ++i) {
    if (in_timeline[i]) {
      total_work += report.self_time_ms[i];
      max_self_time = std::max(max_self_time, report.self_time_ms[i]);
    }
  }

  // A discounted concurrent child can outlast the chosen chain; the path
  // never reports less than the longest single self-time.
  report.critical_path_ms = std::max(top.weight, max_self_time);
  if (report.total_duration_ms > 0) {
    report.critical_path_ms = std::min(report.critical_path_ms, report.total_duration_ms);
  }

  // Pre-order walk: parent, then its blocking children in start order.
  std::vector<std::size_t> stack(top.chosen.rbegin(), top.chosen.rend());
  double                   bottleneck_self = -1.0;
  while (!stack.empty()) {
    const auto idx = stack.back();
    stack.pop_back();

    const auto&      node = forest.at(idx);
    CriticalPathNode path_node;
    path_node.index           = idx;
    path_node.span_id         = node.span_id;
    path_node.name            = node.name;
    path_node.service         = node.service;
    path_node.self_time_ms    = report.self_time_ms[idx];
    path_node.duration_ms     = node.DurationMs();
    path_node.start_offset_ms = node.start_ms - trace_start;
    path_node.depth           = node.depth;
    if (report.total_duration_ms > 0) {
      path_node.contribution_pct = path_node.self_time_ms / report.total_duration_ms * 100.0;
    }
    if (report.critical_path_ms > 0) {
      path_node.blocking_contribution_pct = path_node.self_time_ms / report.critical_path_ms * 100.0;
    }

    if (path_node.self_time_ms > bottleneck_self) {
      bottleneck_self           = path_node.self_time_ms;
      report.bottleneck_span_id = node.span_id;
    }

    report.on_path_.insert(idx);
    report.path.push_back(std::move(path_node));

    const auto& chosen = blocking[idx];
    stack.insert(stack.end(), chosen.rbegin(), chosen.rend());
  }

  if (report.critical_path_ms > 0) {
    report.parallelism_ratio = std::max(1.0, total_work / report.critical_path_ms);
  }
  if (report.total_duration_ms > 0) {
    report.parallelism_pct = (1.0 - report.critical_path_ms / report.total_duration_ms) * 100.0;
  }

  report.parallel_opportunities = FindParallelOpportunities(forest, in_timeline);
  report.recommendations        = Recommend(forest, report);
  return report;
}

} // namespace tracelens::trace
