#include "internal/trace/anti_patterns.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace tracelens::trace {

namespace {

constexpr std::string_view kRetryIndicators[]      = {"retry", "attempt", "backoff", "reconnect"};
constexpr std::string_view kTimeoutIndicators[]    = {"timeout", "deadline", "exceeded", "timed out", "context deadline"};
constexpr std::string_view kConnectionIndicators[] = {"connection", "pool", "acquire", "checkout", "wait"};

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

template <std::size_t N>
bool ContainsAny(std::string_view text, const std::string_view (&indicators)[N]) {
  const auto lowered = Lower(text);
  return std::any_of(std::begin(indicators), std::end(indicators),
                     [&](std::string_view indicator) { return lowered.find(indicator) != std::string::npos; });
}

const std::string* Attribute(const SpanNode& node, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = node.attributes.find(key);
    if (it != node.attributes.end() && !it->second.empty()) {
      return &it->second;
    }
  }
  return nullptr;
}

bool IsTimeout(const SpanNode& node, double threshold_ms) {
  if (node.DurationMs() >= threshold_ms || ContainsAny(node.name, kTimeoutIndicators)) {
    return true;
  }
  // error.type=timeout and friends match on the value
  for (const auto& [key, value] : node.attributes) {
    if (ContainsAny(key, kTimeoutIndicators) || ContainsAny(value, kTimeoutIndicators)) {
      return true;
    }
  }
  return false;
}

// Start order; spans without timestamps sort first.
void SortByStart(const TraceForest& forest, std::vector<std::size_t>& indices) {
  std::stable_sort(indices.begin(), indices.end(), [&](std::size_t a, std::size_t b) {
    const double sa = forest.Usable(a) ? forest.at(a).start_ms : 0.0;
    const double sb = forest.Usable(b) ? forest.at(b).start_ms : 0.0;
    return sa < sb;
  });
}

} // namespace

AntiPatternDetector::AntiPatternDetector(AntiPatternThresholds thresholds) : thresholds_(thresholds) {
}

std::vector<model::AntiPatternFinding> AntiPatternDetector::Detect(const TraceForest& forest) const {
  std::vector<model::AntiPatternFinding> findings;
  for (auto& finding : DetectNPlusOne(forest)) {
    findings.emplace_back(std::move(finding));
  }
  for (auto& finding : DetectSerialChains(forest)) {
    findings.emplace_back(std::move(finding));
  }
  for (auto& finding : DetectRetryStorms(forest)) {
    findings.emplace_back(std::move(finding));
  }
  for (auto& finding : DetectCascadingTimeouts(forest)) {
    findings.emplace_back(std::move(finding));
  }
  for (auto& finding : DetectConnectionPoolIssues(forest)) {
    findings.emplace_back(std::move(finding));
  }
  return findings;
}

// ------------------------------------------------------------
// N+1
// ------------------------------------------------------------

std::vector<model::NPlusOne> AntiPatternDetector::DetectNPlusOne(const TraceForest& forest) const {
  // (parent span id, name) -> siblings, in arena order.
  std::map<std::pair<std::string, std::string>, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < forest.size(); ++i) {
    const auto& node = forest.at(i);
    if (!node.reachable) {
      continue;
    }
    groups[{node.parent_span_id, node.name}].push_back(i);
  }

  std::vector<model::NPlusOne> findings;
  for (const auto& [key, members] : groups) {
    if (members.size() < thresholds_.n_plus_one_min_count) {
      continue;
    }

    double total = 0.0;
    for (auto idx : members) {
      total += forest.at(idx).DurationMs();
    }
    if (total <= thresholds_.n_plus_one_min_total_ms) {
      continue;
    }

    model::NPlusOne finding;
    finding.parent_span_id    = key.first;
    finding.span_names        = {key.second};
    finding.count             = members.size();
    finding.total_duration_ms = total;
    finding.impact            = total > thresholds_.n_plus_one_high_impact_ms ? model::Impact::kHigh : model::Impact::kMedium;
    finding.description =
        "Potential N+1 query: '" + key.second + "' called " + std::to_string(members.size()) + " times under the same parent.";
    finding.recommendation = "Batch the repeated '" + key.second + "' calls into a single request or add caching.";
    for (auto idx : members) {
      finding.span_ids.push_back(forest.at(idx).span_id);
    }
    findings.push_back(std::move(finding));
  }

  std::stable_sort(findings.begin(), findings.end(),
                   [](const model::NPlusOne& a, const model::NPlusOne& b) { return a.total_duration_ms > b.total_duration_ms; });
  return findings;
}

// ------------------------------------------------------------
// Serial chains
// ------------------------------------------------------------

std::vector<model::SerialChain> AntiPatternDetector::DetectSerialChains(const TraceForest& forest) const {
  std::vector<std::size_t> sorted;
  for (std::size_t i = 0; i < forest.size(); ++i) {
    if (forest.Usable(i)) {
      sorted.push_back(i);
    }
  }
  std::sort(sorted.begin(), sorted.end(), [&](std::size_t a, std::size_t b) {
    const auto& na = forest.at(a);
    const auto& nb = forest.at(b);
    if (na.start_ms != nb.start_ms) return na.start_ms < nb.start_ms;
    if (na.DurationMs() != nb.DurationMs()) return na.DurationMs() > nb.DurationMs();
    return a < b;
  });

  // Runs in order of their first member. A run stays open until a later
  // span starts a full gap after its last member; spans nested inside the
  // last member neither extend nor break it.
  struct Run {
    std::vector<std::size_t> members;
    bool                     open = true;
  };
  std::vector<Run> open_runs;

  for (auto idx : sorted) {
    bool placed = false;
    for (auto& run : open_runs) {
      if (!run.open) {
        continue;
      }
      const auto last = run.members.back();
      if (forest.IsAncestor(last, idx)) {
        continue;
      }

      const double gap = forest.at(idx).start_ms - forest.at(last).end_ms;
      if (gap >= thresholds_.serial_chain_max_gap_ms) {
        run.open = false;
        continue;
      }
      if (!placed && gap >= 0.0 && !forest.IsAncestor(idx, last)) {
        run.members.push_back(idx);
        placed = true;
      }
    }
    if (!placed) {
      open_runs.push_back(Run{{idx}});
    }
  }

  std::vector<std::vector<std::size_t>> runs;
  for (auto& run : open_runs) {
    if (run.members.size() >= thresholds_.serial_chain_min_length) {
      runs.push_back(std::move(run.members));
    }
  }

  std::vector<model::SerialChain> findings;
  for (const auto& run : runs) {
    double total   = 0.0;
    double max_gap = 0.0;
    for (std::size_t k = 0; k < run.size(); ++k) {
      total += forest.at(run[k]).DurationMs();
      if (k > 0) {
        max_gap = std::max(max_gap, forest.at(run[k]).start_ms - forest.at(run[k - 1]).end_ms);
      }
    }
    if (total <= thresholds_.serial_chain_min_total_ms) {
      continue;
    }

    model::SerialChain finding;
    finding.count             = run.size();
    finding.total_duration_ms = total;
    finding.max_gap_ms        = max_gap;
    finding.impact            = total > thresholds_.serial_chain_high_impact_ms ? model::Impact::kHigh : model::Impact::kMedium;
    finding.description =
        "Serial chain: " + std::to_string(run.size()) + " operations running sequentially that could potentially be parallelized.";
    finding.recommendation = "Consider parallelizing these operations using async or concurrent execution.";
    for (auto idx : run) {
      finding.span_names.push_back(forest.at(idx).name);
      finding.span_ids.push_back(forest.at(idx).span_id);
    }
    findings.push_back(std::move(finding));
  }
  return findings;
}

// ------------------------------------------------------------
// Retry storms
// ------------------------------------------------------------

std::vector<model::RetryStorm> AntiPatternDetector::DetectRetryStorms(const TraceForest& forest) const {
  std::map<std::string, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < forest.size(); ++i) {
    if (forest.at(i).reachable) {
      groups[forest.at(i).name].push_back(i);
    }
  }

  std::vector<model::RetryStorm> findings;
  for (auto& [name, members] : groups) {
    const bool named_retry = ContainsAny(name, kRetryIndicators);
    if (members.size() < thresholds_.retry_min_count && !named_retry) {
      continue;
    }

    SortByStart(forest, members);
    std::size_t sequential = 1;
    for (std::size_t k = 1; k < members.size(); ++k) {
      if (!forest.Usable(members[k - 1]) || !forest.Usable(members[k])) {
        continue;
      }
      const double gap = forest.at(members[k]).start_ms - forest.at(members[k - 1]).end_ms;
      if (gap >= 0.0 && gap < thresholds_.retry_max_gap_ms) {
        ++sequential;
      }
    }
    if (sequential < thresholds_.retry_min_count && !named_retry) {
      continue;
    }

    model::RetryStorm finding;
    finding.span_names = {name};
    finding.count      = members.size();
    for (auto idx : members) {
      finding.span_ids.push_back(forest.at(idx).span_id);
      finding.total_duration_ms += forest.at(idx).DurationMs();
    }

    // Backoff: no attempt more than 1.5x the one after it.
    if (members.size() >= 3) {
      finding.has_exponential_backoff = true;
      for (std::size_t k = 0; k + 1 < members.size(); ++k) {
        if (forest.at(members[k]).DurationMs() > forest.at(members[k + 1]).DurationMs() * 1.5) {
          finding.has_exponential_backoff = false;
          break;
        }
      }
    }

    finding.impact      = members.size() >= thresholds_.retry_high_impact_count ? model::Impact::kHigh : model::Impact::kMedium;
    finding.description = "Retry storm: '" + name + "' executed " + std::to_string(members.size()) + " times in quick succession.";
    finding.recommendation = "Investigate downstream service health. Consider a circuit breaker if one is not in place.";
    findings.push_back(std::move(finding));
  }

  std::stable_sort(findings.begin(), findings.end(), [](const model::RetryStorm& a, const model::RetryStorm& b) { return a.count > b.count; });
  return findings;
}

// ------------------------------------------------------------
// Cascading timeouts
// ------------------------------------------------------------

std::vector<model::CascadingTimeout> AntiPatternDetector::DetectCascadingTimeouts(const TraceForest& forest) const {
  std::vector<bool>        timeout(forest.size(), false);
  std::vector<std::size_t> timeouts;
  for (std::size_t i = 0; i < forest.size(); ++i) {
    if (forest.at(i).reachable && IsTimeout(forest.at(i), thresholds_.timeout_threshold_ms)) {
      timeout[i] = true;
      timeouts.push_back(i);
    }
  }
  if (timeouts.size() < 2) {
    return {};
  }
  SortByStart(forest, timeouts);

  // Origin first, then every timed-out ancestor on the way to the root.
  std::vector<std::vector<std::size_t>> chains;
  for (auto origin : timeouts) {
    std::vector<std::size_t> chain{origin};
    auto                     current = forest.at(origin).parent;
    for (std::size_t hops = 0; current && hops < forest.size(); ++hops) {
      if (timeout[*current]) {
        chain.push_back(*current);
      }
      current = forest.at(*current).parent;
    }
    if (chain.size() >= 2) {
      chains.push_back(std::move(chain));
    }
  }
  std::stable_sort(chains.begin(), chains.end(), [](const auto& a, const auto& b) { return a.size() > b.size(); });

  std::vector<std::set<std::size_t>>   kept_sets;
  std::vector<model::CascadingTimeout> findings;
  for (const auto& chain : chains) {
    const std::set<std::size_t> members(chain.begin(), chain.end());
    const bool                  contained = std::any_of(kept_sets.begin(), kept_sets.end(), [&](const std::set<std::size_t>& kept) {
      return std::includes(kept.begin(), kept.end(), members.begin(), members.end());
    });
    if (contained) {
      continue;
    }
    kept_sets.push_back(members);

    const auto&             origin = forest.at(chain.front());
    model::CascadingTimeout finding;
    finding.origin_span_id = origin.span_id;
    finding.count          = chain.size();
    for (auto idx : chain) {
      finding.span_names.push_back(forest.at(idx).name);
      finding.span_ids.push_back(forest.at(idx).span_id);
      finding.total_duration_ms += forest.at(idx).DurationMs();
    }
    finding.impact      = model::Impact::kCritical;
    finding.description = "Cascading timeout: '" + origin.name + "' timed out and " + std::to_string(chain.size() - 1) + " caller(s) timed out after it.";
    finding.recommendation =
        "Review timeout configuration. Propagate deadlines and keep child timeouts shorter than their parent's.";
    findings.push_back(std::move(finding));
  }
  return findings;
}

// ------------------------------------------------------------
// Connection pool
// ------------------------------------------------------------

std::vector<model::ConnectionPoolIssue> AntiPatternDetector::DetectConnectionPoolIssues(const TraceForest& forest) const {
  const double threshold = thresholds_.pool_wait_threshold_ms;

  std::vector<std::size_t> waits;
  for (std::size_t i = 0; i < forest.size(); ++i) {
    const auto& node = forest.at(i);
    if (node.reachable && ContainsAny(node.name, kConnectionIndicators) && node.DurationMs() >= threshold) {
      waits.push_back(i);
    }
  }
  if (waits.empty()) {
    return {};
  }
  SortByStart(forest, waits);

  model::ConnectionPoolIssue finding;
  finding.count       = waits.size();
  std::size_t longest = waits.front();
  for (auto idx : waits) {
    const auto& node = forest.at(idx);
    finding.span_names.push_back(node.name);
    finding.span_ids.push_back(node.span_id);
    finding.total_duration_ms += node.DurationMs();
    if (node.DurationMs() > forest.at(longest).DurationMs()) {
      longest = idx;
    }
  }

  const auto& worst   = forest.at(longest);
  finding.max_wait_ms = worst.DurationMs();
  if (const auto* size = Attribute(worst, {"pool.size", "db.pool_size"})) {
    finding.pool_size = *size;
  }
  if (const auto* active = Attribute(worst, {"pool.active", "db.active_connections"})) {
    finding.active_connections = *active;
  }
  if (const auto* waiting = Attribute(worst, {"pool.waiting", "db.waiting_requests"})) {
    finding.waiting_requests = *waiting;
  }

  finding.pool_exhausted = finding.total_duration_ms >= threshold * 3;
  if (finding.max_wait_ms >= threshold * 5) {
    finding.impact = model::Impact::kHigh;
  } else if (finding.max_wait_ms >= threshold * 2) {
    finding.impact = model::Impact::kMedium;
  } else {
    finding.impact = model::Impact::kLow;
  }
  finding.description = "Connection pool contention: " + std::to_string(waits.size()) + " connection wait(s) of at least " +
                        std::to_string(static_cast<long long>(threshold)) + " ms.";
  finding.recommendation =
      "Consider increasing the connection pool size or reducing connection hold time, and check that connections are released.";

  std::vector<model::ConnectionPoolIssue> findings;
  findings.push_back(std::move(finding));
  return findings;
}

} // namespace tracelens::trace
