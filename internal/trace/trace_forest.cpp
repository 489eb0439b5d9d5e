#include "internal/trace/trace_forest.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <queue>

#include "internal/util/errors.hpp"

namespace tracelens::trace {

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ParseStatusCode(std::string_view value, int* code) {
  const auto* begin = value.data();
  const auto* end   = value.data() + value.size();
  auto [ptr, ec]    = std::from_chars(begin, end, *code);
  return ec == std::errc() && ptr == end;
}

bool IsFalsy(const std::string& lowered) {
  return lowered.empty() || lowered == "false" || lowered == "0" || lowered == "none" || lowered == "ok";
}

} // namespace

std::string_view ToString(IssueKind kind) {
  switch (kind) {
    case IssueKind::kMalformedSpan:
      return "malformed_span";
    case IssueKind::kOrphanedSpan:
      return "orphaned_span";
    case IssueKind::kNegativeDuration:
      return "negative_duration";
    case IssueKind::kClockSkew:
      return "clock_skew";
  }
  return "unknown";
}

std::size_t DataQualityReport::Count(IssueKind kind) const {
  return static_cast<std::size_t>(std::count_if(issues.begin(), issues.end(), [kind](const DataQualityIssue& issue) { return issue.kind == kind; }));
}

bool IsErrorSpan(const model::SpanRecord& span) {
  if (span.status == model::SpanStatus::kError) {
    return true;
  }
  if (span.status == model::SpanStatus::kOk) {
    return false;
  }

  for (const auto& [key, value] : span.attributes) {
    const auto key_lower   = Lower(key);
    const auto value_lower = Lower(value);

    if (key_lower.find("status_code") != std::string::npos || key_lower.find("status.code") != std::string::npos) {
      int code = 0;
      if (ParseStatusCode(value, &code) && code >= 400) {
        return true;
      }
      continue;
    }

    if (key_lower.find("error") != std::string::npos || key_lower.find("exception") != std::string::npos) {
      if (!IsFalsy(value_lower)) {
        return true;
      }
    }
  }
  return false;
}

std::string ServiceName(const model::SpanRecord& span) {
  for (const char* key : {"service.name", "service", "app"}) {
    auto it = span.attributes.find(key);
    if (it != span.attributes.end() && !it->second.empty()) {
      return it->second;
    }
  }
  return "unknown";
}

// ------------------------------------------------------------
// Build
// ------------------------------------------------------------

TraceForest TraceForest::Build(const model::TraceRecord& trace) {
  if (trace.spans.empty()) {
    throw util::EmptyTrace("trace '" + trace.trace_id + "' has no spans");
  }

  TraceForest forest;
  forest.trace_id_ = trace.trace_id;
  forest.Index(trace);
  forest.Link();
  forest.Traverse();
  forest.CheckClockSkew();
  return forest;
}

void TraceForest::Index(const model::TraceRecord& trace) {
  spans_.reserve(trace.spans.size());

  for (const auto& record : trace.spans) {
    if (record.span_id.empty()) {
      quality_.issues.push_back({IssueKind::kMalformedSpan, "", "span '" + record.name + "' has no span id"});
      continue;
    }
    if (index_.count(record.span_id)) {
      quality_.issues.push_back({IssueKind::kMalformedSpan, record.span_id, "duplicate span id"});
      continue;
    }

    SpanNode node;
    node.span_id        = record.span_id;
    node.parent_span_id = record.parent_span_id;
    node.name           = record.name;
    node.service        = ServiceName(record);
    node.status         = record.status;
    node.error          = IsErrorSpan(record);
    node.attributes     = record.attributes;

    if (!record.start_ms || !record.end_ms) {
      quality_.issues.push_back({IssueKind::kMalformedSpan, record.span_id, "missing start or end timestamp"});
    } else if (*record.end_ms < *record.start_ms) {
      node.start_ms = *record.start_ms;
      node.end_ms   = *record.end_ms;
      quality_.issues.push_back({IssueKind::kNegativeDuration, record.span_id, "end time precedes start time"});
    } else {
      node.start_ms       = *record.start_ms;
      node.end_ms         = *record.end_ms;
      node.temporal_valid = true;
    }

    index_.emplace(node.span_id, spans_.size());
    spans_.push_back(std::move(node));
  }
}

void TraceForest::Link() {
  for (std::size_t i = 0; i < spans_.size(); ++i) {
    auto& node = spans_[i];
    if (node.parent_span_id.empty()) {
      roots_.push_back(i);
      continue;
    }

    auto it = index_.find(node.parent_span_id);
    if (it == index_.end()) {
      quality_.issues.push_back({IssueKind::kOrphanedSpan, node.span_id, "parent span " + node.parent_span_id + " not found"});
      roots_.push_back(i);
      continue;
    }
    if (it->second == i) {
      quality_.issues.push_back({IssueKind::kMalformedSpan, node.span_id, "span is its own parent"});
      continue;
    }

    node.parent = it->second;
    spans_[it->second].children.push_back(i);
  }
}

void TraceForest::Traverse() {
  // BFS from the roots; anything left unvisited hangs off a parent cycle.
  std::queue<std::size_t> queue;
  for (auto root : roots_) {
    spans_[root].reachable = true;
    spans_[root].depth     = 0;
    queue.push(root);
  }

  while (!queue.empty()) {
    const auto current = queue.front();
    queue.pop();

    for (auto child : spans_[current].children) {
      if (spans_[child].reachable) {
        continue;
      }
      spans_[child].reachable = true;
      spans_[child].depth     = spans_[current].depth + 1;
      queue.push(child);
    }
  }

  for (const auto& node : spans_) {
    if (!node.reachable && node.parent_span_id != node.span_id) {
      quality_.issues.push_back({IssueKind::kMalformedSpan, node.span_id, "span unreachable from any root (parent cycle)"});
    }
  }
}

void TraceForest::CheckClockSkew() {
  for (auto& node : spans_) {
    if (!node.parent || !node.reachable || !node.temporal_valid) {
      continue;
    }
    const auto& parent = spans_[*node.parent];
    if (!parent.temporal_valid) {
      continue;
    }
    if (node.start_ms < parent.start_ms || node.end_ms > parent.end_ms) {
      node.clock_skewed = true;
      quality_.issues.push_back({IssueKind::kClockSkew, node.span_id, "child span outside parent " + parent.span_id + " timespan"});
    }
  }
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::optional<std::size_t> TraceForest::Find(std::string_view span_id) const {
  auto it = index_.find(std::string(span_id));
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool TraceForest::Usable(std::size_t index) const {
  const auto& node = spans_.at(index);
  return node.reachable && node.temporal_valid;
}

bool TraceForest::Eligible(std::size_t child) const {
  const auto& node = spans_.at(child);
  return Usable(child) && !node.clock_skewed && node.parent && Usable(*node.parent);
}

bool TraceForest::IsAncestor(std::size_t ancestor, std::size_t descendant) const {
  // Bounded by depth so a cycle cannot loop forever.
  auto        current = spans_.at(descendant).parent;
  std::size_t steps   = 0;
  while (current && steps <= spans_.size()) {
    if (*current == ancestor) {
      return true;
    }
    current = spans_[*current].parent;
    ++steps;
  }
  return false;
}

double TraceForest::TotalDurationMs() const {
  double min_start = std::numeric_limits<double>::max();
  double max_end   = std::numeric_limits<double>::lowest();
  bool   any       = false;

  for (auto root : TimelineRoots()) {
    min_start = std::min(min_start, spans_[root].start_ms);
    max_end   = std::max(max_end, spans_[root].end_ms);
    any       = true;
  }
  return any ? max_end - min_start : 0.0;
}

std::size_t TraceForest::MaxDepth() const {
  std::size_t depth = 0;
  for (const auto& node : spans_) {
    if (node.reachable) {
      depth = std::max(depth, node.depth);
    }
  }
  return depth;
}

std::vector<std::size_t> TraceForest::TimelineRoots() const {
  std::vector<std::size_t> result;
  for (std::size_t i = 0; i < spans_.size(); ++i) {
    if (!Usable(i)) {
      continue;
    }
    const auto& parent = spans_[i].parent;
    if (!parent || !Usable(*parent)) {
      result.push_back(i);
    }
  }
  return result;
}

std::size_t TraceForest::ReachableCount() const {
  return static_cast<std::size_t>(std::count_if(spans_.begin(), spans_.end(), [](const SpanNode& node) { return node.reachable; }));
}

} // namespace tracelens::trace
