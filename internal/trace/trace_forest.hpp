#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/span.hpp"

namespace tracelens::trace {

enum class IssueKind : std::uint8_t {
  kMalformedSpan,
  kOrphanedSpan,
  kNegativeDuration,
  kClockSkew,
};

std::string_view ToString(IssueKind kind);

struct DataQualityIssue {
  IssueKind   kind;
  std::string span_id;
  std::string message;
};

struct DataQualityReport {
  std::vector<DataQualityIssue> issues;

  bool        valid() const { return issues.empty(); }
  std::size_t issue_count() const { return issues.size(); }
  std::size_t Count(IssueKind kind) const;
};

/*
  One span in the arena.

  Relations are arena indices, never pointers, so a malformed parent
  reference can at worst leave a span unreachable.
*/
struct SpanNode {
  std::string span_id;
  std::string parent_span_id;
  std::string name;
  std::string service;
  double      start_ms = 0;
  double      end_ms   = 0;
  bool        error    = false;

  model::SpanStatus status = model::SpanStatus::kUnset;

  std::map<std::string, std::string> attributes;

  std::optional<std::size_t> parent;
  std::vector<std::size_t>   children;
  std::size_t                depth = 0;

  // Both timestamps present and end >= start.
  bool temporal_valid = false;
  // Interval extends outside the parent's interval.
  bool clock_skewed = false;
  // Reached from a root; false for spans caught in a parent cycle.
  bool reachable = false;

  double DurationMs() const { return temporal_valid ? end_ms - start_ms : 0.0; }
};

/*
  Validated span forest built from a flat record list.

  Build() never fails on malformed data; defects land in quality(). The only
  terminal failure is an empty record list (util::EmptyTrace).
*/
class TraceForest {
 public:
  static TraceForest Build(const model::TraceRecord& trace);

  const std::string&              trace_id() const { return trace_id_; }
  const std::vector<SpanNode>&    spans() const { return spans_; }
  const std::vector<std::size_t>& roots() const { return roots_; }
  const DataQualityReport&        quality() const { return quality_; }

  const SpanNode&            at(std::size_t index) const { return spans_.at(index); }
  std::size_t                size() const { return spans_.size(); }
  std::optional<std::size_t> Find(std::string_view span_id) const;

  // Reachable and temporally valid.
  bool Usable(std::size_t index) const;

  // A usable child that is not clock-skewed against its parent; only these
  // take part in a parent's coverage and blocking chain.
  bool Eligible(std::size_t child) const;

  bool IsAncestor(std::size_t ancestor, std::size_t descendant) const;

  // max(end) - min(start) over usable roots.
  double TotalDurationMs() const;

  std::size_t MaxDepth() const;

  // Spans whose temporal calculations start a timeline: usable spans whose
  // parent is absent or unusable.
  std::vector<std::size_t> TimelineRoots() const;

  // Number of reachable spans.
  std::size_t ReachableCount() const;

 private:
  void Index(const model::TraceRecord& trace);
  void Link();
  void Traverse();
  void CheckClockSkew();

  std::string                                  trace_id_;
  std::vector<SpanNode>                        spans_;
  std::unordered_map<std::string, std::size_t> index_;
  std::vector<std::size_t>                     roots_;
  DataQualityReport                            quality_;
};

// Error status, falling back to attributes when the record carries none.
bool IsErrorSpan(const model::SpanRecord& span);

// service.name, service or app attribute, in that order; "unknown" when
// none is set.
std::string ServiceName(const model::SpanRecord& span);

} // namespace tracelens::trace
