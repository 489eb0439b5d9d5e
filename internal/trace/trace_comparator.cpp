#include "internal/trace/trace_comparator.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace tracelens::trace {

namespace {

double PercentOf(double diff, double baseline) {
  return baseline > 0 ? diff / baseline * 100.0 : 0.0;
}

model::SpanStatus ResolvedStatus(const SpanNode& node) {
  return node.error ? model::SpanStatus::kError : model::SpanStatus::kOk;
}

// name -> span indices ordered by start time; spans without timestamps last.
std::map<std::string, std::vector<std::size_t>> OrdinalIndex(const TraceForest& forest) {
  std::map<std::string, std::vector<std::size_t>> by_name;
  for (std::size_t i = 0; i < forest.size(); ++i) {
    by_name[forest.at(i).name].push_back(i);
  }
  for (auto& [name, members] : by_name) {
    std::stable_sort(members.begin(), members.end(), [&](std::size_t a, std::size_t b) {
      const auto& na = forest.at(a);
      const auto& nb = forest.at(b);
      if (na.temporal_valid != nb.temporal_valid) return na.temporal_valid;
      if (na.temporal_valid && na.start_ms != nb.start_ms) return na.start_ms < nb.start_ms;
      return a < b;
    });
  }
  return by_name;
}

} // namespace

std::string_view ToString(MatchStrategy strategy) {
  switch (strategy) {
    case MatchStrategy::kSpanId:
      return "span_id";
    case MatchStrategy::kNameOrdinal:
      return "name_ordinal";
    case MatchStrategy::kAuto:
    default:
      return "auto";
  }
}

std::vector<model::LatencyDiff> TraceDiff::LatencyDiffs() const {
  std::vector<model::LatencyDiff> out;
  for (const auto& diff : diffs) {
    if (const auto* latency = std::get_if<model::LatencyDiff>(&diff)) {
      out.push_back(*latency);
    }
  }
  return out;
}

std::vector<model::ErrorDiff> TraceDiff::ErrorDiffs() const {
  std::vector<model::ErrorDiff> out;
  for (const auto& diff : diffs) {
    if (const auto* error = std::get_if<model::ErrorDiff>(&diff)) {
      out.push_back(*error);
    }
  }
  return out;
}

std::vector<model::StructureDiff> TraceDiff::StructureDiffs() const {
  std::vector<model::StructureDiff> out;
  for (const auto& diff : diffs) {
    if (const auto* structure = std::get_if<model::StructureDiff>(&diff)) {
      out.push_back(*structure);
    }
  }
  return out;
}

TraceComparator::TraceComparator(ComparatorOptions options) : options_(options) {
}

// ------------------------------------------------------------
// Matching
// ------------------------------------------------------------

MatchStrategy TraceComparator::ResolveStrategy(const TraceForest& baseline, const TraceForest& target) const {
  if (options_.strategy != MatchStrategy::kAuto) {
    return options_.strategy;
  }

  const auto smaller = std::min(baseline.size(), target.size());
  if (smaller == 0) {
    return MatchStrategy::kNameOrdinal;
  }

  std::size_t shared = 0;
  for (const auto& node : baseline.spans()) {
    if (target.Find(node.span_id)) {
      ++shared;
    }
  }
  return shared * 2 >= smaller ? MatchStrategy::kSpanId : MatchStrategy::kNameOrdinal;
}

std::vector<SpanMatch> TraceComparator::MatchById(const TraceForest& baseline, const TraceForest& target) const {
  std::vector<SpanMatch> matches;
  for (std::size_t i = 0; i < target.size(); ++i) {
    const auto& node = target.at(i);

    SpanMatch match;
    match.identity.key            = node.span_id;
    match.identity.name           = node.name;
    match.identity.target_span_id = node.span_id;
    match.target                  = i;
    if (auto b = baseline.Find(node.span_id)) {
      match.baseline                  = *b;
      match.identity.baseline_span_id = node.span_id;
    }
    matches.push_back(std::move(match));
  }

  for (std::size_t i = 0; i < baseline.size(); ++i) {
    const auto& node = baseline.at(i);
    if (target.Find(node.span_id)) {
      continue;
    }
    SpanMatch match;
    match.identity.key              = node.span_id;
    match.identity.name             = node.name;
    match.identity.baseline_span_id = node.span_id;
    match.baseline                  = i;
    matches.push_back(std::move(match));
  }
  return matches;
}

std::vector<SpanMatch> TraceComparator::MatchByName(const TraceForest& baseline, const TraceForest& target) const {
  const auto baseline_index = OrdinalIndex(baseline);
  const auto target_index   = OrdinalIndex(target);

  std::vector<std::size_t> target_ordinal(target.size(), 0);
  for (const auto& [name, members] : target_index) {
    for (std::size_t k = 0; k < members.size(); ++k) {
      target_ordinal[members[k]] = k;
    }
  }

  std::vector<SpanMatch> matches;
  for (std::size_t i = 0; i < target.size(); ++i) {
    const auto& node    = target.at(i);
    const auto  ordinal = target_ordinal[i];

    SpanMatch match;
    match.identity.key            = node.name + "#" + std::to_string(ordinal);
    match.identity.name           = node.name;
    match.identity.target_span_id = node.span_id;
    match.target                  = i;

    auto it = baseline_index.find(node.name);
    if (it != baseline_index.end() && ordinal < it->second.size()) {
      match.baseline                  = it->second[ordinal];
      match.identity.baseline_span_id = baseline.at(*match.baseline).span_id;
    }
    matches.push_back(std::move(match));
  }

  for (const auto& [name, members] : baseline_index) {
    auto        it      = target_index.find(name);
    std::size_t matched = it == target_index.end() ? 0 : it->second.size();
    for (std::size_t k = matched; k < members.size(); ++k) {
      SpanMatch match;
      match.identity.key              = name + "#" + std::to_string(k);
      match.identity.name             = name;
      match.identity.baseline_span_id = baseline.at(members[k]).span_id;
      match.baseline                  = members[k];
      matches.push_back(std::move(match));
    }
  }
  return matches;
}

// ------------------------------------------------------------
// Compare
// ------------------------------------------------------------

TraceDiff TraceComparator::Compare(const TraceForest& baseline, const TraceForest& target) const {
  TraceDiff result;
  result.strategy = ResolveStrategy(baseline, target);
  result.matches  = result.strategy == MatchStrategy::kSpanId ? MatchById(baseline, target) : MatchByName(baseline, target);

  for (const auto& match : result.matches) {
    if (match.baseline && match.target) {
      const auto& b = baseline.at(*match.baseline);
      const auto& t = target.at(*match.target);

      const bool   timed = b.temporal_valid && t.temporal_valid;
      const double diff  = timed ? t.DurationMs() - b.DurationMs() : 0.0;

      if (timed && std::fabs(diff) > options_.noise_floor_ms) {
        model::LatencyDiff latency;
        latency.span         = match.identity;
        latency.baseline_ms  = b.DurationMs();
        latency.target_ms    = t.DurationMs();
        latency.diff_ms      = diff;
        latency.diff_percent = PercentOf(diff, b.DurationMs());
        result.diffs.emplace_back(std::move(latency));
      }

      if (b.error != t.error) {
        model::ErrorDiff error;
        error.span            = match.identity;
        error.baseline_status = ResolvedStatus(b);
        error.target_status   = ResolvedStatus(t);
        error.diff_ms         = diff;
        error.diff_percent    = PercentOf(diff, b.DurationMs());
        result.diffs.emplace_back(std::move(error));
      }
      continue;
    }

    model::StructureDiff structure;
    structure.span = match.identity;
    if (match.target) {
      structure.change       = model::StructureChange::kAdded;
      structure.diff_ms      = target.at(*match.target).DurationMs();
      structure.diff_percent = 100.0;
    } else {
      structure.change       = model::StructureChange::kRemoved;
      structure.diff_ms      = -baseline.at(*match.baseline).DurationMs();
      structure.diff_percent = -100.0;
    }
    result.diffs.emplace_back(std::move(structure));
  }

  result.structure.baseline_span_count = baseline.size();
  result.structure.target_span_count   = target.size();
  result.structure.baseline_depth      = baseline.MaxDepth();
  result.structure.target_depth        = target.MaxDepth();
  result.structure.depth_change        = static_cast<long>(result.structure.target_depth) - static_cast<long>(result.structure.baseline_depth);
  return result;
}

} // namespace tracelens::trace
