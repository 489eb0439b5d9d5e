#include "internal/logs/log_template_miner.hpp"

#include <algorithm>

#include "internal/logs/token_masker.hpp"
#include "internal/util/hash.hpp"

namespace tracelens::logs {

namespace {

constexpr std::size_t kMaxSamples      = 3;
constexpr std::size_t kMaxSampleLength = 200;

std::size_t Specificity(const std::vector<std::string>& tokens) {
  return static_cast<std::size_t>(std::count_if(tokens.begin(), tokens.end(), [](const std::string& t) { return !IsWildcard(t); }));
}

std::string LineKey(const std::vector<std::string>& tokens) {
  std::string key;
  for (const auto& token : tokens) {
    key += token;
    key += '\n';
  }
  return key;
}

void RefreshPatternId(model::LogPattern& pattern) {
  pattern.pattern_id = util::ToHex(util::Fnv1a64(pattern.Template()));
}

} // namespace

LogTemplateMiner::LogTemplateMiner(MinerOptions options) : options_(options) {
}

double LogTemplateMiner::Similarity(const std::vector<std::string>& template_tokens, const std::vector<std::string>& tokens) {
  if (template_tokens.size() != tokens.size()) {
    return 0.0;
  }

  std::size_t considered = 0;
  std::size_t matched    = 0;
  for (std::size_t i = 0; i < template_tokens.size(); ++i) {
    if (IsWildcard(template_tokens[i])) {
      continue;
    }
    ++considered;
    if (template_tokens[i] == tokens[i]) {
      ++matched;
    }
  }
  return considered == 0 ? 1.0 : static_cast<double>(matched) / static_cast<double>(considered);
}

std::optional<LogTemplateMiner::Candidate> LogTemplateMiner::BestCluster(const std::vector<std::string>& tokens) const {
  auto bucket = by_length_.find(tokens.size());
  if (bucket == by_length_.end()) {
    return std::nullopt;
  }

  std::optional<Candidate> best;
  std::size_t              best_specificity = 0;
  for (auto position : bucket->second) {
    const auto& cluster     = clusters_[position];
    const auto  similarity  = Similarity(cluster.template_tokens, tokens);
    const auto  specificity = Specificity(cluster.template_tokens);

    const bool better = !best || similarity > best->similarity ||
                        (similarity == best->similarity && specificity > best_specificity) ||
                        (similarity == best->similarity && specificity == best_specificity && position < best->position);
    if (better) {
      best             = Candidate{position, similarity};
      best_specificity = specificity;
    }
  }

  if (!best || best->similarity < options_.similarity_threshold) {
    return std::nullopt;
  }
  return best;
}

// ------------------------------------------------------------
// Mining
// ------------------------------------------------------------

std::optional<std::uint64_t> LogTemplateMiner::Add(const model::LogRecord& record) {
  ++total_logs_;
  const auto tokens = Tokenize(record.message);
  auto       key    = LineKey(tokens);

  std::size_t position = 0;
  if (auto known = assigned_.find(key); known != assigned_.end()) {
    position = known->second;
  } else if (auto best = BestCluster(tokens)) {
    position      = best->position;
    auto& pattern = clusters_[position];
    bool  widened = false;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
      if (!IsWildcard(pattern.template_tokens[i]) && pattern.template_tokens[i] != tokens[i]) {
        pattern.template_tokens[i] = std::string(kWildcard);
        widened                    = true;
      }
    }
    if (widened) {
      RefreshPatternId(pattern);
    }
    assigned_.emplace(std::move(key), position);
  } else if (clusters_.size() < options_.max_clusters) {
    position = clusters_.size();

    model::LogPattern pattern;
    pattern.cluster_id      = position + 1;
    pattern.template_tokens = tokens;
    RefreshPatternId(pattern);
    clusters_.push_back(std::move(pattern));
    by_length_[tokens.size()].push_back(position);
    assigned_.emplace(std::move(key), position);
  } else {
    ++unmatched_;
    return std::nullopt;
  }

  auto& pattern = clusters_[position];
  ++pattern.count;
  ++pattern.severity_counts[model::NormalizeSeverity(record.severity)];

  if (record.timestamp) {
    if (!pattern.first_seen || *record.timestamp < *pattern.first_seen) {
      pattern.first_seen = record.timestamp;
    }
    if (!pattern.last_seen || *record.timestamp > *pattern.last_seen) {
      pattern.last_seen = record.timestamp;
    }
  }

  if (pattern.sample_messages.size() < kMaxSamples) {
    pattern.sample_messages.push_back(record.message.substr(0, kMaxSampleLength));
  }
  return pattern.cluster_id;
}

std::optional<std::uint64_t> LogTemplateMiner::Match(std::string_view message) const {
  const auto tokens = Tokenize(message);
  if (auto known = assigned_.find(LineKey(tokens)); known != assigned_.end()) {
    return clusters_[known->second].cluster_id;
  }

  auto best = BestCluster(tokens);
  if (!best) {
    return std::nullopt;
  }
  return clusters_[best->position].cluster_id;
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::vector<model::LogPattern> LogTemplateMiner::Patterns() const {
  std::vector<model::LogPattern> patterns(clusters_.begin(), clusters_.end());
  std::sort(patterns.begin(), patterns.end(), [](const model::LogPattern& a, const model::LogPattern& b) {
    if (a.count != b.count) return a.count > b.count;
    return a.cluster_id < b.cluster_id;
  });
  return patterns;
}

const model::LogPattern* LogTemplateMiner::Find(std::uint64_t cluster_id) const {
  if (cluster_id == 0 || cluster_id > clusters_.size()) {
    return nullptr;
  }
  return &clusters_[cluster_id - 1];
}

PatternSummary LogTemplateMiner::Summarize(std::size_t max_patterns) const {
  PatternSummary summary;
  summary.total_logs      = total_logs_;
  summary.unique_patterns = clusters_.size();
  summary.unmatched_logs  = unmatched_;

  for (const auto& pattern : clusters_) {
    for (const auto& [severity, count] : pattern.severity_counts) {
      summary.severity_distribution[severity] += count;
    }
  }

  const auto matched        = total_logs_ - unmatched_;
  summary.compression_ratio = static_cast<double>(matched) / static_cast<double>(std::max<std::size_t>(clusters_.size(), 1));

  auto patterns = Patterns();
  for (const auto& pattern : patterns) {
    if (pattern.HasErrorSeverity()) {
      summary.error_patterns.push_back(pattern);
    }
  }
  std::stable_sort(summary.error_patterns.begin(), summary.error_patterns.end(), [](const model::LogPattern& a, const model::LogPattern& b) {
    auto errors = [](const model::LogPattern& p) {
      auto it = p.severity_counts.find("ERROR");
      return it == p.severity_counts.end() ? std::uint64_t{0} : it->second;
    };
    return errors(a) > errors(b);
  });
  if (summary.error_patterns.size() > 10) {
    summary.error_patterns.resize(10);
  }

  if (max_patterns > 0 && patterns.size() > max_patterns) {
    patterns.resize(max_patterns);
  }
  summary.top_patterns = std::move(patterns);
  return summary;
}

} // namespace tracelens::logs
