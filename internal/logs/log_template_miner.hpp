#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/log_record.hpp"

namespace tracelens::logs {

struct MinerOptions {
  double      similarity_threshold = 0.5;
  std::size_t max_clusters         = 1000;
};

struct PatternSummary {
  std::uint64_t                        total_logs      = 0;
  std::uint64_t                        unique_patterns = 0;
  std::uint64_t                        unmatched_logs  = 0;
  std::map<std::string, std::uint64_t> severity_distribution;
  double                               compression_ratio = 0;
  std::vector<model::LogPattern>       top_patterns;
  std::vector<model::LogPattern>       error_patterns;
};

/*
  Incremental log template miner.

  A line joins the most similar cluster of equal token count when the
  similarity (matching tokens over non-wildcard template positions) reaches
  the threshold; positions that disagree widen to the wildcard. Otherwise
  a new cluster is created, until max_clusters is reached, after which the
  line is counted as unmatched.

  A masked line is pinned to the cluster it first joined. Later lines with
  the same masked form go to that cluster even if another template has
  since widened to cover them, so Add() and Match() agree on every line
  already mined. Match() never changes the clusters.
*/
class LogTemplateMiner {
 public:
  explicit LogTemplateMiner(MinerOptions options = {});

  // Cluster id the record was assigned to; nullopt when the cluster table is
  // full and nothing matched.
  std::optional<std::uint64_t> Add(const model::LogRecord& record);

  std::optional<std::uint64_t> Match(std::string_view message) const;

  // Sorted by count (descending), then cluster id.
  std::vector<model::LogPattern> Patterns() const;

  const model::LogPattern* Find(std::uint64_t cluster_id) const;

  PatternSummary Summarize(std::size_t max_patterns = 20) const;

  std::uint64_t total_logs() const { return total_logs_; }
  std::uint64_t unmatched() const { return unmatched_; }
  std::size_t   cluster_count() const { return clusters_.size(); }

  static double Similarity(const std::vector<std::string>& template_tokens, const std::vector<std::string>& tokens);

 private:
  struct Candidate {
    std::size_t position;
    double      similarity;
  };

  std::optional<Candidate> BestCluster(const std::vector<std::string>& tokens) const;

  MinerOptions options_;

  // cluster_id == position + 1
  std::vector<model::LogPattern>                            clusters_;
  std::unordered_map<std::size_t, std::vector<std::size_t>> by_length_;

  // masked line -> cluster position
  std::unordered_map<std::string, std::size_t> assigned_;

  std::uint64_t total_logs_ = 0;
  std::uint64_t unmatched_  = 0;
};

} // namespace tracelens::logs
