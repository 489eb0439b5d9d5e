#include "log_analysis_service.hpp"

#include <future>
#include <vector>

#include "internal/logs/log_template_miner.hpp"
#include "internal/logs/pattern_comparator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/fan_out.hpp"
#include "internal/service/observe.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/hash.hpp"

namespace tracelens::service {

using namespace tracelens::v1;

namespace {

constexpr std::string_view kCacheName = "log_patterns";

// Delimiters keep ("a", "bc") and ("ab", "c") apart in the fingerprint.
constexpr char kFieldSeparator  = '\x1f';
constexpr char kRecordSeparator = '\x1e';

} // namespace

LogAnalysisService::LogAnalysisService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string LogAnalysisService::CacheKey(const model::LogWindow& window) {
  auto hash = util::Fnv1a64("");
  for (const auto& record : window.records) {
    hash = util::Fnv1a64(record.severity, hash);
    hash = util::Fnv1a64(std::string_view(&kFieldSeparator, 1), hash);
    hash = util::Fnv1a64(record.message, hash);
    hash = util::Fnv1a64(std::string_view(&kRecordSeparator, 1), hash);
  }
  const auto fingerprint = util::ToHex(hash) + ":" + std::to_string(window.records.size());
  if (!window.window_id.empty()) {
    return "id:" + window.window_id + ":" + fingerprint;
  }
  return "fp:" + fingerprint;
}

std::shared_ptr<const MinedWindow> LogAnalysisService::Mine(const model::LogWindow& window) const {
  const auto key = ctx_.pattern_cache ? CacheKey(window) : std::string();
  if (ctx_.pattern_cache) {
    auto cached = ctx_.pattern_cache->Get(key);
    observability::Metrics::Instance().RecordCacheLookup(kCacheName, cached.has_value());
    if (cached) {
      return *cached;
    }
  }

  logs::LogTemplateMiner miner(ctx_.settings.miner);
  for (const auto& record : window.records) {
    miner.Add(record);
  }

  auto mined      = std::make_shared<MinedWindow>();
  mined->summary  = miner.Summarize(ctx_.settings.max_patterns);
  mined->patterns = miner.Patterns();

  if (miner.unmatched() > 0) {
    TRACELENS_LOG_WARN("Log lines left unclustered", {observability::StringField("window_id", window.window_id),
                                                       observability::IntField("unmatched", static_cast<std::int64_t>(miner.unmatched())),
                                                       observability::IntField("max_clusters", static_cast<std::int64_t>(ctx_.settings.miner.max_clusters))});
  }

  if (ctx_.pattern_cache) {
    ctx_.pattern_cache->Put(key, mined, ctx_.settings.cache.ttl);
  }
  return mined;
}

// ------------------------------------------------------------
// Operations
// ------------------------------------------------------------

ExtractLogPatternsResponse LogAnalysisService::ExtractLogPatterns(const ExtractLogPatternsRequest& req) {
  return ObserveAnalysis("LogAnalysisService.ExtractLogPatterns", [&] {
    const auto mined = Mine(FromProto(req.window()));

    ExtractLogPatternsResponse resp;
    *resp.mutable_summary() = ToProto(mined->summary);
    for (const auto& pattern : mined->patterns) {
      *resp.add_patterns() = ToProto(pattern);
    }
    return resp;
  });
}

CompareLogWindowsResponse LogAnalysisService::CompareLogWindows(const CompareLogWindowsRequest& req) {
  return ObserveAnalysis("LogAnalysisService.CompareLogWindows", [&] {
    const auto baseline_window   = FromProto(req.baseline_window());
    const auto comparison_window = FromProto(req.comparison_window());

    FanOut fan(ctx_.workers.get());

    std::vector<std::future<std::shared_ptr<const MinedWindow>>> mining;
    mining.push_back(fan.Submit([&] { return Mine(baseline_window); }));
    mining.push_back(fan.Submit([&] { return Mine(comparison_window); }));
    const auto  windows    = GetAll(mining);
    const auto& baseline   = *windows[0];
    const auto& comparison = *windows[1];

    const auto result = logs::PatternComparator(ctx_.settings.log_comparison)
                            .Compare(baseline.patterns, baseline.summary.total_logs, comparison.patterns, comparison.summary.total_logs);

    CompareLogWindowsResponse resp;
    auto*                     report = resp.mutable_report();

    if (baseline_window.records.empty()) {
      AddNote(report->mutable_notes(), "baseline_window", "no log records; every comparison pattern is reported as new");
    }
    if (comparison_window.records.empty()) {
      AddNote(report->mutable_notes(), "comparison_window", "no log records");
    }

    const auto limit = ctx_.settings.max_patterns;
    for (std::size_t i = 0; i < comparison.patterns.size() && i < limit; ++i) {
      *report->add_patterns() = ToProto(comparison.patterns[i]);
    }
    for (const auto& pattern : result.new_patterns) {
      *report->add_new_patterns() = ToProto(pattern);
    }
    for (const auto& change : result.increased) {
      *report->add_increased_patterns() = ToProto(change);
    }
    for (const auto& change : result.decreased) {
      *report->add_decreased_patterns() = ToProto(change);
    }
    for (const auto& pattern : result.disappeared) {
      *report->add_disappeared_patterns() = ToProto(pattern);
    }
    report->set_alert_level(ToProto(result.alert_level));
    report->set_baseline_total(result.baseline_total);
    report->set_comparison_total(result.comparison_total);

    observability::Metrics::Instance().RecordFindings("new_log_pattern", result.new_patterns.size());
    if (result.alert_level != logs::AlertLevel::kLow) {
      TRACELENS_LOG_INFO("Log pattern shift detected", {observability::StringField("alert_level", logs::ToString(result.alert_level)),
                                                         observability::IntField("new_patterns", static_cast<std::int64_t>(result.new_patterns.size())),
                                                         observability::IntField("increased", static_cast<std::int64_t>(result.increased.size()))});
    }
    return resp;
  });
}

} // namespace tracelens::service
