#include "statistics_service.hpp"

#include <vector>

#include "internal/service/fan_out.hpp"
#include "internal/service/observe.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/stats/statistics.hpp"

namespace tracelens::service {

using namespace tracelens::v1;

StatisticsService::StatisticsService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ComputeStatisticsResponse StatisticsService::ComputeStatistics(const ComputeStatisticsRequest& req) {
  return ObserveAnalysis("StatisticsService.ComputeStatistics", [&] {
    const auto samples    = OrderedSamples(req.current());
    const auto current    = Values(samples);
    const auto historical = Values(OrderedSamples(req.historical()));

    const stats::StatisticsEngine engine(ctx_.settings.statistics);
    FanOut                        fan(ctx_.workers.get());

    auto summary_future  = fan.Submit([&] { return engine.Summarize(current); });
    auto trend_future    = fan.Submit([&] { return engine.DetectTrend(current); });
    auto outliers_future = fan.Submit([&] { return engine.DetectOutliers(current); });

    WaitGuard pending;
    pending.Track(summary_future);
    pending.Track(trend_future);
    pending.Track(outliers_future);

    ComputeStatisticsResponse resp;
    auto*                     report = resp.mutable_report();
    auto*                     notes  = report->mutable_notes();

    if (auto summary = Collect(summary_future, "summary", notes)) {
      *report->mutable_summary() = ToProto(*summary);
      report->set_p50(summary->percentiles.p50);
      report->set_p90(summary->percentiles.p90);
      report->set_p95(summary->percentiles.p95);
      report->set_p99(summary->percentiles.p99);
    }
    if (auto trend = Collect(trend_future, "trend", notes)) {
      *report->mutable_trend() = ToProto(*trend);
    }
    if (auto outliers = Collect(outliers_future, "outliers", notes)) {
      for (const auto& outlier : *outliers) {
        auto* out = report->add_outliers();
        out->set_index(outlier.index);
        out->set_value(outlier.value);
        out->set_z_score(outlier.z_score);
        if (samples[outlier.index].has_timestamp()) {
          *out->mutable_timestamp() = samples[outlier.index].timestamp();
        }
      }
    }

    // Historical comparisons only run when a historical series was given.
    if (historical.empty()) {
      AddNote(notes, "z_score", "no historical series supplied");
      AddNote(notes, "window_comparison", "no historical series supplied");
      return resp;
    }

    auto z_future      = fan.Submit([&] { return engine.ZScore(current, historical); });
    auto window_future = fan.Submit([&] { return engine.CompareWindows(historical, current); });

    WaitGuard comparisons;
    comparisons.Track(z_future);
    comparisons.Track(window_future);

    if (auto z = Collect(z_future, "z_score", notes)) {
      *report->mutable_z_score() = ToProto(*z);
    }
    if (auto window = Collect(window_future, "window_comparison", notes)) {
      *report->mutable_window() = ToProto(*window);
    }
    return resp;
  });
}

} // namespace tracelens::service
