#include "factory.hpp"

#include <string>

#include "internal/cache/ttl_cache.hpp"
#include "internal/observability/logging.hpp"

namespace tracelens::factory {

Services BuildServices(const tracelens::runtime::config::RuntimeConfig& config) {
  Services services;
  services.settings = config::ResolveSettings(config);

  // ------------------------------------------------------------------
  // Workers
  // ------------------------------------------------------------------
  services.workers = std::make_shared<exec::WorkerPool>(services.settings.worker_threads);
  services.workers->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.settings = services.settings;
  ctx.workers  = services.workers;
  if (services.settings.cache.enabled) {
    ctx.pattern_cache = std::make_shared<cache::TtlCache<std::string, std::shared_ptr<const service::MinedWindow>>>(services.settings.cache.max_entries);
  }

  services.traces     = std::make_shared<service::TraceAnalysisService>(ctx);
  services.statistics = std::make_shared<service::StatisticsService>(ctx);
  services.logs       = std::make_shared<service::LogAnalysisService>(ctx);

  TRACELENS_LOG_INFO("Analysis engine ready", {observability::IntField("workers", static_cast<std::int64_t>(services.workers->size())),
                                               observability::BoolField("pattern_cache", static_cast<bool>(ctx.pattern_cache)),
                                               observability::StringField("match_strategy", trace::ToString(services.settings.comparator.strategy))});
  return services;
}

} // namespace tracelens::factory
