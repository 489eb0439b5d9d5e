#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/cache/ttl_cache.hpp"
#include "internal/config/settings.hpp"
#include "internal/logs/log_template_miner.hpp"
#include "internal/model/log_record.hpp"

namespace tracelens::exec {
class WorkerPool;
}

namespace tracelens::service {

// Pattern set mined from one log window.
struct MinedWindow {
  logs::PatternSummary           summary;
  std::vector<model::LogPattern> patterns;
};

using PatternCache = cache::Cache<std::string, std::shared_ptr<const MinedWindow>>;

/*
  Dependency container shared by all services.

  workers == nullptr runs sub-analyses inline on the calling thread;
  pattern_cache == nullptr disables memoisation.
*/
struct ServiceContext {
  config::AnalysisSettings          settings;
  std::shared_ptr<exec::WorkerPool> workers;
  std::shared_ptr<PatternCache>     pattern_cache;
};

} // namespace tracelens::service
