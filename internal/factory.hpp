#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/settings.hpp"
#include "internal/exec/worker_pool.hpp"
#include "internal/service/log_analysis_service.hpp"
#include "internal/service/statistics_service.hpp"
#include "internal/service/trace_analysis_service.hpp"

namespace tracelens::factory {

/*
  Services

  Owns the long-lived analysis services and the shared worker pool. The
  pool is started and stops when the last owner releases it.
*/
struct Services {
  config::AnalysisSettings settings;

  std::shared_ptr<exec::WorkerPool> workers;

  std::shared_ptr<service::TraceAnalysisService> traces;
  std::shared_ptr<service::StatisticsService>    statistics;
  std::shared_ptr<service::LogAnalysisService>   logs;
};

/*
  BuildServices

  Composition root of the analysis engine. Resolves settings from the
  runtime config (throwing util::InvalidConfig on bad values), starts the
  workers and wires the pattern cache.
*/
Services BuildServices(const tracelens::runtime::config::RuntimeConfig& config);

} // namespace tracelens::factory
