#include "application.hpp"

#include "internal/grpc/log_server.hpp"
#include "internal/grpc/statistics_server.hpp"
#include "internal/grpc/trace_server.hpp"

namespace tracelens::grpc {

Application BuildApplication(const tracelens::runtime::config::RuntimeConfig& config) {
  Application app;
  app.services = factory::BuildServices(config);

  app.grpc_services.push_back(std::make_unique<TraceServer>(app.services.traces));
  app.grpc_services.push_back(std::make_unique<StatisticsServer>(app.services.statistics));
  app.grpc_services.push_back(std::make_unique<LogServer>(app.services.logs));
  return app;
}

} // namespace tracelens::grpc
