#pragma once

#include "service_context.hpp"
#include "tracelens/v1.hpp"

namespace tracelens::service {

class StatisticsService {
 public:
  explicit StatisticsService(ServiceContext ctx);

  // Each sub-analysis below its sample minimum is reported as a note; the
  // others still run.
  tracelens::v1::ComputeStatisticsResponse ComputeStatistics(const tracelens::v1::ComputeStatisticsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace tracelens::service
