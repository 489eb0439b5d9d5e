#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/statistics_service.hpp"
#include "tracelens/v1/statistics_service.grpc.pb.h"

namespace tracelens::grpc {

class StatisticsServer final : public tracelens::v1::StatisticsService::Service {
 public:
  explicit StatisticsServer(std::shared_ptr<tracelens::service::StatisticsService> svc);

  ::grpc::Status ComputeStatistics(::grpc::ServerContext*, const tracelens::v1::ComputeStatisticsRequest*,
                                   tracelens::v1::ComputeStatisticsResponse*) override;

 private:
  std::shared_ptr<tracelens::service::StatisticsService> service_;
};

} // namespace tracelens::grpc
