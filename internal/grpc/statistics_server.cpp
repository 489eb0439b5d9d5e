#include "statistics_server.hpp"

#include "grpc_error.hpp"

namespace tracelens::grpc {

StatisticsServer::StatisticsServer(std::shared_ptr<tracelens::service::StatisticsService> svc) : service_(std::move(svc)) {
}

::grpc::Status StatisticsServer::ComputeStatistics(::grpc::ServerContext*, const tracelens::v1::ComputeStatisticsRequest* req,
                                                   tracelens::v1::ComputeStatisticsResponse* resp) {
  try {
    *resp = service_->ComputeStatistics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tracelens::grpc
