#include "log_server.hpp"

#include "grpc_error.hpp"

namespace tracelens::grpc {

LogServer::LogServer(std::shared_ptr<tracelens::service::LogAnalysisService> svc) : service_(std::move(svc)) {
}

::grpc::Status LogServer::ExtractLogPatterns(::grpc::ServerContext*, const tracelens::v1::ExtractLogPatternsRequest* req,
                                             tracelens::v1::ExtractLogPatternsResponse* resp) {
  try {
    *resp = service_->ExtractLogPatterns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LogServer::CompareLogWindows(::grpc::ServerContext*, const tracelens::v1::CompareLogWindowsRequest* req,
                                            tracelens::v1::CompareLogWindowsResponse* resp) {
  try {
    *resp = service_->CompareLogWindows(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tracelens::grpc
