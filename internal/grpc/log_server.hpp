#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/log_analysis_service.hpp"
#include "tracelens/v1/log_service.grpc.pb.h"

namespace tracelens::grpc {

class LogServer final : public tracelens::v1::LogAnalysisService::Service {
 public:
  explicit LogServer(std::shared_ptr<tracelens::service::LogAnalysisService> svc);

  ::grpc::Status ExtractLogPatterns(::grpc::ServerContext*, const tracelens::v1::ExtractLogPatternsRequest*,
                                    tracelens::v1::ExtractLogPatternsResponse*) override;

  ::grpc::Status CompareLogWindows(::grpc::ServerContext*, const tracelens::v1::CompareLogWindowsRequest*,
                                   tracelens::v1::CompareLogWindowsResponse*) override;

 private:
  std::shared_ptr<tracelens::service::LogAnalysisService> service_;
};

} // namespace tracelens::grpc
