#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/trace_analysis_service.hpp"
#include "tracelens/v1/trace_service.grpc.pb.h"

namespace tracelens::grpc {

class TraceServer final : public tracelens::v1::TraceAnalysisService::Service {
 public:
  explicit TraceServer(std::shared_ptr<tracelens::service::TraceAnalysisService> svc);

  ::grpc::Status CompareTraces(::grpc::ServerContext*, const tracelens::v1::CompareTracesRequest*,
                               tracelens::v1::CompareTracesResponse*) override;

  ::grpc::Status AnalyzeTrace(::grpc::ServerContext*, const tracelens::v1::AnalyzeTraceRequest*,
                              tracelens::v1::AnalyzeTraceResponse*) override;

  ::grpc::Status ValidateTrace(::grpc::ServerContext*, const tracelens::v1::ValidateTraceRequest*,
                               tracelens::v1::ValidateTraceResponse*) override;

  ::grpc::Status AnalyzeSpanPatterns(::grpc::ServerContext*, const tracelens::v1::AnalyzeSpanPatternsRequest*,
                                     tracelens::v1::AnalyzeSpanPatternsResponse*) override;

 private:
  std::shared_ptr<tracelens::service::TraceAnalysisService> service_;
};

} // namespace tracelens::grpc
