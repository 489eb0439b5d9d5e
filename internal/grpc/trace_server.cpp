#include "trace_server.hpp"

#include "grpc_error.hpp"

namespace tracelens::grpc {

TraceServer::TraceServer(std::shared_ptr<tracelens::service::TraceAnalysisService> svc) : service_(std::move(svc)) {
}

::grpc::Status TraceServer::CompareTraces(::grpc::ServerContext*, const tracelens::v1::CompareTracesRequest* req,
                                          tracelens::v1::CompareTracesResponse* resp) {
  try {
    *resp = service_->CompareTraces(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::AnalyzeTrace(::grpc::ServerContext*, const tracelens::v1::AnalyzeTraceRequest* req,
                                         tracelens::v1::AnalyzeTraceResponse* resp) {
  try {
    *resp = service_->AnalyzeTrace(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::ValidateTrace(::grpc::ServerContext*, const tracelens::v1::ValidateTraceRequest* req,
                                          tracelens::v1::ValidateTraceResponse* resp) {
  try {
    *resp = service_->ValidateTrace(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TraceServer::AnalyzeSpanPatterns(::grpc::ServerContext*, const tracelens::v1::AnalyzeSpanPatternsRequest* req,
                                                tracelens::v1::AnalyzeSpanPatternsResponse* resp) {
  try {
    *resp = service_->AnalyzeSpanPatterns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tracelens::grpc
