#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/log_server.hpp"
#include "internal/grpc/statistics_server.hpp"
#include "internal/grpc/trace_server.hpp"
#include "internal/service/log_analysis_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/statistics_service.hpp"
#include "internal/service/trace_analysis_service.hpp"
#include "internal/util/errors.hpp"
#include "tracelens/v1.hpp"

namespace {

tracelens::grpc::TraceServer BuildTraceServer() {
  return tracelens::grpc::TraceServer(std::make_shared<tracelens::service::TraceAnalysisService>(tracelens::service::ServiceContext{}));
}

void TestMissingTraceReturnsInvalidArgument() {
  auto server = BuildTraceServer();

  tracelens::v1::CompareTracesRequest req;
  req.mutable_baseline()->set_trace_id("only-baseline");
  tracelens::v1::CompareTracesResponse resp;
  ::grpc::ServerContext                grpc_ctx;

  const auto status = server.CompareTraces(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestEmptyTraceReturnsFailedPrecondition() {
  auto server = BuildTraceServer();

  tracelens::v1::AnalyzeTraceRequest req;
  req.mutable_trace()->set_trace_id("no-spans");
  tracelens::v1::AnalyzeTraceResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = server.AnalyzeTrace(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestShortSeriesStillSucceeds() {
  tracelens::grpc::StatisticsServer server(std::make_shared<tracelens::service::StatisticsService>(tracelens::service::ServiceContext{}));

  tracelens::v1::ComputeStatisticsRequest req;
  req.mutable_current()->add_samples()->set_value(1.0);
  tracelens::v1::ComputeStatisticsResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  const auto status = server.ComputeStatistics(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.report().notes_size() > 0);
}

void TestLogExtractionSucceeds() {
  tracelens::grpc::LogServer server(std::make_shared<tracelens::service::LogAnalysisService>(tracelens::service::ServiceContext{}));

  tracelens::v1::ExtractLogPatternsRequest req;
  auto*                                    record = req.mutable_window()->add_records();
  record->set_severity("INFO");
  record->set_message("service started");
  tracelens::v1::ExtractLogPatternsResponse resp;
  ::grpc::ServerContext                     grpc_ctx;

  const auto status = server.ExtractLogPatterns(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.summary().total_logs() == 1);
}

void TestErrorMapping() {
  assert(tracelens::grpc::ToStatus(tracelens::util::InsufficientData("few")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(tracelens::grpc::ToStatus(tracelens::util::InvalidConfig("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(tracelens::grpc::ToStatus(std::runtime_error("other")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestMissingTraceReturnsInvalidArgument();
  TestEmptyTraceReturnsFailedPrecondition();
  TestShortSeriesStillSucceeds();
  TestLogExtractionSucceeds();
  TestErrorMapping();

  std::cout << "tracelens_unit_grpc_status: pass\n";
  return 0;
}
