#pragma once

#include "service_context.hpp"
#include "tracelens/v1.hpp"

namespace tracelens::service {

class TraceAnalysisService {
 public:
  explicit TraceAnalysisService(ServiceContext ctx);

  tracelens::v1::CompareTracesResponse CompareTraces(const tracelens::v1::CompareTracesRequest& req);

  tracelens::v1::AnalyzeTraceResponse AnalyzeTrace(const tracelens::v1::AnalyzeTraceRequest& req);

  tracelens::v1::ValidateTraceResponse ValidateTrace(const tracelens::v1::ValidateTraceRequest& req);

  tracelens::v1::AnalyzeSpanPatternsResponse AnalyzeSpanPatterns(const tracelens::v1::AnalyzeSpanPatternsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace tracelens::service
