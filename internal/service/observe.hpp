#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace tracelens::service {

/*
  Runs one service operation inside a span, recording outcome and latency.
  Failures are logged with the operation name and rethrown unchanged.
*/
template <typename Fn>
auto ObserveAnalysis(std::string_view operation, Fn&& fn) -> std::invoke_result_t<Fn> {
  observability::SpanScope span(operation);

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    auto result = fn();
    observability::Metrics::Instance().RecordAnalysis(operation, true);
    observability::Metrics::Instance().ObserveAnalysisLatencyMs(operation, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    TRACELENS_LOG_ERROR("Analysis failed", {observability::StringField("operation", operation), observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordAnalysis(operation, false);
    observability::Metrics::Instance().ObserveAnalysisLatencyMs(operation, elapsed_ms());
    throw;
  }
}

} // namespace tracelens::service
