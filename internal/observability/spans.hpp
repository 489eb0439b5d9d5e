#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace tracelens::runtime::config {
class RuntimeConfig;
}

namespace tracelens::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"tracelens"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

// Both return false when the exporter is disabled in config or OpenTelemetry
// is not compiled in.
bool InitializeTracing(const tracelens::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const tracelens::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span around one analysis. The span is made active for the lifetime
  of the scope so log lines and nested scopes attach to it.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordAnalysis(std::string_view operation, bool success);
  void ObserveAnalysisLatencyMs(std::string_view operation, double latency_ms);
  void RecordFindings(std::string_view kind, std::uint64_t count);
  void RecordCacheLookup(std::string_view cache, bool hit);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const tracelens::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const tracelens::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordAnalysis(std::string_view, bool) {
}

inline void Metrics::ObserveAnalysisLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordFindings(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordCacheLookup(std::string_view, bool) {
}
#endif

} // namespace tracelens::observability
