#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace woki::runtime::config {
class RuntimeConfig;
}

namespace woki::observability {

/*
  OpenTelemetry export of traces and booking metrics.

  Built only with ENABLE_OTEL; otherwise every call below is a no-op and the
  in-process Metrics snapshot remains the only metric surface.
*/

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"woki"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const woki::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const woki::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

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

// OTel instruments mirroring the Metrics counters and sample windows.
class MetricExporter {
 public:
  static MetricExporter& Instance();

  void CountBookingCreated();
  void CountBookingsCancelled(std::uint64_t count);
  void CountConflict(std::string_view kind);
  void CountLockTimeout();
  void ObserveAssignmentTimeMs(double ms);
  void ObserveLockWaitMs(double ms);
  void RecordOperation(std::string_view op, std::string_view outcome, double latency_ms);

  // Re-creates the instruments from the current global MeterProvider.
  void Bind();
  void Unbind();

 private:
  MetricExporter();
#ifdef ENABLE_OTEL
  struct Impl;
  std::shared_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const woki::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const woki::runtime::config::RuntimeConfig&) {
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

inline MetricExporter::MetricExporter() {
}

inline MetricExporter& MetricExporter::Instance() {
  static MetricExporter instance;
  return instance;
}

inline void MetricExporter::CountBookingCreated() {
}

inline void MetricExporter::CountBookingsCancelled(std::uint64_t) {
}

inline void MetricExporter::CountConflict(std::string_view) {
}

inline void MetricExporter::CountLockTimeout() {
}

inline void MetricExporter::ObserveAssignmentTimeMs(double) {
}

inline void MetricExporter::ObserveLockWaitMs(double) {
}

inline void MetricExporter::RecordOperation(std::string_view, std::string_view, double) {
}

inline void MetricExporter::Bind() {
}

inline void MetricExporter::Unbind() {
}
#endif

} // namespace woki::observability
