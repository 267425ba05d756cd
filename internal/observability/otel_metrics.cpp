#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace woki::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::mutex                                 g_provider_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

constexpr std::uint32_t kDefaultExportIntervalMs = 1000;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct MetricExporter::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> bookings_created;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> bookings_cancelled;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> conflicts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lock_timeouts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operations;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      assignment_time_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      lock_wait_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      operation_latency_ms;
};

namespace {

std::mutex g_impl_mutex;

} // namespace

bool InitializeMetrics(const woki::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == woki::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                   : OtlpTransport::kGrpc;

  const auto& metric_config = observability.metrics();

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(metric_config.export_interval_ms() > 0 ? metric_config.export_interval_ms() : kDefaultExportIntervalMs);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(otlp_config), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                              resource::Resource::Create(attrs));
  provider->AddMetricReader(std::move(reader));

  {
    std::lock_guard<std::mutex> lock(g_provider_mutex);
    g_provider = provider;
    metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  }

  MetricExporter::Instance().Bind();
  return true;
}

void ShutdownMetrics() {
  MetricExporter::Instance().Unbind();

  std::lock_guard<std::mutex> lock(g_provider_mutex);
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// ------------------------------------------------------------------
// MetricExporter
// ------------------------------------------------------------------

MetricExporter::MetricExporter() = default;

MetricExporter& MetricExporter::Instance() {
  static MetricExporter instance;
  return instance;
}

void MetricExporter::Bind() {
  auto impl  = std::make_shared<Impl>();
  impl->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("woki", "0.1.0");

  impl->bookings_created     = impl->meter->CreateUInt64Counter("woki.bookings.created", "Reservations persisted", "1");
  impl->bookings_cancelled   = impl->meter->CreateUInt64Counter("woki.bookings.cancelled", "Reservations cancelled", "1");
  impl->conflicts            = impl->meter->CreateUInt64Counter("woki.booking.conflicts", "Rejected booking attempts by kind", "1");
  impl->lock_timeouts        = impl->meter->CreateUInt64Counter("woki.lock.timeouts", "Lock acquisitions that timed out", "1");
  impl->operations           = impl->meter->CreateUInt64Counter("woki.operation.count", "Engine operations by outcome", "1");
  impl->assignment_time_ms   = impl->meter->CreateDoubleHistogram("woki.booking.assignment_time_ms", "Candidate selection to persisted reservation", "ms");
  impl->lock_wait_ms         = impl->meter->CreateDoubleHistogram("woki.lock.wait_time_ms", "Time queued behind another lock holder", "ms");
  impl->operation_latency_ms = impl->meter->CreateDoubleHistogram("woki.operation.latency_ms", "End-to-end engine operation latency", "ms");

  std::lock_guard<std::mutex> lock(g_impl_mutex);
  impl_ = std::move(impl);
}

void MetricExporter::Unbind() {
  std::lock_guard<std::mutex> lock(g_impl_mutex);
  impl_.reset();
}

namespace {

template <typename Impl>
std::shared_ptr<Impl> Load(const std::shared_ptr<Impl>& impl) {
  std::lock_guard<std::mutex> lock(g_impl_mutex);
  return impl;
}

} // namespace

void MetricExporter::CountBookingCreated() {
  if (auto impl = Load(impl_)) {
    AddWithAttributes(impl->bookings_created, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
  }
}

void MetricExporter::CountBookingsCancelled(std::uint64_t count) {
  if (auto impl = Load(impl_)) {
    AddWithAttributes(impl->bookings_cancelled, count, std::initializer_list<AttributePair>{});
  }
}

void MetricExporter::CountConflict(std::string_view kind) {
  if (auto impl = Load(impl_)) {
    const std::string                          kind_name(kind);
    const std::initializer_list<AttributePair> attributes = {{"kind", kind_name}};
    AddWithAttributes(impl->conflicts, static_cast<std::uint64_t>(1), attributes);
  }
}

void MetricExporter::CountLockTimeout() {
  if (auto impl = Load(impl_)) {
    AddWithAttributes(impl->lock_timeouts, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
  }
}

void MetricExporter::ObserveAssignmentTimeMs(double ms) {
  if (auto impl = Load(impl_)) {
    RecordWithAttributes(impl->assignment_time_ms, ms, std::initializer_list<AttributePair>{});
  }
}

void MetricExporter::ObserveLockWaitMs(double ms) {
  if (auto impl = Load(impl_)) {
    RecordWithAttributes(impl->lock_wait_ms, ms, std::initializer_list<AttributePair>{});
  }
}

void MetricExporter::RecordOperation(std::string_view op, std::string_view outcome, double latency_ms) {
  auto impl = Load(impl_);
  if (!impl) {
    return;
  }

  const std::string op_name(op);
  const std::string outcome_name(outcome);

  const std::initializer_list<AttributePair> counted = {{"op", op_name}, {"outcome", outcome_name}};
  AddWithAttributes(impl->operations, static_cast<std::uint64_t>(1), counted);

  const std::initializer_list<AttributePair> timed = {{"op", op_name}};
  RecordWithAttributes(impl->operation_latency_ms, latency_ms, timed);
}

} // namespace woki::observability

#endif
