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
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace profile::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

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

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
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

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> loads;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> saves;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      save_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      lock_wait_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   active_gauge;

  std::atomic<std::int64_t> active_profiles{0};
};

bool InitializeMetrics(const profile::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == profile::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }
  if (observability.metrics_export_interval_ms() > 0) {
    otlp_config.export_interval_ms = observability.metrics_export_interval_ms();
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("profile-store", "0.1.0");

  impl_->loads           = impl_->meter->CreateUInt64Counter("profile.loads", "Profile load attempts by outcome", "1");
  impl_->saves           = impl_->meter->CreateUInt64Counter("profile.saves", "Profile save attempts by result", "1");
  impl_->save_latency_ms = impl_->meter->CreateDoubleHistogram("profile.save.latency", "Version-chain save latency", "ms");
  impl_->lock_wait_ms    = impl_->meter->CreateDoubleHistogram("profile.lock.wait", "Time spent waiting on a held session lock", "ms");
  impl_->active_gauge    = impl_->meter->CreateInt64ObservableGauge("profile.active", "Profiles attached in this process", "1");
  impl_->active_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->active_profiles.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordLoad(std::string_view outcome) {
  if (!impl_ || !impl_->loads) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  impl_->loads->Add(1, attributes);
}

void Metrics::RecordSave(std::string_view result) {
  if (!impl_ || !impl_->saves) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"result", std::string(result)}};
  impl_->saves->Add(1, attributes);
}

void Metrics::ObserveSaveLatencyMs(double latency_ms) {
  if (impl_ && impl_->save_latency_ms) {
    impl_->save_latency_ms->Record(latency_ms, opentelemetry::context::Context{});
  }
}

void Metrics::ObserveLockWaitMs(double wait_ms) {
  if (impl_ && impl_->lock_wait_ms) {
    impl_->lock_wait_ms->Record(wait_ms, opentelemetry::context::Context{});
  }
}

void Metrics::SetActiveProfiles(std::uint64_t count) {
  if (impl_) {
    impl_->active_profiles.store(static_cast<std::int64_t>(count));
  }
}

} // namespace profile::observability

#endif
