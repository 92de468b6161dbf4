#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/noop.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace strata::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace nostd       = opentelemetry::nostd;

namespace {

constexpr std::chrono::milliseconds kDefaultInterval{1000};

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"strata-db"};
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

using Label = std::pair<nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string MetricsEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  for (const char* name : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name)) {
      return value;
    }
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = MetricsEndpoint(config);
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = MetricsEndpoint(config);
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// SDK releases disagree on reader ownership and on the context argument.
template <typename Provider>
void AttachReader(Provider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Counter>
void Increment(Counter& counter, std::initializer_list<Label> labels) {
  if constexpr (requires { counter.Add(std::uint64_t{1}, labels, opentelemetry::context::Context{}); }) {
    counter.Add(std::uint64_t{1}, labels, opentelemetry::context::Context{});
  } else {
    counter.Add(std::uint64_t{1}, labels);
  }
}

template <typename Histogram>
void Observe(Histogram& histogram, double value, std::initializer_list<Label> labels) {
  if constexpr (requires { histogram.Record(value, labels, opentelemetry::context::Context{}); }) {
    histogram.Record(value, labels, opentelemetry::context::Context{});
  } else {
    histogram.Record(value, labels);
  }
}

bool Install(const OtlpConfig& config, std::chrono::milliseconds interval) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = interval;

  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                              opentelemetry::sdk::resource::Resource::Create({{"service.name", config.service_name}}));
  AttachReader(*provider, sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(config), reader_options));

  g_provider = std::move(provider);
  metrics_api::Provider::SetMeterProvider(nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  Metrics::Instance().Rebind();
  return true;
}

} // namespace

struct Metrics::Instruments {
  nostd::shared_ptr<metrics_api::Meter>                    meter;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> retries;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transactions;
  nostd::shared_ptr<metrics_api::Histogram<double>>      query_duration_ms;
};

bool InitializeMetrics(const strata::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == strata::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                     : OtlpTransport::kGrpc;

  const auto interval = observability.collection_interval_ms() > 0 ? std::chrono::milliseconds(observability.collection_interval_ms())
                                                                   : kDefaultInterval;
  return Install(otlp_config, interval);
}

void ShutdownMetrics() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();

  metrics_api::Provider::SetMeterProvider(nostd::shared_ptr<metrics_api::MeterProvider>(new metrics_api::NoopMeterProvider()));
  Metrics::Instance().Rebind();
}

Metrics::Metrics() {
  Rebind();
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::Rebind() {
  auto instruments   = std::make_shared<Instruments>();
  instruments->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("strata-db", "0.1.0");

  instruments->retries =
      instruments->meter->CreateUInt64Counter("strata.db.transaction.retries", "Transaction attempts repeated after a serialization conflict", "1");
  instruments->transactions = instruments->meter->CreateUInt64Counter("strata.db.transaction.count", "Executed transactions by outcome", "1");
  instruments->query_duration_ms =
      instruments->meter->CreateDoubleHistogram("strata.db.query.duration_ms", "Direct query duration in milliseconds", "ms");

  std::lock_guard<std::mutex> lock(mutex_);
  instruments_ = std::move(instruments);
}

std::shared_ptr<const Metrics::Instruments> Metrics::Current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return instruments_;
}

void Metrics::RecordTransactionRetry() {
  if (auto instruments = Current(); instruments && instruments->retries) {
    Increment(*instruments->retries, {});
  }
}

void Metrics::RecordTransaction(std::string_view outcome) {
  if (auto instruments = Current(); instruments && instruments->transactions) {
    const std::string label(outcome);
    Increment(*instruments->transactions, {{"outcome", nostd::string_view(label)}});
  }
}

void Metrics::ObserveQueryDurationMs(std::string_view kind, double duration_ms) {
  if (auto instruments = Current(); instruments && instruments->query_duration_ms) {
    const std::string label(kind);
    Observe(*instruments->query_duration_ms, duration_ms, {{"kind", nostd::string_view(label)}});
  }
}

} // namespace strata::observability

#endif
