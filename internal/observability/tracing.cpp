#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace fnpipe::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using fnpipe::runtime::config::ObservabilityConfig;

namespace {

constexpr const char* kTracerName    = "fnpipe";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

bool UsesHttp(const ObservabilityConfig& config) {
  return config.transport() == fnpipe::runtime::config::OTLP_TRANSPORT_HTTP;
}

// Config wins over the standard OTLP environment variables.
std::string ResolveEndpoint(const ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }
  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(name)) {
      return endpoint;
    }
  }
  return UsesHttp(config) ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const ObservabilityConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (UsesHttp(config)) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kTracerName, kTracerVersion);
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const fnpipe::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  // A run is short-lived; export spans as they end instead of batching.
  auto processor = sdktrace::SimpleSpanProcessorFactory::Create(BuildExporter(config.observability()));
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor),
                                                           resource::Resource::Create({{"service.name", std::string(kTracerName)}}));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct PipelineSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

PipelineSpan::PipelineSpan(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = Tracer();
  if (!tracer) {
    return;
  }
  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

PipelineSpan::~PipelineSpan() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

PipelineSpan::PipelineSpan(PipelineSpan&&) noexcept            = default;
PipelineSpan& PipelineSpan::operator=(PipelineSpan&&) noexcept = default;

PipelineSpan PipelineSpan::ForRun(std::size_t planned_invocations) {
  PipelineSpan span("fnpipe.run");
  span.SetAttribute("fnpipe.invocations", static_cast<std::int64_t>(planned_invocations));
  return span;
}

PipelineSpan PipelineSpan::ForInvocation(std::size_t sequence, std::string_view function, std::string_view anchor) {
  PipelineSpan span("fnpipe.invocation");
  span.SetAttribute("fnpipe.seq", static_cast<std::int64_t>(sequence));
  span.SetAttribute("fnpipe.function", function);
  span.SetAttribute("fnpipe.anchor", anchor);
  return span;
}

void PipelineSpan::SetState(std::string_view state) {
  SetAttribute("fnpipe.state", state);
}

void PipelineSpan::SetExitCode(int exit_code) {
  SetAttribute("fnpipe.exit_code", static_cast<std::int64_t>(exit_code));
}

void PipelineSpan::Fail(std::string_view reason) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(reason)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(reason));
  }
}

void PipelineSpan::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void PipelineSpan::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

} // namespace fnpipe::observability

#endif
