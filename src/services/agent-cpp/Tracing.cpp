#include "Tracing.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>

#if IQ_AGENT_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
constexpr const char* kDefaultServiceName = "iq-agent";

std::string RandomHex(size_t bytes) {
    static std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (size_t i = 0; i < bytes; ++i) {
        out << std::setw(2) << std::setfill('0') << dist(rng);
    }
    return out.str();
}

// W3C trace context: version-traceid-parentid-flags.
std::string FormatTraceParent(const std::string& traceId, const std::string& spanId, bool sampled) {
    return "00-" + traceId + "-" + spanId + (sampled ? "-01" : "-00");
}
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    enabled_ = false;
    clientId_ = config.clientId;
    if (!config.enabled) {
        return;
    }

#if IQ_AGENT_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    const std::string serviceName = config.serviceName.empty() ? kDefaultServiceName : config.serviceName;
    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(std::move(exporter));
    opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", serviceName}};
    if (!config.clientId.empty()) {
        attributes.SetAttribute("service.instance.id", config.clientId);
    }
    auto resource = opentelemetry::sdk::resource::Resource::Create(attributes);
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(std::move(processor), resource);

    opentelemetry::trace::Provider::SetTracerProvider(provider_);
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(serviceName);
    enabled_ = true;
#else
    std::cerr << "[Agent] tracing.enabled is set but iq-agent was built without IQ_AGENT_ENABLE_OTEL; "
              << "spans will only be propagated through traceparent headers" << std::endl;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
#if IQ_AGENT_ENABLE_OTEL
    if (enabled_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
        if (!clientId_.empty()) {
            handle.span->SetAttribute("iq.client_id", clientId_);
        }
        const auto context = handle.span->GetContext();
        if (context.IsValid()) {
            handle.traceparent = FormatTraceParent(
                context.trace_id().ToLowerBase16(),
                context.span_id().ToLowerBase16(),
                context.trace_flags().IsSampled());
            return handle;
        }
    }
#else
    (void)name;
#endif

    handle.traceparent = FormatTraceParent(RandomHex(16), RandomHex(8), true);
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
    ApplyAttribute(handle, key, value);
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
    ApplyAttribute(handle, key, value);
}

void Tracer::EndSpan(SpanHandle& handle, bool success) {
    if (handle.ended) {
        return;
    }
    handle.ended = true;

#if IQ_AGENT_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        handle.span->End();
    }
#else
    (void)success;
#endif
}

void Tracer::Shutdown() {
#if IQ_AGENT_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
    }
#endif
    enabled_ = false;
}

ScopedSpan::ScopedSpan(const std::string& name)
    : handle_(Tracer::Instance().StartSpan(name)) {}

ScopedSpan::~ScopedSpan() {
    Tracer::Instance().EndSpan(handle_, succeeded_);
}

const std::string& ScopedSpan::TraceParent() const {
    return handle_.traceparent;
}

void ScopedSpan::SetAttribute(const std::string& key, const std::string& value) {
    Tracer::Instance().SetAttribute(handle_, key, value);
}

void ScopedSpan::SetAttribute(const std::string& key, int64_t value) {
    Tracer::Instance().SetAttribute(handle_, key, value);
}

void ScopedSpan::MarkSucceeded() {
    succeeded_ = true;
}
