#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if IQ_AGENT_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/tracer.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
    // Recorded on every span so traces can be matched to the reporting agent.
    std::string clientId;
};

struct SpanHandle {
    std::string traceparent;
    bool ended = false;
#if IQ_AGENT_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const;

    SpanHandle StartSpan(const std::string& name);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void EndSpan(SpanHandle& handle, bool success);
    void Shutdown();

private:
    Tracer() = default;

    template <typename T>
    void ApplyAttribute(SpanHandle& handle, const std::string& key, const T& value) {
#if IQ_AGENT_ENABLE_OTEL
        if (enabled_ && handle.span) {
            handle.span->SetAttribute(key, value);
        }
#else
        (void)handle;
        (void)key;
        (void)value;
#endif
    }

    bool enabled_ = false;
    std::string clientId_;
#if IQ_AGENT_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};

// Ends the span on scope exit; failed unless MarkSucceeded() was called.
class ScopedSpan {
public:
    explicit ScopedSpan(const std::string& name);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    const std::string& TraceParent() const;
    void SetAttribute(const std::string& key, const std::string& value);
    void SetAttribute(const std::string& key, int64_t value);
    void MarkSucceeded();

private:
    SpanHandle handle_;
    bool succeeded_ = false;
};
