#pragma once

#include "BackupConfig.hpp"

#include <cstdint>
#include <string>

#if SFTPBACKUP_ENABLE_OTEL
#include <memory>

#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/tracer.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#endif

struct SpanHandle {
    std::string name;
    std::string traceId;
    std::string spanId;
    std::string traceparent;
    // Cleared by EndSpan(); a handle is ended at most once.
    bool valid = false;
#if SFTPBACKUP_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

// W3C trace context header value: 00-<32 hex trace id>-<16 hex span id>-<flags>.
std::string FormatTraceparent(const std::string& traceId, const std::string& spanId, bool sampled);

// One root span per backup run with a child span per pipeline stage. Without
// OpenTelemetry compiled in, spans are ids only so the run report still carries
// a W3C traceparent.
class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceSettings& settings);
    bool Enabled() const;

    SpanHandle StartRun(const std::string& archiveName);
    SpanHandle StartStage(const SpanHandle& run, const std::string& stageName);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void EndSpan(SpanHandle& handle, bool success);
    void Shutdown();

private:
    Tracer() = default;

    SpanHandle Open(const std::string& name, const SpanHandle* parent);
    template <typename Value>
    void Annotate(SpanHandle& handle, const std::string& key, const Value& value);

    bool enabled_ = false;
#if SFTPBACKUP_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};
