#include "Tracing.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

#if SFTPBACKUP_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/span_startoptions.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
constexpr const char* kInstrumentationName = "sftp-backup";
constexpr size_t kTraceIdBytes = 16;
constexpr size_t kSpanIdBytes = 8;

std::string MakeHexId(size_t bytes) {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> byteValue(0, 255);

    std::ostringstream id;
    id << std::hex << std::setfill('0');
    for (size_t index = 0; index < bytes; ++index) {
        id << std::setw(2) << byteValue(generator);
    }
    return id.str();
}

#if SFTPBACKUP_ENABLE_OTEL
std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> MakeProvider(const TraceSettings& settings) {
    namespace otlp = opentelemetry::exporter::otlp;
    namespace sdktrace = opentelemetry::sdk::trace;

    otlp::OtlpHttpExporterOptions exporterOptions;
    if (!settings.endpoint.empty()) {
        exporterOptions.url = settings.endpoint;
    }

    const std::string serviceName = settings.serviceName.empty() ? kInstrumentationName : settings.serviceName;
    auto processor = std::make_unique<sdktrace::BatchSpanProcessor>(std::make_unique<otlp::OtlpHttpExporter>(exporterOptions));
    return std::make_shared<sdktrace::TracerProvider>(
        std::move(processor),
        opentelemetry::sdk::resource::Resource::Create({{"service.name", serviceName}}));
}
#endif
} // namespace

std::string FormatTraceparent(const std::string& traceId, const std::string& spanId, bool sampled) {
    return "00-" + traceId + "-" + spanId + (sampled ? "-01" : "-00");
}

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceSettings& settings) {
    enabled_ = false;
    if (!settings.enabled) {
        return;
    }

#if SFTPBACKUP_ENABLE_OTEL
    provider_ = MakeProvider(settings);
    opentelemetry::trace::Provider::SetTracerProvider(provider_);
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(kInstrumentationName);
    enabled_ = static_cast<bool>(tracer_);
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartRun(const std::string& archiveName) {
    SpanHandle run = Open("backup.run", nullptr);
    SetAttribute(run, "backup.archive_name", archiveName);
    return run;
}

SpanHandle Tracer::StartStage(const SpanHandle& run, const std::string& stageName) {
    return Open(stageName, &run);
}

SpanHandle Tracer::Open(const std::string& name, const SpanHandle* parent) {
    SpanHandle handle;
    handle.name = name;
    handle.traceId = parent != nullptr && !parent->traceId.empty() ? parent->traceId : MakeHexId(kTraceIdBytes);
    handle.spanId = MakeHexId(kSpanIdBytes);
    bool sampled = true;

#if SFTPBACKUP_ENABLE_OTEL
    if (enabled_) {
        opentelemetry::trace::StartSpanOptions options;
        if (parent != nullptr && parent->span) {
            options.parent = parent->span->GetContext();
        }
        handle.span = tracer_->StartSpan(name, options);

        const auto context = handle.span->GetContext();
        if (context.IsValid()) {
            handle.traceId = context.trace_id().ToLowerBase16();
            handle.spanId = context.span_id().ToLowerBase16();
            sampled = context.trace_flags().IsSampled();
        }
    }
#endif

    handle.traceparent = FormatTraceparent(handle.traceId, handle.spanId, sampled);
    handle.valid = true;
    return handle;
}

template <typename Value>
void Tracer::Annotate(SpanHandle& handle, const std::string& key, const Value& value) {
#if SFTPBACKUP_ENABLE_OTEL
    if (enabled_ && handle.valid && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
    Annotate(handle, key, value);
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
    Annotate(handle, key, value);
}

void Tracer::EndSpan(SpanHandle& handle, bool success) {
    if (!handle.valid) {
        return;
    }
    handle.valid = false;

#if SFTPBACKUP_ENABLE_OTEL
    if (handle.span) {
        using opentelemetry::trace::StatusCode;
        handle.span->SetStatus(success ? StatusCode::kOk : StatusCode::kError);
        handle.span->End();
    }
#else
    (void)success;
#endif
}

void Tracer::Shutdown() {
#if SFTPBACKUP_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
        provider_.reset();
    }
#endif
    enabled_ = false;
}
