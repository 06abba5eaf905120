// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "calltrace/tracer_provider.h"

#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "opentelemetry/baggage/propagation/baggage_propagator.h"
#include "opentelemetry/context/propagation/composite_propagator.h"
#include "opentelemetry/context/propagation/global_propagator.h"
#include "opentelemetry/exporters/otlp/otlp_http_exporter_factory.h"
#include "opentelemetry/exporters/otlp/otlp_http_exporter_options.h"
#include "opentelemetry/sdk/trace/batch_span_processor_factory.h"
#include "opentelemetry/sdk/trace/batch_span_processor_options.h"
#include "opentelemetry/sdk/trace/tracer_provider.h"
#include "opentelemetry/sdk/trace/tracer_provider_factory.h"
#include "opentelemetry/semconv/incubating/host_attributes.h"
#include "opentelemetry/semconv/incubating/process_attributes.h"
#include "opentelemetry/semconv/service_attributes.h"
#include "opentelemetry/semconv/telemetry_attributes.h"
#include "opentelemetry/trace/noop.h"
#include "opentelemetry/trace/propagation/http_trace_context.h"
#include "opentelemetry/trace/provider.h"
#include "opentelemetry/version.h"

// For host name and process ID
#include <limits.h>
#include <unistd.h>

// Define HOST_NAME_MAX if not available (macOS)
#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif

#include <spdlog/spdlog.h>

namespace calltrace {

namespace nostd = opentelemetry::nostd;
namespace sdktrace = opentelemetry::sdk::trace;
namespace propagation = opentelemetry::context::propagation;

std::atomic<bool> TracerProvider::initialized_{false};

static std::mutex g_init_mutex;

void TracerProvider::Initialize(const TracerProviderConfig& config) {
    if (initialized_.load(std::memory_order_acquire)) {
        spdlog::debug("TracerProvider already initialized, skipping");
        return;
    }

    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (initialized_.load(std::memory_order_relaxed)) {
        return;
    }

    try {
        spdlog::info("Initializing OpenTelemetry TracerProvider...");
        spdlog::info("  OTLP Endpoint: {}", config.otlp_endpoint);
        spdlog::info("  Service Name: {}", config.service_name);

        opentelemetry::exporter::otlp::OtlpHttpExporterOptions exporter_options;
        exporter_options.url = ToOtlpHttpTracesUrl(config.otlp_endpoint);
        exporter_options.timeout = config.export_timeout;

        auto exporter = opentelemetry::exporter::otlp::OtlpHttpExporterFactory::Create(exporter_options);
        if (!exporter) {
            throw std::runtime_error("Failed to create OTLP HTTP exporter");
        }

        sdktrace::BatchSpanProcessorOptions processor_options;
        processor_options.max_queue_size = config.max_queue_size;
        processor_options.schedule_delay_millis = config.schedule_delay;
        processor_options.max_export_batch_size = config.max_export_batch_size;

        auto processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), processor_options);
        if (!processor) {
            throw std::runtime_error("Failed to create BatchSpanProcessor");
        }

        auto provider_unique = sdktrace::TracerProviderFactory::Create(
            std::move(processor), CreateResource(config.service_name));
        if (!provider_unique) {
            throw std::runtime_error("Failed to create TracerProvider");
        }

        nostd::shared_ptr<opentelemetry::trace::TracerProvider> provider{
            std::unique_ptr<opentelemetry::trace::TracerProvider>{std::move(provider_unique)}
        };
        opentelemetry::trace::Provider::SetTracerProvider(provider);
        InstallPropagator();

        initialized_.store(true, std::memory_order_release);
        spdlog::info("OpenTelemetry TracerProvider initialized, exporting to {}", exporter_options.url);

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize TracerProvider: {}", e.what());
        spdlog::warn("Tracing will be disabled, but application will continue");
    }
}

nostd::shared_ptr<opentelemetry::trace::Tracer> TracerProvider::GetTracer(
    const std::string& instrumentation_scope,
    const std::string& version
) {
    // The API returns a no-op provider until one is installed
    return opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(
        instrumentation_scope, version);
}

bool TracerProvider::Shutdown(uint32_t timeout_millis) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (!initialized_.load(std::memory_order_acquire)) {
        spdlog::debug("TracerProvider not initialized, nothing to shutdown");
        return true;
    }

    spdlog::info("Shutting down TracerProvider...");

    try {
        auto provider = opentelemetry::trace::Provider::GetTracerProvider();
        auto* sdk_provider = dynamic_cast<sdktrace::TracerProvider*>(provider.get());
        if (sdk_provider) {
            bool result = sdk_provider->Shutdown(std::chrono::milliseconds(timeout_millis));
            if (result) {
                spdlog::info("TracerProvider shutdown successfully");
            } else {
                spdlog::warn("TracerProvider shutdown timed out or failed");
            }
            ResetToNoop();
            return result;
        }
    } catch (const std::exception& e) {
        spdlog::error("Error during TracerProvider shutdown: {}", e.what());
        ResetToNoop();
        return false;
    }

    ResetToNoop();
    return true;
}

// Called with g_init_mutex held
void TracerProvider::ResetToNoop() {
    nostd::shared_ptr<opentelemetry::trace::TracerProvider> noop{
        new opentelemetry::trace::NoopTracerProvider()};
    opentelemetry::trace::Provider::SetTracerProvider(noop);
    initialized_.store(false, std::memory_order_release);
}

bool TracerProvider::ForceFlush(uint32_t timeout_millis) {
    if (!initialized_.load(std::memory_order_acquire)) {
        spdlog::debug("TracerProvider not initialized, nothing to flush");
        return true;
    }

    try {
        auto provider = opentelemetry::trace::Provider::GetTracerProvider();
        auto* sdk_provider = dynamic_cast<sdktrace::TracerProvider*>(provider.get());
        if (sdk_provider) {
            bool result = sdk_provider->ForceFlush(std::chrono::milliseconds(timeout_millis));
            if (!result) {
                spdlog::warn("TracerProvider force flush timed out or failed");
            }
            return result;
        }
    } catch (const std::exception& e) {
        spdlog::error("Error during TracerProvider force flush: {}", e.what());
        return false;
    }

    return true;
}

bool TracerProvider::IsInitialized() {
    return initialized_.load(std::memory_order_acquire);
}

void TracerProvider::InstallPropagator() {
    std::vector<std::unique_ptr<propagation::TextMapPropagator>> propagators;
    propagators.push_back(std::make_unique<opentelemetry::trace::propagation::HttpTraceContext>());
    propagators.push_back(std::make_unique<opentelemetry::baggage::propagation::BaggagePropagator>());

    propagation::GlobalTextMapPropagator::SetGlobalPropagator(
        nostd::shared_ptr<propagation::TextMapPropagator>(
            new propagation::CompositePropagator(std::move(propagators))));
}

opentelemetry::sdk::resource::Resource TracerProvider::CreateResource(const std::string& service_name) {
    namespace resource = opentelemetry::sdk::resource;
    namespace semconv_service = opentelemetry::semconv::service;
    namespace semconv_host = opentelemetry::semconv::host;
    namespace semconv_process = opentelemetry::semconv::process;
    namespace semconv_telemetry = opentelemetry::semconv::telemetry;

    char hostname[HOST_NAME_MAX + 1] = {0};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        spdlog::warn("Failed to get hostname, using 'unknown'");
        std::strncpy(hostname, "unknown", sizeof(hostname) - 1);
    }

    auto attributes = resource::ResourceAttributes{
        {semconv_service::kServiceName, service_name},
        {semconv_host::kHostName, std::string(hostname)},
        {semconv_process::kProcessPid, static_cast<int32_t>(getpid())},
        {semconv_telemetry::kTelemetrySdkName, "opentelemetry-cpp"},
        {semconv_telemetry::kTelemetrySdkLanguage, "cpp"},
        {semconv_telemetry::kTelemetrySdkVersion, OPENTELEMETRY_VERSION}
    };

    return resource::Resource::Create(attributes);
}

}  // namespace calltrace
