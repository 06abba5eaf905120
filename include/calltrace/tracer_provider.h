// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "opentelemetry/nostd/shared_ptr.h"
#include "opentelemetry/sdk/resource/resource.h"
#include "opentelemetry/trace/tracer.h"

#include "calltrace/instrumentation_config.h"

namespace calltrace {

/**
 * @brief Process-wide OpenTelemetry tracing pipeline
 *
 * Installs, until Shutdown():
 * - an OTLP/HTTP exporter sending to the configured collector
 * - a BatchSpanProcessor so span export never blocks a call
 * - resource attributes (service.name, host.name, process.pid, telemetry.sdk.*)
 * - W3C trace context + baggage as the global propagator
 *
 * Until Initialize() succeeds GetTracer() hands out the no-op tracer, so
 * instrumented servers keep working without a collector.
 *
 * Thread Safety: All public methods are thread-safe
 *
 * Example Usage:
 * @code
 *   calltrace::TracerProvider::Initialize();
 *   // ... run the server ...
 *   calltrace::TracerProvider::Shutdown();
 * @endcode
 */
class TracerProvider {
public:
    /**
     * @brief Initialize the global tracer provider
     *
     * Idempotent. Failures are logged and leave tracing disabled; the
     * application continues.
     */
    static void Initialize(const TracerProviderConfig& config = LoadTracerProviderConfig());

    /**
     * @brief Get a tracer for an instrumentation scope
     *
     * @param instrumentation_scope Scope name (e.g., "calltrace-grpc-server")
     * @param version Optional version string for the instrumentation scope
     */
    static opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> GetTracer(
        const std::string& instrumentation_scope,
        const std::string& version = "1.0.0"
    );

    /**
     * @brief Flush pending spans and shut the pipeline down
     *
     * Reinstalls the no-op provider whatever the outcome, so GetTracer()
     * stops handing out tracers of the dead pipeline and Initialize() may
     * run again.
     *
     * @param timeout_millis Maximum time to wait for flush (default: 5000ms)
     * @return true if shutdown completed successfully, false on timeout/error
     */
    static bool Shutdown(uint32_t timeout_millis = 5000);

    /**
     * @brief Export all batched spans now
     *
     * @param timeout_millis Maximum time to wait for flush (default: 5000ms)
     * @return true if flush completed successfully, false on timeout/error
     */
    static bool ForceFlush(uint32_t timeout_millis = 5000);

    static bool IsInitialized();

    TracerProvider(const TracerProvider&) = delete;
    TracerProvider& operator=(const TracerProvider&) = delete;

private:
    TracerProvider() = default;

    static opentelemetry::sdk::resource::Resource CreateResource(const std::string& service_name);

    static void InstallPropagator();

    static void ResetToNoop();

    static std::atomic<bool> initialized_;
};

}  // namespace calltrace
