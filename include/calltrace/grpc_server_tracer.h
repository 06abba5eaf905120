// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <string>

#include <grpcpp/support/status.h>

#include "opentelemetry/context/propagation/text_map_propagator.h"
#include "opentelemetry/nostd/shared_ptr.h"
#include "opentelemetry/trace/tracer.h"

#include "calltrace/server_call.h"
#include "calltrace/trace_context.h"

namespace calltrace {

inline constexpr const char* kInstrumentationName = "calltrace-grpc-server";
inline constexpr const char* kInstrumentationVersion = "1.0.0";

/**
 * @brief Starts, annotates and terminates the server span of each call
 *
 * The tracer is stateless across calls and may be shared by every call of
 * the process. Each span is terminated at most once: End() and
 * EndExceptionally() claim the TraceContext's latch first, and a second
 * termination of the same span is logged and ignored.
 *
 * Failures inside the OpenTelemetry backend are logged and swallowed so
 * that telemetry never fails the call.
 *
 * Methods are virtual so tests can observe the lifecycle.
 */
class GrpcServerTracer {
public:
    /// Uses the global tracer provider and the global propagator
    GrpcServerTracer();

    /**
     * @param tracer Tracer that creates the spans
     * @param propagator Extracts the parent; the global propagator when null
     */
    explicit GrpcServerTracer(
        opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer,
        opentelemetry::nostd::shared_ptr<opentelemetry::context::propagation::TextMapPropagator>
            propagator = {});

    virtual ~GrpcServerTracer() = default;

    /**
     * @brief Start a server span for a call
     *
     * The parent is extracted from @p headers; without a valid parent the
     * span is a root span. The returned context also carries any baggage
     * found in the headers.
     */
    virtual TraceContext StartSpan(const std::string& method_name, const Metadata& headers);

    /**
     * @brief Record the call's final status without ending the span
     */
    virtual void SetStatus(const TraceContext& context, const grpc::Status& status);

    /**
     * @brief End the span
     */
    virtual void End(const TraceContext& context);

    /**
     * @brief Record @p error as an exception event, mark the span as failed and end it
     */
    virtual void EndExceptionally(const TraceContext& context, std::exception_ptr error);

private:
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
    opentelemetry::nostd::shared_ptr<opentelemetry::context::propagation::TextMapPropagator>
        propagator_;
};

/**
 * @brief Type and message of an exception in a form suitable for span events
 *
 * Non-std::exception values are reported as type "unknown" with an empty message.
 */
struct ExceptionDescription {
    std::string type;
    std::string message;
};

ExceptionDescription DescribeException(std::exception_ptr error);

}  // namespace calltrace
