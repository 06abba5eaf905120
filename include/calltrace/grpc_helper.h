// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include "opentelemetry/context/propagation/text_map_propagator.h"
#include "opentelemetry/nostd/function_ref.h"
#include "opentelemetry/nostd/string_view.h"
#include "opentelemetry/trace/span.h"

#include "calltrace/server_call.h"

namespace calltrace {

// Attributes without a stable semantic convention constant
inline constexpr const char* kRpcGrpcStatusCode = "rpc.grpc.status_code";
inline constexpr const char* kRpcGrpcStatusMessage = "rpc.grpc.status_message";
inline constexpr const char* kGrpcCanceled = "grpc.canceled";

inline constexpr const char* kMessageEventName = "message";
inline constexpr const char* kMessageTypeReceived = "RECEIVED";

/**
 * @brief Extract method name from full gRPC method path
 * Example: "/calltrace.example.Echo/Say" -> "Say"
 */
std::string ExtractMethodName(const std::string& full_method);

/**
 * @brief Extract service name from full gRPC method path
 * Example: "/calltrace.example.Echo/Say" -> "calltrace.example.Echo"
 */
std::string ExtractServiceName(const std::string& full_method);

/**
 * @brief Span name for a full method path: the path without its leading '/'
 * Example: "/calltrace.example.Echo/Say" -> "calltrace.example.Echo/Say"
 */
std::string SpanName(const std::string& full_method);

/**
 * @brief Set the conventional RPC attributes on a server span
 *
 * rpc.system = "grpc", rpc.service and rpc.method derived from @p full_method
 */
void PrepareSpan(opentelemetry::trace::Span& span, const std::string& full_method);

/**
 * @brief Read-only TextMapCarrier over request metadata
 *
 * Lets an OpenTelemetry propagator extract W3C trace context
 * (traceparent / tracestate / baggage) from the call's headers.
 * Lookups are case-insensitive; the first value of a repeated key wins.
 */
class GrpcMetadataCarrier : public opentelemetry::context::propagation::TextMapCarrier {
public:
    explicit GrpcMetadataCarrier(const Metadata& metadata) : metadata_(metadata) {}

    opentelemetry::nostd::string_view Get(
        opentelemetry::nostd::string_view key) const noexcept override;

    // Extraction only
    void Set(opentelemetry::nostd::string_view /*key*/,
             opentelemetry::nostd::string_view /*value*/) noexcept override {}

    bool Keys(opentelemetry::nostd::function_ref<bool(opentelemetry::nostd::string_view)> callback)
        const noexcept override;

private:
    const Metadata& metadata_;
};

}  // namespace calltrace
