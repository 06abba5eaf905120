// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace calltrace {

inline constexpr const char* kExperimentalSpanAttributesEnv =
    "OTEL_INSTRUMENTATION_GRPC_EXPERIMENTAL_SPAN_ATTRIBUTES";
inline constexpr const char* kOtlpEndpointEnv = "OTEL_EXPORTER_OTLP_ENDPOINT";
inline constexpr const char* kServiceNameEnv = "OTEL_SERVICE_NAME";

/// Settings of the server call instrumentation itself
struct InstrumentationConfig {
    // Record "grpc.canceled" on cancelled calls
    bool capture_experimental_span_attributes = false;
};

/// Settings of the process-wide export pipeline
struct TracerProviderConfig {
    std::string otlp_endpoint = "localhost:4317";
    std::string service_name = "calltrace-grpc-service";

    std::size_t max_queue_size = 2048;
    std::chrono::milliseconds schedule_delay{5000};
    std::size_t max_export_batch_size = 512;
    std::chrono::seconds export_timeout{10};
};

/**
 * @brief Read InstrumentationConfig from the environment
 *
 * Environment Variables:
 * - OTEL_INSTRUMENTATION_GRPC_EXPERIMENTAL_SPAN_ATTRIBUTES (default: false)
 */
InstrumentationConfig LoadInstrumentationConfig();

/**
 * @brief Process configuration, loaded on first use and cached afterwards
 */
const InstrumentationConfig& GlobalInstrumentationConfig();

/**
 * @brief Read TracerProviderConfig from the environment
 *
 * Environment Variables:
 * - OTEL_EXPORTER_OTLP_ENDPOINT: OTLP collector endpoint (default: localhost:4317)
 * - OTEL_SERVICE_NAME: Service name for resource attributes (default: calltrace-grpc-service)
 */
TracerProviderConfig LoadTracerProviderConfig();

/**
 * @brief Parse a boolean property
 *
 * "true" in any letter case is true, any other non-empty value is false;
 * a null or empty value yields @p default_value.
 */
bool ParseBooleanProperty(const char* value, bool default_value);

/**
 * @brief Convert an OTLP endpoint to the OTLP/HTTP traces URL
 *
 * "http://collector:4318"        -> "http://collector:4318/v1/traces"
 * "localhost:4317" (gRPC default) -> "http://localhost:4318/v1/traces"
 * "collector:4318"               -> "http://collector:4318/v1/traces"
 */
std::string ToOtlpHttpTracesUrl(const std::string& endpoint);

}  // namespace calltrace
