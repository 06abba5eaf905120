// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "calltrace/instrumentation_config.h"

#include <cstdlib>

#include "absl/strings/match.h"

#include <spdlog/spdlog.h>

namespace calltrace {

namespace {

const char* GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return value;
    }
    return nullptr;
}

}  // namespace

InstrumentationConfig LoadInstrumentationConfig() {
    InstrumentationConfig config;
    config.capture_experimental_span_attributes = ParseBooleanProperty(
        GetEnv(kExperimentalSpanAttributesEnv), config.capture_experimental_span_attributes);

    spdlog::debug("Experimental gRPC span attributes: {}",
                  config.capture_experimental_span_attributes ? "enabled" : "disabled");
    return config;
}

const InstrumentationConfig& GlobalInstrumentationConfig() {
    static const InstrumentationConfig config = LoadInstrumentationConfig();
    return config;
}

TracerProviderConfig LoadTracerProviderConfig() {
    TracerProviderConfig config;

    if (const char* endpoint = GetEnv(kOtlpEndpointEnv)) {
        config.otlp_endpoint = endpoint;
    }
    if (const char* service = GetEnv(kServiceNameEnv)) {
        config.service_name = service;
    }
    return config;
}

bool ParseBooleanProperty(const char* value, bool default_value) {
    if (value == nullptr || value[0] == '\0') {
        return default_value;
    }
    return absl::EqualsIgnoreCase(value, "true");
}

std::string ToOtlpHttpTracesUrl(const std::string& endpoint) {
    if (absl::StartsWith(endpoint, "http://") || absl::StartsWith(endpoint, "https://")) {
        if (absl::StrContains(endpoint, "/v1/traces")) {
            return endpoint;
        }
        if (absl::EndsWith(endpoint, "/")) {
            return endpoint + "v1/traces";
        }
        return endpoint + "/v1/traces";
    }
    if (endpoint == "localhost:4317") {
        // gRPC default port, the HTTP exporter listens on 4318
        return "http://localhost:4318/v1/traces";
    }
    return "http://" + endpoint + "/v1/traces";
}

}  // namespace calltrace
