/**
 * Unit Tests: Instrumentation Configuration
 *
 * These tests verify:
 * - Boolean property parsing
 * - Environment variable handling for the instrumentation and the exporter
 * - OTLP endpoint normalization
 */

#include <gtest/gtest.h>

#include <cstdlib>

#include "calltrace/instrumentation_config.h"

using namespace calltrace;

// Test fixture: clean environment around each test
class InstrumentationConfigTest : public ::testing::Test {
protected:
    void SetUp() override { ClearEnvironment(); }
    void TearDown() override { ClearEnvironment(); }

    static void ClearEnvironment() {
        unsetenv(kExperimentalSpanAttributesEnv);
        unsetenv(kOtlpEndpointEnv);
        unsetenv(kServiceNameEnv);
    }
};

TEST_F(InstrumentationConfigTest, ParsesBooleanProperty) {
    EXPECT_TRUE(ParseBooleanProperty("true", false));
    EXPECT_TRUE(ParseBooleanProperty("TRUE", false));
    EXPECT_FALSE(ParseBooleanProperty("false", true));
    EXPECT_FALSE(ParseBooleanProperty("yes", true));
    EXPECT_TRUE(ParseBooleanProperty(nullptr, true));
    EXPECT_FALSE(ParseBooleanProperty("", false));
}

/**
 * Test the experimental attributes switch
 *
 * Expected behavior:
 * - Disabled by default
 * - Enabled by OTEL_INSTRUMENTATION_GRPC_EXPERIMENTAL_SPAN_ATTRIBUTES=true
 */
TEST_F(InstrumentationConfigTest, ExperimentalAttributesFromEnvironment) {
    EXPECT_FALSE(LoadInstrumentationConfig().capture_experimental_span_attributes);

    setenv(kExperimentalSpanAttributesEnv, "true", 1);
    EXPECT_TRUE(LoadInstrumentationConfig().capture_experimental_span_attributes);

    setenv(kExperimentalSpanAttributesEnv, "off", 1);
    EXPECT_FALSE(LoadInstrumentationConfig().capture_experimental_span_attributes);
}

/**
 * Test the export pipeline settings
 *
 * Expected behavior:
 * - Defaults when unset or empty
 * - OTEL_EXPORTER_OTLP_ENDPOINT and OTEL_SERVICE_NAME override them
 */
TEST_F(InstrumentationConfigTest, TracerProviderConfigFromEnvironment) {
    auto defaults = LoadTracerProviderConfig();
    EXPECT_EQ(defaults.otlp_endpoint, "localhost:4317");
    EXPECT_EQ(defaults.service_name, "calltrace-grpc-service");
    EXPECT_EQ(defaults.max_queue_size, 2048u);
    EXPECT_EQ(defaults.max_export_batch_size, 512u);

    setenv(kOtlpEndpointEnv, "http://collector:4318", 1);
    setenv(kServiceNameEnv, "", 1);
    auto config = LoadTracerProviderConfig();
    EXPECT_EQ(config.otlp_endpoint, "http://collector:4318");
    EXPECT_EQ(config.service_name, "calltrace-grpc-service");

    setenv(kServiceNameEnv, "echo", 1);
    EXPECT_EQ(LoadTracerProviderConfig().service_name, "echo");
}

TEST_F(InstrumentationConfigTest, NormalizesOtlpEndpoint) {
    EXPECT_EQ(ToOtlpHttpTracesUrl("localhost:4317"), "http://localhost:4318/v1/traces");
    EXPECT_EQ(ToOtlpHttpTracesUrl("collector:4318"), "http://collector:4318/v1/traces");
    EXPECT_EQ(ToOtlpHttpTracesUrl("http://collector:4318"), "http://collector:4318/v1/traces");
    EXPECT_EQ(ToOtlpHttpTracesUrl("https://collector/"), "https://collector/v1/traces");
    EXPECT_EQ(ToOtlpHttpTracesUrl("http://collector:4318/v1/traces"),
              "http://collector:4318/v1/traces");
}
