/**
 * Unit Tests: TracerProvider Initialization
 *
 * This test verifies:
 * - No-op behavior before initialization
 * - Idempotent initialization
 * - Global W3C propagator installed for the default server tracer
 * - Shutdown returns to the no-op tracer and allows re-initialization
 *
 * The provider is process-wide, so the whole lifecycle runs in one test.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "calltrace/grpc_server_tracer.h"
#include "calltrace/tracer_provider.h"
#include "support/tracing_test_support.h"

using namespace calltrace;

TEST(TracerProviderTest, LifecycleFromNoopToInitialized) {
    // Before initialization: no-op tracer, nothing to flush
    EXPECT_FALSE(TracerProvider::IsInitialized());
    auto noop_tracer = TracerProvider::GetTracer(kInstrumentationName);
    ASSERT_NE(noop_tracer, nullptr);
    EXPECT_TRUE(TracerProvider::ForceFlush());
    EXPECT_TRUE(TracerProvider::Shutdown());

    // Nothing listens here; spans are only batched until shutdown
    TracerProviderConfig config;
    config.otlp_endpoint = "http://127.0.0.1:1";
    config.service_name = "tracer_provider_test";
    config.export_timeout = std::chrono::seconds(1);

    TracerProvider::Initialize(config);
    ASSERT_TRUE(TracerProvider::IsInitialized());
    TracerProvider::Initialize(config);
    EXPECT_TRUE(TracerProvider::IsInitialized());

    // The default server tracer now continues W3C traces
    GrpcServerTracer tracer;
    Metadata headers{{"traceparent", "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01"}};
    auto context = tracer.StartSpan("/calltrace.example.Echo/Say", headers);
    auto span_context = context.span()->GetContext();
    EXPECT_TRUE(span_context.IsValid());
    EXPECT_EQ(test_support::ToHex(span_context.trace_id()), "4bf92f3577b34da6a3ce929d0e0e4736");
    tracer.End(context);

    // The result depends on the unreachable collector; the state does not
    TracerProvider::Shutdown(1000);
    EXPECT_FALSE(TracerProvider::IsInitialized());
    auto span = TracerProvider::GetTracer(kInstrumentationName)->StartSpan("after-shutdown");
    EXPECT_FALSE(span->GetContext().IsValid());
    span->End();

    TracerProvider::Initialize(config);
    EXPECT_TRUE(TracerProvider::IsInitialized());
    TracerProvider::Shutdown(1000);
    EXPECT_FALSE(TracerProvider::IsInitialized());
}
