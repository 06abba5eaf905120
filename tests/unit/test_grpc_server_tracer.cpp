/**
 * Unit Tests: Server Span Lifecycle
 *
 * These tests verify:
 * - Span start with and without a remote parent
 * - Status mapping from gRPC to span status
 * - Exceptional termination
 * - At most one termination per span
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "opentelemetry/semconv/exception_attributes.h"
#include "opentelemetry/trace/span_metadata.h"

#include "calltrace/grpc_helper.h"
#include "calltrace/grpc_server_tracer.h"
#include "support/tracing_test_support.h"

using namespace calltrace;
using namespace calltrace::test_support;
using opentelemetry::trace::StatusCode;

namespace semconv_exception = opentelemetry::semconv::exception;

// Test fixture for the span lifecycle
class GrpcServerTracerTest : public ::testing::Test {
protected:
    void SetUp() override { tracer_ = tracing_.ServerTracer(); }

    InMemoryTracing tracing_;
    std::shared_ptr<GrpcServerTracer> tracer_;
};

/**
 * Test span start with a W3C traceparent header
 *
 * Expected behavior:
 * - Span joins the remote trace as a child of the remote span
 * - The returned context carries the new span
 */
TEST_F(GrpcServerTracerTest, StartsChildOfRemoteParent) {
    Metadata headers{{"traceparent", "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01"}};

    auto context = tracer_->StartSpan("/calltrace.example.Echo/Say", headers);
    EXPECT_TRUE(context.span()->GetContext().IsValid());
    tracer_->End(context);

    auto spans = tracing_.GetSpans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(std::string(spans[0]->GetName()), "calltrace.example.Echo/Say");
    EXPECT_EQ(spans[0]->GetSpanKind(), opentelemetry::trace::SpanKind::kServer);
    EXPECT_EQ(ToHex(spans[0]->GetTraceId()), "4bf92f3577b34da6a3ce929d0e0e4736");
    EXPECT_EQ(ToHex(spans[0]->GetParentSpanId()), "00f067aa0ba902b7");
}

TEST_F(GrpcServerTracerTest, StartsRootSpanWithoutParent) {
    auto context = tracer_->StartSpan("/calltrace.example.Echo/Say", {});
    tracer_->End(context);

    auto spans = tracing_.GetSpans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_FALSE(spans[0]->GetParentSpanId().IsValid());
}

/**
 * Test status mapping
 *
 * Expected behavior:
 * - OK maps to span status OK
 * - Any other code maps to ERROR with the gRPC message as description
 * - The numeric code is always recorded
 */
TEST_F(GrpcServerTracerTest, MapsGrpcStatusToSpanStatus) {
    auto ok = tracer_->StartSpan("/calltrace.example.Echo/Say", {});
    tracer_->SetStatus(ok, grpc::Status::OK);
    tracer_->End(ok);

    auto failed = tracer_->StartSpan("/calltrace.example.Echo/Say", {});
    tracer_->SetStatus(failed, grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, "too slow"));
    tracer_->End(failed);

    auto spans = tracing_.GetSpans();
    ASSERT_EQ(spans.size(), 2u);

    EXPECT_EQ(spans[0]->GetStatus(), StatusCode::kOk);
    EXPECT_EQ(*FindAttribute<int32_t>(spans[0]->GetAttributes(), kRpcGrpcStatusCode), 0);

    EXPECT_EQ(spans[1]->GetStatus(), StatusCode::kError);
    EXPECT_EQ(std::string(spans[1]->GetDescription()), "too slow");
    EXPECT_EQ(*FindAttribute<int32_t>(spans[1]->GetAttributes(), kRpcGrpcStatusCode),
              static_cast<int32_t>(grpc::StatusCode::DEADLINE_EXCEEDED));
}

TEST_F(GrpcServerTracerTest, EndExceptionallyRecordsExceptionEvent) {
    auto context = tracer_->StartSpan("/calltrace.example.Echo/Say", {});
    tracer_->EndExceptionally(context, std::make_exception_ptr(std::runtime_error("boom")));

    auto spans = tracing_.GetSpans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0]->GetStatus(), StatusCode::kError);
    ASSERT_EQ(spans[0]->GetEvents().size(), 1u);

    const auto& event = spans[0]->GetEvents()[0];
    EXPECT_EQ(event.GetName(), "exception");
    EXPECT_EQ(*FindAttribute<std::string>(event.GetAttributes(), semconv_exception::kExceptionType),
              "std::runtime_error");
    EXPECT_EQ(*FindAttribute<std::string>(event.GetAttributes(), semconv_exception::kExceptionMessage),
              "boom");
}

/**
 * Test repeated termination
 *
 * Expected behavior:
 * - Only the first End() / EndExceptionally() takes effect
 * - SetStatus() after the end is dropped
 * - Copies of the context share the latch
 */
TEST_F(GrpcServerTracerTest, SecondTerminationIsIgnored) {
    auto context = tracer_->StartSpan("/calltrace.example.Echo/Say", {});
    TraceContext copy = context;

    tracer_->End(context);
    EXPECT_TRUE(copy.HasEnded());

    tracer_->End(copy);
    tracer_->EndExceptionally(copy, std::make_exception_ptr(std::runtime_error("late")));
    tracer_->SetStatus(copy, grpc::Status(grpc::StatusCode::INTERNAL, "late"));

    auto spans = tracing_.GetSpans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_TRUE(spans[0]->GetEvents().empty());
    EXPECT_EQ(spans[0]->GetAttributes().count(kRpcGrpcStatusCode), 0u);
}

TEST(DescribeExceptionTest, DescribesStdAndForeignExceptions) {
    auto described = DescribeException(std::make_exception_ptr(std::logic_error("bad state")));
    EXPECT_EQ(described.type, "std::logic_error");
    EXPECT_EQ(described.message, "bad state");

    auto foreign = DescribeException(std::make_exception_ptr(42));
    EXPECT_EQ(foreign.type, "unknown");
    EXPECT_EQ(foreign.message, "");

    EXPECT_EQ(DescribeException(nullptr).type, "unknown");
}

/**
 * Test the scope handle
 *
 * Expected behavior:
 * - MakeCurrent() installs the span until the token is destroyed
 */
TEST_F(GrpcServerTracerTest, MakeCurrentRestoresPreviousContext) {
    auto context = tracer_->StartSpan("/calltrace.example.Echo/Say", {});
    auto before = CurrentSpanId();
    {
        auto scope = context.MakeCurrent();
        EXPECT_EQ(CurrentSpanId(), context.span()->GetContext().span_id());
    }
    EXPECT_EQ(CurrentSpanId(), before);
    tracer_->End(context);
}
