// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "calltrace/grpc_server_tracer.h"

#include <cstdlib>
#include <memory>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

#include "opentelemetry/context/propagation/global_propagator.h"
#include "opentelemetry/semconv/exception_attributes.h"
#include "opentelemetry/trace/context.h"
#include "opentelemetry/trace/default_span.h"
#include "opentelemetry/trace/span_context.h"
#include "opentelemetry/trace/span_startoptions.h"

#include "calltrace/grpc_helper.h"
#include "calltrace/tracer_provider.h"

#include <spdlog/spdlog.h>

namespace calltrace {

namespace trace_api = opentelemetry::trace;
namespace context_api = opentelemetry::context;
namespace propagation = opentelemetry::context::propagation;
namespace nostd = opentelemetry::nostd;

namespace {

std::string Demangle(const char* name) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return name;
}

TraceContext InvalidContext() {
    auto ctx = context_api::Context{};
    nostd::shared_ptr<trace_api::Span> noop_span(
        new trace_api::DefaultSpan(trace_api::SpanContext::GetInvalid()));
    return TraceContext(trace_api::SetSpan(ctx, noop_span));
}

}  // namespace

ExceptionDescription DescribeException(std::exception_ptr error) {
    if (!error) {
        return {"unknown", ""};
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return {Demangle(typeid(e).name()), e.what()};
    } catch (...) {
        return {"unknown", ""};
    }
}

GrpcServerTracer::GrpcServerTracer()
    : GrpcServerTracer(TracerProvider::GetTracer(kInstrumentationName, kInstrumentationVersion)) {}

GrpcServerTracer::GrpcServerTracer(
    nostd::shared_ptr<trace_api::Tracer> tracer,
    nostd::shared_ptr<propagation::TextMapPropagator> propagator)
    : tracer_(std::move(tracer)), propagator_(std::move(propagator)) {}

TraceContext GrpcServerTracer::StartSpan(const std::string& method_name, const Metadata& headers) {
    try {
        auto propagator = propagator_ ? propagator_
                                      : propagation::GlobalTextMapPropagator::GetGlobalPropagator();

        // Extract parent context (traceparent, tracestate, baggage) from request metadata
        GrpcMetadataCarrier carrier(headers);
        auto current_ctx = context_api::RuntimeContext::GetCurrent();
        auto parent_ctx = propagator->Extract(carrier, current_ctx);

        trace_api::StartSpanOptions options;
        options.kind = trace_api::SpanKind::kServer;
        options.parent = trace_api::GetSpan(parent_ctx)->GetContext();

        auto span = tracer_->StartSpan(SpanName(method_name), options);

        spdlog::debug("Server span started: {}", method_name);
        return TraceContext(trace_api::SetSpan(parent_ctx, span));

    } catch (const std::exception& e) {
        spdlog::error("Error starting server span for {}: {}", method_name, e.what());
        // Continue without tracing (graceful degradation)
        return InvalidContext();
    }
}

void GrpcServerTracer::SetStatus(const TraceContext& context, const grpc::Status& status) {
    if (context.HasEnded()) {
        spdlog::debug("Span already ended, dropping status {}", static_cast<int>(status.error_code()));
        return;
    }

    try {
        auto span = context.span();
        span->SetAttribute(kRpcGrpcStatusCode, static_cast<int>(status.error_code()));

        if (status.ok()) {
            span->SetStatus(trace_api::StatusCode::kOk);
        } else {
            span->SetStatus(trace_api::StatusCode::kError, status.error_message());
            span->SetAttribute(kRpcGrpcStatusMessage, status.error_message());
        }
    } catch (const std::exception& e) {
        spdlog::error("Error recording server span status: {}", e.what());
    }
}

void GrpcServerTracer::End(const TraceContext& context) {
    if (!context.TryMarkEnded()) {
        spdlog::warn("Server span already ended, ignoring End()");
        return;
    }

    try {
        context.span()->End();
        spdlog::debug("Server span ended");
    } catch (const std::exception& e) {
        spdlog::error("Error ending server span: {}", e.what());
    }
}

void GrpcServerTracer::EndExceptionally(const TraceContext& context, std::exception_ptr error) {
    if (!context.TryMarkEnded()) {
        spdlog::warn("Server span already ended, ignoring EndExceptionally()");
        return;
    }

    try {
        namespace semconv_exception = opentelemetry::semconv::exception;

        auto description = DescribeException(error);
        auto span = context.span();
        span->AddEvent("exception", {
            {semconv_exception::kExceptionType, description.type},
            {semconv_exception::kExceptionMessage, description.message},
        });
        span->SetStatus(trace_api::StatusCode::kError, description.message);
        span->End();

        spdlog::debug("Server span ended exceptionally: {}: {}", description.type, description.message);
    } catch (const std::exception& e) {
        spdlog::error("Error ending server span exceptionally: {}", e.what());
    }
}

}  // namespace calltrace
