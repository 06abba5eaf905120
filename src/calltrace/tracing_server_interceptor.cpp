// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "calltrace/tracing_server_interceptor.h"

#include "opentelemetry/semconv/incubating/rpc_attributes.h"
#include "opentelemetry/semconv/network_attributes.h"

#include "calltrace/grpc_helper.h"
#include "calltrace/peer_address.h"

#include <spdlog/spdlog.h>

namespace calltrace {

// ==============================================================================
// Interceptor Entry Point
// ==============================================================================

std::shared_ptr<TracingServerInterceptor> TracingServerInterceptor::Create() {
    return Create(std::make_shared<GrpcServerTracer>(), GlobalInstrumentationConfig());
}

std::shared_ptr<TracingServerInterceptor> TracingServerInterceptor::Create(
    std::shared_ptr<GrpcServerTracer> tracer, InstrumentationConfig config) {
    return std::make_shared<TracingServerInterceptor>(std::move(tracer), config);
}

TracingServerInterceptor::TracingServerInterceptor(
    std::shared_ptr<GrpcServerTracer> tracer, InstrumentationConfig config)
    : tracer_(std::move(tracer)), config_(config) {}

std::unique_ptr<ServerCallListener> TracingServerInterceptor::InterceptCall(
    std::shared_ptr<ServerCall> call,
    const Metadata& headers,
    ServerCallHandler& next) {
    namespace semconv_network = opentelemetry::semconv::network;

    std::string method_name = call->MethodName();
    TraceContext context = tracer_->StartSpan(method_name, headers);
    auto span = context.span();

    std::string peer = call->Peer();
    if (auto address = ParsePeerAddress(peer)) {
        span->SetAttribute(semconv_network::kNetworkPeerAddress, address->host);
        span->SetAttribute(semconv_network::kNetworkPeerPort, static_cast<int64_t>(address->port));
    } else {
        spdlog::debug("[{}] Peer '{}' is not an IP endpoint, skipping peer attributes",
                      method_name, peer);
    }
    PrepareSpan(*span, method_name);

    std::unique_ptr<ServerCallListener> delegate;
    try {
        auto scope = context.MakeCurrent();
        delegate = next.StartCall(
            std::make_shared<TracingServerCall>(std::move(call), context, tracer_), headers);
    } catch (...) {
        tracer_->EndExceptionally(context, std::current_exception());
        throw;
    }

    if (!delegate) {
        spdlog::warn("[{}] Handler returned no listener, using a no-op listener", method_name);
        delegate = std::make_unique<ServerCallListener>();
    }

    return std::make_unique<TracingServerCallListener>(
        std::move(delegate), std::move(context), tracer_,
        config_.capture_experimental_span_attributes);
}

// ==============================================================================
// Call Wrapper
// ==============================================================================

TracingServerCall::TracingServerCall(std::shared_ptr<ServerCall> delegate,
                                     TraceContext context,
                                     std::shared_ptr<GrpcServerTracer> tracer)
    : ForwardingServerCall(std::move(delegate)),
      context_(std::move(context)),
      tracer_(std::move(tracer)) {}

void TracingServerCall::Close(const grpc::Status& status, const Metadata& trailers) {
    tracer_->SetStatus(context_, status);
    try {
        auto scope = context_.MakeCurrent();
        ForwardingServerCall::Close(status, trailers);
    } catch (...) {
        tracer_->EndExceptionally(context_, std::current_exception());
        throw;
    }
}

// ==============================================================================
// Callback Listener Wrapper
// ==============================================================================

TracingServerCallListener::TracingServerCallListener(
    std::unique_ptr<ServerCallListener> delegate,
    TraceContext context,
    std::shared_ptr<GrpcServerTracer> tracer,
    bool capture_experimental_span_attributes)
    : ForwardingServerCallListener(std::move(delegate)),
      context_(std::move(context)),
      tracer_(std::move(tracer)),
      capture_experimental_span_attributes_(capture_experimental_span_attributes) {}

template <typename Fn>
void TracingServerCallListener::RunInContext(Fn&& fn, const char* terminal_callback) {
    try {
        auto scope = context_.MakeCurrent();
        fn();
    } catch (...) {
        if (terminal_callback == nullptr || Terminate(terminal_callback)) {
            tracer_->EndExceptionally(context_, std::current_exception());
        }
        throw;
    }
}

void TracingServerCallListener::OnMessage(const void* message) {
    namespace semconv_rpc = opentelemetry::semconv::rpc;

    WarnIfTerminated("OnMessage");
    int64_t message_id = message_id_.fetch_add(1, std::memory_order_acq_rel) + 1;

    if (state() == State::kActive && !context_.HasEnded()) {
        context_.span()->AddEvent(kMessageEventName, {
            {semconv_rpc::kRpcMessageType, kMessageTypeReceived},
            {semconv_rpc::kRpcMessageId, message_id},
        });
    }
    RunInContext([&] { ForwardingServerCallListener::OnMessage(message); });
}

void TracingServerCallListener::OnHalfClose() {
    WarnIfTerminated("OnHalfClose");
    RunInContext([this] { ForwardingServerCallListener::OnHalfClose(); });
}

void TracingServerCallListener::OnCancel() {
    RunInContext([this] {
        ForwardingServerCallListener::OnCancel();
        if (capture_experimental_span_attributes_ && state() == State::kActive &&
            !context_.HasEnded()) {
            context_.span()->SetAttribute(kGrpcCanceled, true);
        }
    }, "OnCancel");

    if (Terminate("OnCancel")) {
        tracer_->End(context_);
    }
}

void TracingServerCallListener::OnComplete() {
    RunInContext([this] { ForwardingServerCallListener::OnComplete(); }, "OnComplete");

    if (Terminate("OnComplete")) {
        tracer_->End(context_);
    }
}

void TracingServerCallListener::OnReady() {
    WarnIfTerminated("OnReady");
    RunInContext([this] { ForwardingServerCallListener::OnReady(); });
}

bool TracingServerCallListener::Terminate(const char* callback) {
    State expected = State::kActive;
    if (state_.compare_exchange_strong(expected, State::kTerminated, std::memory_order_acq_rel)) {
        return true;
    }
    spdlog::error("{} delivered after the call already terminated, span is not ended again", callback);
    return false;
}

void TracingServerCallListener::WarnIfTerminated(const char* callback) const {
    if (state() == State::kTerminated) {
        spdlog::warn("{} delivered after the call terminated", callback);
    }
}

}  // namespace calltrace
