// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "calltrace/grpc_server_tracer.h"
#include "calltrace/instrumentation_config.h"
#include "calltrace/server_call.h"
#include "calltrace/trace_context.h"

namespace calltrace {

/**
 * @brief Server interceptor that traces every call it sees
 *
 * For each call it:
 * - starts a server span, parented to the trace context found in the headers
 * - records the peer address and the rpc.* attributes
 * - runs the next handler with the span current
 * - wraps the call so the final status lands on the span
 * - wraps the listener so every callback runs with the span current and the
 *   terminal callback (cancel or complete) ends the span
 *
 * Exceptions thrown by the next handler, the call or the listener are
 * recorded on the span and rethrown unchanged.
 *
 * Thread Safety: one instance can serve any number of concurrent calls
 *
 * Usage:
 * @code
 *   auto tracing = calltrace::TracingServerInterceptor::Create();
 *   auto handler = calltrace::InterceptHandler(tracing, app_handler);
 * @endcode
 */
class TracingServerInterceptor : public ServerInterceptor {
public:
    /// Default tracer and the process configuration
    static std::shared_ptr<TracingServerInterceptor> Create();

    static std::shared_ptr<TracingServerInterceptor> Create(
        std::shared_ptr<GrpcServerTracer> tracer,
        InstrumentationConfig config = InstrumentationConfig{});

    TracingServerInterceptor(std::shared_ptr<GrpcServerTracer> tracer, InstrumentationConfig config);

    std::unique_ptr<ServerCallListener> InterceptCall(
        std::shared_ptr<ServerCall> call,
        const Metadata& headers,
        ServerCallHandler& next) override;

private:
    std::shared_ptr<GrpcServerTracer> tracer_;
    InstrumentationConfig config_;
};

/**
 * @brief Call handed to the next handler; records the final status on Close()
 *
 * Close() sets the span status but does not end the span: the listener's
 * terminal callback does.
 */
class TracingServerCall : public ForwardingServerCall {
public:
    TracingServerCall(std::shared_ptr<ServerCall> delegate,
                      TraceContext context,
                      std::shared_ptr<GrpcServerTracer> tracer);

    void Close(const grpc::Status& status, const Metadata& trailers) override;

private:
    TraceContext context_;
    std::shared_ptr<GrpcServerTracer> tracer_;
};

/**
 * @brief Listener that replays each callback inside the call's trace context
 *
 * States: kActive -> kTerminated. The single transition is taken by the
 * first OnCancel() or OnComplete() and ends the span. The framework
 * delivers exactly one terminal callback per call; a duplicate is logged
 * and does not end the span again.
 */
class TracingServerCallListener : public ForwardingServerCallListener {
public:
    enum class State { kActive, kTerminated };

    TracingServerCallListener(std::unique_ptr<ServerCallListener> delegate,
                              TraceContext context,
                              std::shared_ptr<GrpcServerTracer> tracer,
                              bool capture_experimental_span_attributes);

    void OnMessage(const void* message) override;
    void OnHalfClose() override;
    void OnCancel() override;
    void OnComplete() override;
    void OnReady() override;

    State state() const { return state_.load(std::memory_order_acquire); }

    /// Number of messages received so far
    int64_t messages_received() const { return message_id_.load(std::memory_order_acquire); }

private:
    // Runs fn with the trace context current. If fn throws, the exception is
    // recorded after the previous context is restored, then rethrown. A
    // throwing terminal callback also takes the kTerminated transition.
    template <typename Fn>
    void RunInContext(Fn&& fn, const char* terminal_callback = nullptr);

    // kActive -> kTerminated; false if the call had already terminated
    bool Terminate(const char* callback);

    void WarnIfTerminated(const char* callback) const;

    TraceContext context_;
    std::shared_ptr<GrpcServerTracer> tracer_;
    bool capture_experimental_span_attributes_;

    std::atomic<State> state_{State::kActive};
    std::atomic<int64_t> message_id_{0};
};

}  // namespace calltrace
