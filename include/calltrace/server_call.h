// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>

#include <grpcpp/support/status.h>

namespace calltrace {

/// Request headers or trailers of one call. Keys are lower-case.
using Metadata = std::multimap<std::string, std::string>;

/**
 * @brief Server side of one RPC invocation, owned by the framework
 *
 * The framework creates a call when a request arrives and closes it exactly
 * once. Handlers and interceptors share it through std::shared_ptr.
 */
class ServerCall {
public:
    virtual ~ServerCall() = default;

    /// Full method name, e.g. "/calltrace.example.Echo/Say"
    virtual std::string MethodName() const = 0;

    /// Remote peer in gRPC URI form ("ipv4:10.0.0.1:5000"), empty if unknown
    virtual std::string Peer() const = 0;

    virtual bool IsCancelled() const = 0;

    /// Ends the call with a final status and trailing metadata
    virtual void Close(const grpc::Status& status, const Metadata& trailers) = 0;
};

/**
 * @brief Callback sink for one call
 *
 * Callbacks for a single call are delivered sequentially. Exactly one of
 * OnCancel() or OnComplete() is the last callback of the call.
 * The default implementations do nothing.
 */
class ServerCallListener {
public:
    virtual ~ServerCallListener() = default;

    /// A request message was received; the pointer is valid for the call only
    virtual void OnMessage(const void* /*message*/) {}

    /// The client finished sending messages
    virtual void OnHalfClose() {}

    /// The call was cancelled by the client or the transport
    virtual void OnCancel() {}

    /// The call completed normally
    virtual void OnComplete() {}

    /// The call can accept more outgoing messages
    virtual void OnReady() {}
};

class ServerCallHandler {
public:
    virtual ~ServerCallHandler() = default;

    virtual std::unique_ptr<ServerCallListener> StartCall(
        std::shared_ptr<ServerCall> call, const Metadata& headers) = 0;
};

/**
 * @brief Cross-cutting step inserted in front of a ServerCallHandler
 *
 * An interceptor may wrap the call before passing it to @p next and may wrap
 * the listener returned by @p next.
 */
class ServerInterceptor {
public:
    virtual ~ServerInterceptor() = default;

    virtual std::unique_ptr<ServerCallListener> InterceptCall(
        std::shared_ptr<ServerCall> call,
        const Metadata& headers,
        ServerCallHandler& next) = 0;
};

/// Call that forwards every operation to a delegate
class ForwardingServerCall : public ServerCall {
public:
    explicit ForwardingServerCall(std::shared_ptr<ServerCall> delegate)
        : delegate_(std::move(delegate)) {}

    std::string MethodName() const override { return delegate_->MethodName(); }
    std::string Peer() const override { return delegate_->Peer(); }
    bool IsCancelled() const override { return delegate_->IsCancelled(); }

    void Close(const grpc::Status& status, const Metadata& trailers) override {
        delegate_->Close(status, trailers);
    }

protected:
    ServerCall& delegate() const { return *delegate_; }

private:
    std::shared_ptr<ServerCall> delegate_;
};

/// Listener that forwards every callback to a delegate
class ForwardingServerCallListener : public ServerCallListener {
public:
    explicit ForwardingServerCallListener(std::unique_ptr<ServerCallListener> delegate)
        : delegate_(std::move(delegate)) {}

    void OnMessage(const void* message) override { delegate_->OnMessage(message); }
    void OnHalfClose() override { delegate_->OnHalfClose(); }
    void OnCancel() override { delegate_->OnCancel(); }
    void OnComplete() override { delegate_->OnComplete(); }
    void OnReady() override { delegate_->OnReady(); }

protected:
    ServerCallListener& delegate() const { return *delegate_; }

private:
    std::unique_ptr<ServerCallListener> delegate_;
};

/**
 * @brief Returns a handler that runs @p interceptor in front of @p next
 *
 * Chains compose from the outside in:
 * @code
 *   auto handler = calltrace::InterceptHandler(tracing, app_handler);
 * @endcode
 */
std::shared_ptr<ServerCallHandler> InterceptHandler(
    std::shared_ptr<ServerInterceptor> interceptor,
    std::shared_ptr<ServerCallHandler> next);

}  // namespace calltrace
