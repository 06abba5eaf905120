// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <mutex>

#include <grpcpp/grpcpp.h>
#include <grpcpp/support/server_interceptor.h>

#include "calltrace/server_call.h"

namespace calltrace {

/**
 * @brief Drives a ServerInterceptor from gRPC C++ interception hook points
 *
 * gRPC C++ exposes a call as batches of hook points rather than as a
 * listener. This bridge turns them into the ServerCall / ServerCallListener
 * model, in this order within a batch:
 *
 * | Hook point                  | Call model                                   |
 * |-----------------------------|----------------------------------------------|
 * | POST_RECV_INITIAL_METADATA  | ServerInterceptor::InterceptCall()           |
 * | POST_RECV_MESSAGE           | OnMessage(), OnHalfClose() on null message   |
 * | POST_SEND_MESSAGE           | OnReady()                                    |
 * | PRE_SEND_STATUS             | ServerCall::Close() on the intercepted call  |
 * | POST_RECV_CLOSE             | OnCancel() or OnComplete()                   |
 *
 * Unary and server-streaming clients send exactly one message, so the
 * half-close is reported right after it.
 *
 * The bridge only observes: the service handler still runs as registered.
 * Callbacks of one RPC are serialized; exceptions are logged and never
 * reach gRPC core threads.
 */
class GrpcServerCallBridge : public grpc::experimental::Interceptor {
public:
    GrpcServerCallBridge(grpc::experimental::ServerRpcInfo* info,
                         std::shared_ptr<ServerInterceptor> interceptor);

    void Intercept(grpc::experimental::InterceptorBatchMethods* methods) override;

private:
    class RpcInfoCall;

    void StartCall(grpc::experimental::InterceptorBatchMethods* methods);
    void DispatchMessage(grpc::experimental::InterceptorBatchMethods* methods);
    void DispatchClose(grpc::experimental::InterceptorBatchMethods* methods);
    void DispatchTermination();

    bool ClientSendsSingleMessage() const;

    grpc::experimental::ServerRpcInfo* rpc_info_;
    std::shared_ptr<ServerInterceptor> interceptor_;

    std::mutex mu_;
    std::shared_ptr<ServerCall> intercepted_call_;
    std::unique_ptr<ServerCallListener> listener_;
};

/**
 * @brief Factory registering call tracing with a gRPC C++ server
 *
 * Usage:
 * @code
 *   std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> creators;
 *   creators.push_back(std::make_unique<calltrace::ServerTracingInterceptorFactory>());
 *   builder.experimental().SetInterceptorCreators(std::move(creators));
 * @endcode
 */
class ServerTracingInterceptorFactory
    : public grpc::experimental::ServerInterceptorFactoryInterface {
public:
    /// Traces with TracingServerInterceptor::Create()
    ServerTracingInterceptorFactory();

    explicit ServerTracingInterceptorFactory(std::shared_ptr<ServerInterceptor> interceptor);

    grpc::experimental::Interceptor* CreateServerInterceptor(
        grpc::experimental::ServerRpcInfo* info) override;

private:
    std::shared_ptr<ServerInterceptor> interceptor_;
};

}  // namespace calltrace
