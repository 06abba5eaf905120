// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "calltrace/grpc_interceptor_bridge.h"

#include <string>

#include "calltrace/tracing_server_interceptor.h"

#include <spdlog/spdlog.h>

namespace calltrace {

using HP = grpc::experimental::InterceptionHookPoints;

namespace {

// Last handler of the chain: the service itself runs outside the bridge, so
// this only remembers the call the interceptors handed down.
class ObservingCallHandler : public ServerCallHandler {
public:
    std::unique_ptr<ServerCallListener> StartCall(
        std::shared_ptr<ServerCall> call, const Metadata& /*headers*/) override {
        call_ = std::move(call);
        return std::make_unique<ServerCallListener>();
    }

    std::shared_ptr<ServerCall> call() const { return call_; }

private:
    std::shared_ptr<ServerCall> call_;
};

}  // namespace

// ServerCall view of a gRPC RPC. gRPC sends the status itself once the
// PRE_SEND_STATUS batch proceeds, so Close() has nothing left to do.
class GrpcServerCallBridge::RpcInfoCall : public ServerCall {
public:
    explicit RpcInfoCall(grpc::experimental::ServerRpcInfo* info) : info_(info) {}

    std::string MethodName() const override {
        const char* method = info_->method();
        return method ? method : "";
    }

    std::string Peer() const override {
        auto* server_context = info_->server_context();
        return server_context ? server_context->peer() : "";
    }

    bool IsCancelled() const override {
        auto* server_context = info_->server_context();
        return server_context && server_context->IsCancelled();
    }

    void Close(const grpc::Status& status, const Metadata& /*trailers*/) override {
        spdlog::debug("[{}] Closing with status {}", MethodName(), static_cast<int>(status.error_code()));
    }

private:
    grpc::experimental::ServerRpcInfo* info_;
};

GrpcServerCallBridge::GrpcServerCallBridge(grpc::experimental::ServerRpcInfo* info,
                                           std::shared_ptr<ServerInterceptor> interceptor)
    : rpc_info_(info), interceptor_(std::move(interceptor)) {}

void GrpcServerCallBridge::Intercept(grpc::experimental::InterceptorBatchMethods* methods) {
    try {
        std::lock_guard<std::mutex> lock(mu_);

        if (methods->QueryInterceptionHookPoint(HP::POST_RECV_INITIAL_METADATA)) {
            StartCall(methods);
        }

        if (listener_) {
            if (methods->QueryInterceptionHookPoint(HP::POST_RECV_MESSAGE)) {
                DispatchMessage(methods);
            }
            if (methods->QueryInterceptionHookPoint(HP::POST_SEND_MESSAGE)) {
                listener_->OnReady();
            }
            if (methods->QueryInterceptionHookPoint(HP::PRE_SEND_STATUS)) {
                DispatchClose(methods);
            }
            if (methods->QueryInterceptionHookPoint(HP::POST_RECV_CLOSE)) {
                DispatchTermination();
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[{}] Call interception failed: {}", rpc_info_->method(), e.what());
    } catch (...) {
        spdlog::error("[{}] Call interception failed with a non-standard exception",
                      rpc_info_->method());
    }

    // Continue the interception chain
    methods->Proceed();
}

void GrpcServerCallBridge::StartCall(grpc::experimental::InterceptorBatchMethods* methods) {
    Metadata headers;
    if (auto* client_metadata = methods->GetRecvInitialMetadata()) {
        for (const auto& [key, value] : *client_metadata) {
            headers.emplace(std::string(key.data(), key.size()),
                            std::string(value.data(), value.size()));
        }
    }

    auto call = std::make_shared<RpcInfoCall>(rpc_info_);
    ObservingCallHandler handler;
    listener_ = interceptor_->InterceptCall(call, headers, handler);

    // An interceptor may answer the call without passing it on
    intercepted_call_ = handler.call() ? handler.call() : call;
}

void GrpcServerCallBridge::DispatchMessage(grpc::experimental::InterceptorBatchMethods* methods) {
    void* message = methods->GetRecvMessage();
    if (message == nullptr) {
        // Read failed: the client half-closed
        listener_->OnHalfClose();
        return;
    }

    listener_->OnMessage(message);
    if (ClientSendsSingleMessage()) {
        listener_->OnHalfClose();
    }
}

void GrpcServerCallBridge::DispatchClose(grpc::experimental::InterceptorBatchMethods* methods) {
    Metadata trailers;
    if (auto* trailing_metadata = methods->GetSendTrailingMetadata()) {
        trailers = *trailing_metadata;
    }
    intercepted_call_->Close(methods->GetSendStatus(), trailers);
}

void GrpcServerCallBridge::DispatchTermination() {
    if (intercepted_call_->IsCancelled()) {
        listener_->OnCancel();
    } else {
        listener_->OnComplete();
    }
}

bool GrpcServerCallBridge::ClientSendsSingleMessage() const {
    using Type = grpc::experimental::ServerRpcInfo::Type;
    return rpc_info_->type() == Type::UNARY || rpc_info_->type() == Type::SERVER_STREAMING;
}

ServerTracingInterceptorFactory::ServerTracingInterceptorFactory()
    : ServerTracingInterceptorFactory(TracingServerInterceptor::Create()) {}

ServerTracingInterceptorFactory::ServerTracingInterceptorFactory(
    std::shared_ptr<ServerInterceptor> interceptor)
    : interceptor_(std::move(interceptor)) {}

grpc::experimental::Interceptor* ServerTracingInterceptorFactory::CreateServerInterceptor(
    grpc::experimental::ServerRpcInfo* info) {
    if (!info) {
        return nullptr;
    }
    return new GrpcServerCallBridge(info, interceptor_);
}

}  // namespace calltrace
