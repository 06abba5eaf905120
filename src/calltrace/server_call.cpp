// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "calltrace/server_call.h"

#include <stdexcept>

namespace calltrace {

namespace {

class InterceptedCallHandler : public ServerCallHandler {
public:
    InterceptedCallHandler(std::shared_ptr<ServerInterceptor> interceptor,
                           std::shared_ptr<ServerCallHandler> next)
        : interceptor_(std::move(interceptor)), next_(std::move(next)) {}

    std::unique_ptr<ServerCallListener> StartCall(
        std::shared_ptr<ServerCall> call, const Metadata& headers) override {
        return interceptor_->InterceptCall(std::move(call), headers, *next_);
    }

private:
    std::shared_ptr<ServerInterceptor> interceptor_;
    std::shared_ptr<ServerCallHandler> next_;
};

}  // namespace

std::shared_ptr<ServerCallHandler> InterceptHandler(
    std::shared_ptr<ServerInterceptor> interceptor,
    std::shared_ptr<ServerCallHandler> next) {
    if (!interceptor || !next) {
        throw std::invalid_argument("InterceptHandler requires an interceptor and a handler");
    }
    return std::make_shared<InterceptedCallHandler>(std::move(interceptor), std::move(next));
}

}  // namespace calltrace
