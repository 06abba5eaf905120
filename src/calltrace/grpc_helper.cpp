// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "calltrace/grpc_helper.h"

#include "absl/strings/ascii.h"
#include "opentelemetry/semconv/incubating/rpc_attributes.h"

namespace calltrace {

namespace nostd = opentelemetry::nostd;

std::string ExtractMethodName(const std::string& full_method) {
    // Format: "/package.Service/Method"
    auto last_slash = full_method.find_last_of('/');
    if (last_slash != std::string::npos && last_slash + 1 < full_method.size()) {
        return full_method.substr(last_slash + 1);
    }
    return full_method;
}

std::string ExtractServiceName(const std::string& full_method) {
    std::string path = SpanName(full_method);

    auto last_slash = path.find_last_of('/');
    if (last_slash != std::string::npos && last_slash > 0) {
        return path.substr(0, last_slash);
    }
    return path;
}

std::string SpanName(const std::string& full_method) {
    if (!full_method.empty() && full_method[0] == '/') {
        return full_method.substr(1);
    }
    return full_method;
}

void PrepareSpan(opentelemetry::trace::Span& span, const std::string& full_method) {
    namespace semconv_rpc = opentelemetry::semconv::rpc;

    span.SetAttribute(semconv_rpc::kRpcSystem, "grpc");
    span.SetAttribute(semconv_rpc::kRpcService, ExtractServiceName(full_method));
    span.SetAttribute(semconv_rpc::kRpcMethod, ExtractMethodName(full_method));
}

nostd::string_view GrpcMetadataCarrier::Get(nostd::string_view key) const noexcept {
    auto it = metadata_.find(absl::AsciiStrToLower(absl::string_view(key.data(), key.size())));
    if (it == metadata_.end()) {
        return "";
    }
    return nostd::string_view(it->second.data(), it->second.size());
}

bool GrpcMetadataCarrier::Keys(
    nostd::function_ref<bool(nostd::string_view)> callback) const noexcept {
    for (auto it = metadata_.begin(); it != metadata_.end();
         it = metadata_.upper_bound(it->first)) {
        if (!callback(nostd::string_view(it->first.data(), it->first.size()))) {
            return false;
        }
    }
    return true;
}

}  // namespace calltrace
