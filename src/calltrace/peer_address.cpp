// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "calltrace/peer_address.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include "absl/strings/numbers.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace calltrace {

namespace {

constexpr absl::string_view kIpv4Scheme = "ipv4:";
constexpr absl::string_view kIpv6Scheme = "ipv6:";

std::optional<uint16_t> ParsePort(absl::string_view text) {
    uint32_t port = 0;
    if (text.empty() || !absl::SimpleAtoi(text, &port) || port > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(port);
}

std::optional<InetSocketAddress> ParseIpv4(absl::string_view rest) {
    auto colon = rest.rfind(':');
    if (colon == absl::string_view::npos) {
        return std::nullopt;
    }
    std::string host(rest.substr(0, colon));
    auto port = ParsePort(rest.substr(colon + 1));

    in_addr addr{};
    if (!port || inet_pton(AF_INET, host.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return InetSocketAddress{AddressFamily::kIpv4, std::move(host), *port};
}

std::optional<InetSocketAddress> ParseIpv6(absl::string_view rest) {
    // Format: "[addr]:port", the zone id separator may be percent-encoded
    if (!absl::ConsumePrefix(&rest, "[")) {
        return std::nullopt;
    }
    auto bracket = rest.find("]:");
    if (bracket == absl::string_view::npos) {
        return std::nullopt;
    }
    std::string host = absl::StrReplaceAll(rest.substr(0, bracket), {{"%25", "%"}});
    auto port = ParsePort(rest.substr(bracket + 2));

    // inet_pton does not understand zone ids
    std::string numeric = host.substr(0, host.find('%'));
    in6_addr addr{};
    if (!port || inet_pton(AF_INET6, numeric.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return InetSocketAddress{AddressFamily::kIpv6, std::move(host), *port};
}

}  // namespace

std::optional<InetSocketAddress> ParsePeerAddress(const std::string& peer) {
    absl::string_view rest(peer);
    if (absl::ConsumePrefix(&rest, kIpv4Scheme)) {
        return ParseIpv4(rest);
    }
    if (absl::ConsumePrefix(&rest, kIpv6Scheme)) {
        return ParseIpv6(rest);
    }
    return std::nullopt;
}

}  // namespace calltrace
