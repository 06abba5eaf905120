// Copyright 2025 CallTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace calltrace {

enum class AddressFamily { kIpv4, kIpv6 };

/// Resolved IP endpoint of a remote peer
struct InetSocketAddress {
    AddressFamily family;
    std::string host;   // textual IP, without brackets for IPv6
    uint16_t port;
};

/**
 * @brief Parse a gRPC peer URI into an IP endpoint
 *
 * Accepts "ipv4:203.0.113.7:4317" and "ipv6:[2001:db8::1]:443" (a "%25"
 * zone separator is decoded). Returns std::nullopt for any other scheme
 * (e.g. "unix:"), an empty string, an invalid address or port.
 */
std::optional<InetSocketAddress> ParsePeerAddress(const std::string& peer);

}  // namespace calltrace
