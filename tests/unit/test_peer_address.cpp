/**
 * Unit Tests: Peer Address Parsing
 *
 * These tests verify:
 * - gRPC "ipv4:" and "ipv6:" peer strings resolve to host and port
 * - Anything else (unix sockets, malformed strings) is rejected
 */

#include <gtest/gtest.h>

#include "calltrace/peer_address.h"

using calltrace::AddressFamily;
using calltrace::ParsePeerAddress;

TEST(PeerAddressTest, ParsesIpv4Peer) {
    auto address = ParsePeerAddress("ipv4:203.0.113.7:4317");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->family, AddressFamily::kIpv4);
    EXPECT_EQ(address->host, "203.0.113.7");
    EXPECT_EQ(address->port, 4317);
}

/**
 * Test IPv6 peers
 *
 * Expected behavior:
 * - Brackets are removed from the host
 * - A percent-encoded zone id is decoded and kept
 */
TEST(PeerAddressTest, ParsesIpv6Peer) {
    auto address = ParsePeerAddress("ipv6:[::1]:50051");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->family, AddressFamily::kIpv6);
    EXPECT_EQ(address->host, "::1");
    EXPECT_EQ(address->port, 50051);

    auto zoned = ParsePeerAddress("ipv6:[fe80::1%25eth0]:8080");
    ASSERT_TRUE(zoned.has_value());
    EXPECT_EQ(zoned->host, "fe80::1%eth0");
    EXPECT_EQ(zoned->port, 8080);
}

TEST(PeerAddressTest, RejectsNonInetPeers) {
    EXPECT_FALSE(ParsePeerAddress("").has_value());
    EXPECT_FALSE(ParsePeerAddress("unix:/tmp/echo.sock").has_value());
    EXPECT_FALSE(ParsePeerAddress("unix-abstract:echo").has_value());
    EXPECT_FALSE(ParsePeerAddress("203.0.113.7:4317").has_value());
}

TEST(PeerAddressTest, RejectsMalformedAddresses) {
    EXPECT_FALSE(ParsePeerAddress("ipv4:203.0.113.7").has_value());
    EXPECT_FALSE(ParsePeerAddress("ipv4:203.0.113.7:").has_value());
    EXPECT_FALSE(ParsePeerAddress("ipv4:203.0.113.7:65536").has_value());
    EXPECT_FALSE(ParsePeerAddress("ipv4:example.com:80").has_value());
    EXPECT_FALSE(ParsePeerAddress("ipv6:::1:50051").has_value());
    EXPECT_FALSE(ParsePeerAddress("ipv6:[::1]").has_value());
    EXPECT_FALSE(ParsePeerAddress("ipv6:[not-an-ip]:80").has_value());
}
