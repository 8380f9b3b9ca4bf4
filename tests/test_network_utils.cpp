#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "network_utils.h"
#include "socket.h"
#include <string>

using namespace netlaunch;

class NetworkUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_socket_library();
    }

    void TearDown() override {
        cleanup_socket_library();
    }
};

// Test IPv4 address validation
TEST_F(NetworkUtilsTest, IPv4ValidationTest) {
    EXPECT_TRUE(network_utils::is_valid_ipv4("127.0.0.1"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("192.168.1.1"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("0.0.0.0"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("255.255.255.255"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("100.64.0.7"));

    EXPECT_FALSE(network_utils::is_valid_ipv4("256.0.0.1"));       // Out of range
    EXPECT_FALSE(network_utils::is_valid_ipv4("192.168.1"));       // Missing octet
    EXPECT_FALSE(network_utils::is_valid_ipv4("192.168.1.1.1"));   // Extra octet
    EXPECT_FALSE(network_utils::is_valid_ipv4("192.168.1.a"));     // Non-numeric
    EXPECT_FALSE(network_utils::is_valid_ipv4(""));                // Empty string
    EXPECT_FALSE(network_utils::is_valid_ipv4("nas.local"));       // Hostname
    EXPECT_FALSE(network_utils::is_valid_ipv4("fe80::1"));         // IPv6
}

// Test IPv6 address validation
TEST_F(NetworkUtilsTest, IPv6ValidationTest) {
    EXPECT_TRUE(network_utils::is_valid_ipv6("::1"));
    EXPECT_TRUE(network_utils::is_valid_ipv6("fe80::1"));
    EXPECT_TRUE(network_utils::is_valid_ipv6("fd7a:115c:a1e0::1"));

    EXPECT_FALSE(network_utils::is_valid_ipv6("192.168.1.1"));
    EXPECT_FALSE(network_utils::is_valid_ipv6("[::1]"));
    EXPECT_FALSE(network_utils::is_valid_ipv6("nas.local"));
    EXPECT_FALSE(network_utils::is_valid_ipv6(""));
}

TEST_F(NetworkUtilsTest, HostnameDetectionTest) {
    EXPECT_TRUE(network_utils::is_hostname("nas.local"));
    EXPECT_TRUE(network_utils::is_hostname("localhost"));
    EXPECT_FALSE(network_utils::is_hostname("10.0.0.2"));
    EXPECT_FALSE(network_utils::is_hostname("::1"));
    EXPECT_FALSE(network_utils::is_hostname(""));
}

TEST_F(NetworkUtilsTest, ResolveHostnameTest) {
    // IP literals resolve to themselves
    auto literal = network_utils::resolve_hostname("192.168.1.20");
    ASSERT_TRUE(literal.has_value());
    EXPECT_EQ(*literal, "192.168.1.20");

    auto localhost = network_utils::resolve_hostname("localhost");
    ASSERT_TRUE(localhost.has_value());
    EXPECT_TRUE(network_utils::is_valid_ipv4(*localhost));

    EXPECT_FALSE(network_utils::resolve_hostname("").has_value());
    EXPECT_FALSE(network_utils::resolve_hostname("no-such-host.invalid").has_value());
}

// Parenthesized addresses are pulled out of `arp -a` style text
TEST_F(NetworkUtilsTest, ExtractParenthesizedIPv4Test) {
    std::string table =
        "? (192.168.1.1) at aa:bb:cc:dd:ee:ff on en0 ifscope [ethernet]\n"
        "nas.lan (192.168.1.20) at 11:22:33:44:55:66 on en0 ifscope [ethernet]\n"
        "? (224.0.0.251) at 1:0:5e:0:0:fb on en0 ifscope permanent [ethernet]\n"
        "(incomplete) entry without an address\n";

    auto ips = network_utils::extract_parenthesized_ipv4(table);
    EXPECT_THAT(ips, ::testing::ElementsAre("192.168.1.1", "192.168.1.20", "224.0.0.251"));

    EXPECT_TRUE(network_utils::extract_parenthesized_ipv4("").empty());
    EXPECT_TRUE(network_utils::extract_parenthesized_ipv4("no addresses here").empty());
}

TEST_F(NetworkUtilsTest, MulticastOrBroadcastTest) {
    EXPECT_TRUE(network_utils::is_multicast_or_broadcast("224.0.0.251"));
    EXPECT_TRUE(network_utils::is_multicast_or_broadcast("239.255.255.250"));
    EXPECT_TRUE(network_utils::is_multicast_or_broadcast("192.168.1.255"));

    EXPECT_FALSE(network_utils::is_multicast_or_broadcast("192.168.1.20"));
    EXPECT_FALSE(network_utils::is_multicast_or_broadcast("10.0.0.1"));
}
