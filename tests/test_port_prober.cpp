#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "port_prober.h"
#include "socket.h"
#include <algorithm>
#include <chrono>

using namespace netlaunch;

class PortProberTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
    }

    void TearDown() override {
        for (socket_t s : listeners_) {
            close_socket(s);
        }
        cleanup_socket_library();
    }

    int open_listener() {
        socket_t s = create_tcp_server_v4(0);
        EXPECT_TRUE(is_valid_socket(s));
        listeners_.push_back(s);
        return get_bound_port(s);
    }

    // A port that was just released by a listener and is very likely closed
    int closed_port() {
        socket_t s = create_tcp_server_v4(0);
        EXPECT_TRUE(is_valid_socket(s));
        int port = get_bound_port(s);
        close_socket(s);
        return port;
    }

    std::vector<socket_t> listeners_;
};

TEST_F(PortProberTest, PresetPortsTest) {
    const auto& basic = preset_ports(PortPreset::Basic);
    EXPECT_THAT(basic, ::testing::ElementsAre(21, 22, 80, 443, 445, 548, 3389, 5900, 8080));

    const auto& deep = preset_ports(PortPreset::Deep);
    for (int port : basic) {
        EXPECT_THAT(deep, ::testing::Contains(port));
    }
    EXPECT_THAT(deep, ::testing::Contains(5432));
    EXPECT_THAT(deep, ::testing::Contains(27017));
    EXPECT_GT(deep.size(), basic.size());
}

TEST_F(PortProberTest, ProbeSinglePortTest) {
    int open = open_listener();
    int closed = closed_port();

    EXPECT_TRUE(probe_port("127.0.0.1", open, 400));
    EXPECT_FALSE(probe_port("127.0.0.1", closed, 400));
}

// Open ports come back sorted regardless of probing order
TEST_F(PortProberTest, ProbePortsReturnsSortedOpenPortsTest) {
    int first = open_listener();
    int second = open_listener();
    int closed = closed_port();

    std::vector<int> expected = {first, second};
    std::sort(expected.begin(), expected.end());

    std::vector<int> ports = {expected[1], closed, expected[0]};
    auto open_ports = probe_ports("127.0.0.1", ports, 2, 400);
    EXPECT_EQ(open_ports, expected);
}

TEST_F(PortProberTest, ZeroConcurrencyIsTreatedAsOneTest) {
    int open = open_listener();
    auto open_ports = probe_ports("127.0.0.1", {open}, 0, 400);
    EXPECT_THAT(open_ports, ::testing::ElementsAre(open));
}

TEST_F(PortProberTest, UnreachableHostReturnsEmptyTest) {
    auto start = std::chrono::steady_clock::now();
    auto open_ports = probe_ports("no-such-host.invalid", {22, 80, 443}, 10, 200);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_TRUE(open_ports.empty());
    EXPECT_LT(elapsed.count(), 5000);
}

TEST_F(PortProberTest, ParsePortSpecTest) {
    std::vector<int> ports;

    ASSERT_TRUE(parse_port_spec("basic", ports));
    EXPECT_EQ(ports, preset_ports(PortPreset::Basic));

    ASSERT_TRUE(parse_port_spec("deep", ports));
    EXPECT_EQ(ports, preset_ports(PortPreset::Deep));

    ASSERT_TRUE(parse_port_spec("22,443,8080", ports));
    EXPECT_THAT(ports, ::testing::ElementsAre(22, 443, 8080));

    EXPECT_FALSE(parse_port_spec("22,abc", ports));
    EXPECT_FALSE(parse_port_spec("70000", ports));

    // An empty spec means the basic preset
    ASSERT_TRUE(parse_port_spec("", ports));
    EXPECT_EQ(ports, preset_ports(PortPreset::Basic));
}
