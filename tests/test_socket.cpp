#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "socket.h"
#include "subprocess.h"
#include <poll.h>
#include <thread>
#include <chrono>

using namespace netlaunch;

class SocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
    }

    void TearDown() override {
        cleanup_socket_library();
    }
};

// Test socket validity check
TEST_F(SocketTest, SocketValidityTest) {
    EXPECT_FALSE(is_valid_socket(INVALID_SOCKET_VALUE));

    socket_t server = create_tcp_server_v4(0);
    ASSERT_TRUE(is_valid_socket(server));
    EXPECT_GT(get_bound_port(server), 0);
    close_socket(server);
}

// A client connects to a loopback listener and the server accepts it
TEST_F(SocketTest, ConnectAndAcceptTest) {
    socket_t server = create_tcp_server_v4(0);
    ASSERT_TRUE(is_valid_socket(server));
    int port = get_bound_port(server);

    socket_t client = create_tcp_client("127.0.0.1", port, 1000);
    ASSERT_TRUE(is_valid_socket(client));

    socket_t accepted = accept_client(server);
    EXPECT_TRUE(is_valid_socket(accepted));

    close_socket(accepted);
    close_socket(client);
    close_socket(server);
}

// Connecting to a port nobody listens on fails within the deadline
TEST_F(SocketTest, ConnectToClosedPortTest) {
    socket_t server = create_tcp_server_v4(0);
    ASSERT_TRUE(is_valid_socket(server));
    int port = get_bound_port(server);
    close_socket(server);

    auto start = std::chrono::steady_clock::now();
    socket_t client = create_tcp_client("127.0.0.1", port, 500);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(is_valid_socket(client));
    EXPECT_LT(elapsed.count(), 2000);
}

TEST_F(SocketTest, InvalidHostTest) {
    EXPECT_FALSE(is_valid_socket(create_tcp_client("", 80, 200)));
    EXPECT_FALSE(is_valid_socket(create_tcp_client("127.0.0.1", 0, 200)));
}

// A child started while a connection is open must not keep it alive
TEST_F(SocketTest, ClosedClientNotHeldBySubprocessTest) {
    socket_t server = create_tcp_server_v4(0);
    ASSERT_TRUE(is_valid_socket(server));

    socket_t client = create_tcp_client("127.0.0.1", get_bound_port(server), 1000);
    ASSERT_TRUE(is_valid_socket(client));
    socket_t accepted = accept_client(server);
    ASSERT_TRUE(is_valid_socket(accepted));

    Subprocess child({"/bin/sleep", "3"});
    ASSERT_TRUE(child.start());

    close_socket(client);

    struct pollfd pfd;
    pfd.fd = accepted;
    pfd.events = POLLIN;
    pfd.revents = 0;
    ASSERT_EQ(poll(&pfd, 1, 1000), 1);

    char byte;
    EXPECT_EQ(recv(accepted, &byte, 1, 0), 0);

    child.kill();
    close_socket(accepted);
    close_socket(server);
}
