#include "HTTPSTunnel.hpp"
#include "ProxyErrors.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <sys/resource.h>
#include <sys/socket.h>
#include <unistd.h>

#include <thread>

namespace {

struct SocketPair {
    int proxy_side = -1;
    int peer_side = -1;

    SocketPair() {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0) {
            proxy_side = fds[0];
            peer_side = fds[1];
        }
    }
};

// Move a descriptor to a fixed number, closing the old one
int moveTo(int fd, int target) {
    if (dup2(fd, target) < 0) {
        return -1;
    }
    close(fd);
    return target;
}

} // namespace

TEST(HTTPSTunnelTest, RelayForwardsBothWaysUntilOriginCloses) {
    SocketPair client;
    SocketPair origin;
    ASSERT_GE(client.proxy_side, 0);
    ASSERT_GE(origin.proxy_side, 0);

    std::thread relay([&] { HTTPSTunnel::relay(client.proxy_side, origin.proxy_side, 4); });

    // Client -> origin, larger than one relay buffer
    writeAll(client.peer_side, "\x16\x03\x01 client hello");
    EXPECT_EQ(readExactly(origin.peer_side, 16), "\x16\x03\x01 client hello");

    // Origin -> client
    writeAll(origin.peer_side, "server hello");
    EXPECT_EQ(readExactly(client.peer_side, 12), "server hello");

    // Origin hangs up: the client side is shut down too
    close(origin.peer_side);
    relay.join();
    EXPECT_EQ(readAll(client.peer_side), "");

    close(client.proxy_side);
    close(client.peer_side);
}

TEST(HTTPSTunnelTest, RelayEndsWhenClientCloses) {
    SocketPair client;
    SocketPair origin;
    ASSERT_GE(client.proxy_side, 0);
    ASSERT_GE(origin.proxy_side, 0);

    std::thread relay([&] { HTTPSTunnel::relay(client.proxy_side, origin.proxy_side); });

    writeAll(client.peer_side, "bye");
    EXPECT_EQ(readExactly(origin.peer_side, 3), "bye");

    close(client.peer_side);
    relay.join();

    // Relay closed its origin socket, so the origin sees EOF
    EXPECT_EQ(readAll(origin.peer_side), "");

    close(client.proxy_side);
    close(origin.peer_side);
}

TEST(HTTPSTunnelTest, OpenTunnelSendsConnectionEstablished) {
    TestOrigin origin({"pong"});
    SocketPair client;
    ASSERT_GE(client.proxy_side, 0);

    int server_fd = HTTPSTunnel::openTunnel(client.proxy_side, "127.0.0.1", origin.port());
    ASSERT_GE(server_fd, 0);

    std::string established = "HTTP/1.1 200 Connection Established\r\n\r\n";
    EXPECT_EQ(readExactly(client.peer_side, established.size()), established);

    std::thread relay([&] { HTTPSTunnel::relay(client.proxy_side, server_fd); });
    writeAll(client.peer_side, "ping\r\n\r\n");
    EXPECT_EQ(readAll(client.peer_side), "pong");
    relay.join();

    auto requests = origin.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0], "ping\r\n\r\n");

    close(client.proxy_side);
    close(client.peer_side);
}

TEST(HTTPSTunnelTest, OpenTunnelToUnreachableOriginThrows) {
    SocketPair client;
    ASSERT_GE(client.proxy_side, 0);

    EXPECT_THROW(HTTPSTunnel::openTunnel(client.proxy_side, "127.0.0.1", unusedPort()), ConnectionError);

    // Nothing was promised to the client
    close(client.proxy_side);
    EXPECT_EQ(readAll(client.peer_side), "");
    close(client.peer_side);
}

TEST(HTTPSTunnelTest, EstablishRunsUntilTheTunnelCloses) {
    TestOrigin origin({"server-finished"});
    SocketPair client;
    ASSERT_GE(client.proxy_side, 0);

    std::thread tunnel([&] { HTTPSTunnel::establish(client.proxy_side, "127.0.0.1", origin.port()); });

    std::string established = "HTTP/1.1 200 Connection Established\r\n\r\n";
    EXPECT_EQ(readExactly(client.peer_side, established.size()), established);
    writeAll(client.peer_side, "client-finished\r\n\r\n");
    EXPECT_EQ(readAll(client.peer_side), "server-finished");
    tunnel.join();

    close(client.proxy_side);
    close(client.peer_side);
}

TEST(HTTPSTunnelTest, RelayHandlesDescriptorsAboveFdSetSize) {
    const rlim_t needed = 1600;
    rlimit saved{};
    ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &saved), 0);
    if (saved.rlim_max != RLIM_INFINITY && saved.rlim_max < needed) {
        GTEST_SKIP() << "open file limit too low: " << saved.rlim_max;
    }
    rlimit raised = saved;
    if (raised.rlim_cur == RLIM_INFINITY || raised.rlim_cur < needed) {
        raised.rlim_cur = needed;
    }
    ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &raised), 0);

    SocketPair client;
    SocketPair origin;
    ASSERT_GE(client.proxy_side, 0);
    ASSERT_GE(origin.proxy_side, 0);
    client.proxy_side = moveTo(client.proxy_side, 1500);
    client.peer_side = moveTo(client.peer_side, 1501);
    origin.proxy_side = moveTo(origin.proxy_side, 1502);
    origin.peer_side = moveTo(origin.peer_side, 1503);
    ASSERT_EQ(client.proxy_side, 1500);
    ASSERT_EQ(origin.peer_side, 1503);

    std::thread relay([&] { HTTPSTunnel::relay(client.proxy_side, origin.proxy_side, 64); });

    writeAll(client.peer_side, "hello origin");
    EXPECT_EQ(readExactly(origin.peer_side, 12), "hello origin");
    writeAll(origin.peer_side, "hello client");
    EXPECT_EQ(readExactly(client.peer_side, 12), "hello client");

    close(origin.peer_side);
    relay.join();
    EXPECT_EQ(readAll(client.peer_side), "");

    close(client.proxy_side);
    close(client.peer_side);
    setrlimit(RLIMIT_NOFILE, &saved);
}
