#include "HTTPSTunnel.hpp"
#include "ErrorResponseBuilder.hpp"
#include "NetworkUtils.hpp"
#include "ProxyErrors.hpp"

#include <unistd.h>
#include <sys/socket.h>
#include <poll.h>
#include <cerrno>
#include <iostream>
#include <vector>

// ====================================================================================================
// Public Methods
// ====================================================================================================

int HTTPSTunnel::openTunnel(int client_fd, const std::string& host, int port) {
    // Step 1: Connect to destination server
    int server_fd = NetworkUtils::connectToHost(host, port);
    if (server_fd < 0) {
        throw ConnectionError(host, port, "connect failed");
    }

    // Step 2: Inform client that tunnel is ready
    if (!NetworkUtils::sendData(client_fd, ErrorResponseBuilder::connectionEstablished())) {
        close(server_fd);
        throw ConnectionError(host, port, "client went away before the tunnel was ready");
    }

    return server_fd;
}

void HTTPSTunnel::relay(int client_fd, int server_fd, size_t buffer_size) {
    forwardTraffic(client_fd, server_fd, buffer_size);

    // Either side finishing ends the session for both
    close(server_fd);
    shutdown(client_fd, SHUT_RDWR);
}

void HTTPSTunnel::establish(int client_fd, const std::string& host, int port,
                            size_t buffer_size) {
    int server_fd = openTunnel(client_fd, host, port);
    relay(client_fd, server_fd, buffer_size);
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

void HTTPSTunnel::forwardTraffic(int client_fd, int server_fd, size_t buffer_size) {
    std::vector<char> buf(buffer_size);
    pollfd fds[2] = {
        {client_fd, POLLIN, 0},
        {server_fd, POLLIN, 0},
    };

    while (true) {
        fds[0].revents = 0;
        fds[1].revents = 0;

        // Wait for activity on either socket
        int activity = poll(fds, 2, -1);
        if (activity < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[HTTPSTunnel] Poll error: " << NetworkUtils::getLastError() << "\n";
            return;
        }

        // Client -> Server (a hangup or error still reads as EOF below)
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = NetworkUtils::receiveData(client_fd, buf.data(), buf.size());
            if (n <= 0) {
                return;
            }
            if (!NetworkUtils::sendData(server_fd, buf.data(), static_cast<size_t>(n))) {
                std::cerr << "[HTTPSTunnel] Failed to forward client data to server\n";
                return;
            }
        }

        // Server -> Client
        if (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = NetworkUtils::receiveData(server_fd, buf.data(), buf.size());
            if (n <= 0) {
                return;
            }
            if (!NetworkUtils::sendData(client_fd, buf.data(), static_cast<size_t>(n))) {
                std::cerr << "[HTTPSTunnel] Failed to forward server data to client\n";
                return;
            }
        }

        if ((fds[0].revents | fds[1].revents) & POLLNVAL) {
            std::cerr << "[HTTPSTunnel] Tunnel socket is not open\n";
            return;
        }
    }
}
