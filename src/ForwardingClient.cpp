#include "ForwardingClient.hpp"
#include "NetworkUtils.hpp"
#include "ProxyErrors.hpp"

#include <unistd.h>

ForwardingClient::ForwardingClient(size_t buffer_size)
    : buffer_size(buffer_size) {}

std::string ForwardingClient::forward(const std::string& request,
                                      const std::string& host,
                                      int port,
                                      bool full_read) const {
    int server_fd = NetworkUtils::connectToHost(host, port);
    if (server_fd < 0) {
        throw ConnectionError(host, port, "connect failed");
    }

    if (!NetworkUtils::sendData(server_fd, request)) {
        std::string reason = NetworkUtils::getLastError();
        close(server_fd);
        throw ConnectionError(host, port, "send failed: " + reason);
    }

    std::string response = full_read
        ? NetworkUtils::receiveUntilClose(server_fd, buffer_size)
        : NetworkUtils::receiveOnce(server_fd, buffer_size);

    close(server_fd);
    return response;
}
