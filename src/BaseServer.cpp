#include <iostream>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <pthread.h>
#include <sys/socket.h>

#include "BaseServer.hpp"

namespace {

struct ThreadArgs {
    BaseServer* server;
    int client_fd;
    std::string peer;
};

} // namespace

BaseServer::BaseServer(std::string host, int port, int backlog, size_t max_connections)
    : socket_fd{-1}, server_host{std::move(host)}, server_port{port}, bound_port{port},
      backlog{backlog}, max_connections{max_connections} {}

BaseServer::~BaseServer() {
    if (socket_fd != -1) {
        close(socket_fd);
    }
}

bool BaseServer::listen() {
    // Resolve the listen address (IPv4)
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* res = nullptr;
    const char* node = server_host.empty() ? nullptr : server_host.c_str();
    std::string port_str = std::to_string(server_port);
    int err = getaddrinfo(node, port_str.c_str(), &hints, &res);
    if (err != 0) {
        std::cerr << "Error: Cannot resolve listen address " << server_host
                  << ": " << gai_strerror(err) << "\n";
        return false;
    }

    // Create a TCP Socket
    socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        std::cerr << "Error: Failed to create socket\n";
        freeaddrinfo(res);
        return false;
    }

    // Set Socket Options to Allow Reuse of Address
    int opt = 1;
    if (setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "Error: Failed to set socket options\n";
        close(socket_fd);
        socket_fd = -1;
        freeaddrinfo(res);
        return false;
    }

    // Bind the Socket to the Address
    if (bind(socket_fd, res->ai_addr, res->ai_addrlen) < 0) {
        std::cerr << "Error: Failed to bind to " << server_host << ":" << server_port
                  << " (" << strerror(errno) << ")\n";
        close(socket_fd);
        socket_fd = -1;
        freeaddrinfo(res);
        return false;
    }
    freeaddrinfo(res);

    // Start Listening for Incoming Connections
    if (::listen(socket_fd, backlog) < 0) {
        std::cerr << "Error: Failed to listen on port " << server_port << "\n";
        close(socket_fd);
        socket_fd = -1;
        return false;
    }

    // Find out which port we got (matters when asked for port 0)
    sockaddr_in bound_addr{};
    socklen_t bound_len = sizeof(bound_addr);
    if (getsockname(socket_fd, reinterpret_cast<sockaddr*>(&bound_addr), &bound_len) == 0) {
        bound_port = ntohs(bound_addr.sin_port);
    }

    running = true;
    return true;
}

void BaseServer::serve() {
    onListening();

    // Accept Incoming Connections
    while (running) {
        acquireSlot();

        std::string peer;
        int client_fd = acceptConnection(peer);
        if (client_fd < 0) {
            releaseSlot();
            continue; // Accept failed (or stop() was called)
        }

        // Create a New Thread for Each Client
        auto* args = new ThreadArgs{this, client_fd, peer};
        pthread_t thread_id;
        if (pthread_create(&thread_id, nullptr, BaseServer::threadEntry, args) != 0) {
            std::cerr << "Error: Failed to create thread\n";
            close(client_fd);
            delete args;
            releaseSlot();
            continue;
        }

        pthread_detach(thread_id); // Auto-clean threads
    }
}

bool BaseServer::start() {
    if (!listen()) {
        return false;
    }
    serve();
    return true;
}

void BaseServer::stop() {
    if (running.exchange(false) && socket_fd != -1) {
        // Wakes up a blocked accept()
        shutdown(socket_fd, SHUT_RDWR);
    }
    std::lock_guard<std::mutex> lock(slots_mutex);
    slots_cv.notify_all();
}

void BaseServer::waitForIdle() {
    std::unique_lock<std::mutex> lock(slots_mutex);
    slots_cv.wait(lock, [this] { return active == 0; });
}

size_t BaseServer::activeConnections() const {
    std::lock_guard<std::mutex> lock(slots_mutex);
    return active;
}

int BaseServer::acceptConnection(std::string& peer) {
    // Prepare to Accept a Connection
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    // Accept the Incoming Connection
    int client_fd = accept(socket_fd, (struct sockaddr*)&client_addr, &client_len);
    if (client_fd < 0) {
        if (running) {
            std::cerr << "Error: Failed to accept connection\n";
        }
        return -1;
    }

    char addr[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &client_addr.sin_addr, addr, sizeof(addr));
    peer = std::string(addr) + ":" + std::to_string(ntohs(client_addr.sin_port));
    return client_fd;
}

void BaseServer::acquireSlot() {
    std::unique_lock<std::mutex> lock(slots_mutex);
    if (max_connections > 0) {
        slots_cv.wait(lock, [this] { return active < max_connections || !running; });
    }
    active++;
}

void BaseServer::releaseSlot() {
    // Notify under the lock: once waitForIdle() sees zero the server may be destroyed
    std::lock_guard<std::mutex> lock(slots_mutex);
    active--;
    slots_cv.notify_all();
}

void* BaseServer::threadEntry(void* arg) {
    auto* args = static_cast<ThreadArgs*>(arg);
    BaseServer* server = args->server;
    int client_fd = args->client_fd;
    std::string peer = std::move(args->peer);
    delete args;

    server->threadHandler(client_fd, peer);
    return nullptr;
}

void BaseServer::threadHandler(int client_fd, const std::string& peer) {
    try {
        handleRequest(client_fd, peer);
    } catch (const std::exception& e) {
        // Contain the failure to this connection
        std::cerr << "Error: Handler for " << peer << " failed: " << e.what() << "\n";
    }
    close(client_fd);
    releaseSlot();
}
