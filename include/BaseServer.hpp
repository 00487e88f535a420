#ifndef BASE_SERVER_HPP
#define BASE_SERVER_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>

/**
 * BaseServer - TCP listener spawning one detached thread per connection
 *
 * Subclasses implement handleRequest(); the client socket is closed once it
 * returns. By default the number of concurrent connections is unbounded;
 * a non-zero max_connections makes the accept loop wait for a free slot.
 */
class BaseServer{
public:
    BaseServer(std::string host, int port, int backlog = 10, size_t max_connections = 0);
    virtual ~BaseServer();

    /**
     * Bind and listen (port 0 picks an ephemeral port)
     * @return true on success
     */
    bool listen();

    /**
     * Accept connections until stop() is called
     */
    void serve();

    /**
     * listen() followed by serve()
     * @return false if the socket could not be set up, true after stop()
     */
    bool start();

    /**
     * Stop accepting new connections; serve() returns. Running handlers continue.
     */
    void stop();

    /**
     * Block until no connection handler is running
     *
     * Once this returns after stop(), no handler thread touches the server
     * again and it may be destroyed.
     */
    void waitForIdle();

    int boundPort() const { return bound_port; }
    const std::string& host() const { return server_host; }
    size_t activeConnections() const;

protected:
    int socket_fd;
    std::string server_host;
    int server_port;
    int bound_port;
    int backlog;
    size_t max_connections;

    virtual void handleRequest(int client_fd, const std::string& peer) = 0;

    // Called from the accept loop once the socket is listening
    virtual void onListening() {}

private:
    std::atomic<bool> running{false};

    mutable std::mutex slots_mutex;
    std::condition_variable slots_cv;
    size_t active = 0;

    int acceptConnection(std::string& peer);
    void acquireSlot();
    void releaseSlot();

    static void* threadEntry(void* arg);
    void threadHandler(int client_fd, const std::string& peer);
};

#endif // BASE_SERVER_HPP
