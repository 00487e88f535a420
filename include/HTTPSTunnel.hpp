#ifndef HTTPS_TUNNEL_HPP
#define HTTPS_TUNNEL_HPP

#include <cstddef>
#include <string>

/**
 * HTTPSTunnel - Handles HTTPS CONNECT tunneling
 *
 * Responsibilities:
 * - Establish tunnel connection to destination server
 * - Send tunnel establishment response to client
 * - Perform bidirectional data forwarding between client and server
 * - Close both directions once either side is done
 *
 * The CONNECT method creates a TCP tunnel through the proxy. The relayed
 * bytes are never inspected: TLS records pass through untouched.
 */
class HTTPSTunnel {
public:
    /**
     * Connect to the destination and tell the client the tunnel is ready
     *
     * @param client_fd Client socket file descriptor
     * @param host Destination hostname
     * @param port Destination port
     * @return Connected origin socket; the caller hands it to relay()
     * @throws ConnectionError if the origin is unreachable or the client
     *         cannot be told about the tunnel
     */
    static int openTunnel(int client_fd, const std::string& host, int port);

    /**
     * Forward bytes both ways until either side closes
     *
     * Uses poll() over the two sockets; there is no timeout. On return the
     * origin socket is closed and the client socket is shut down for reading
     * and writing. The client descriptor itself stays owned by the caller.
     *
     * @param client_fd Client socket
     * @param server_fd Origin socket (closed by this call)
     * @param buffer_size Size of each read
     */
    static void relay(int client_fd, int server_fd, size_t buffer_size = 8192);

    /**
     * openTunnel() followed by relay()
     *
     * @throws ConnectionError if the tunnel cannot be opened
     */
    static void establish(int client_fd, const std::string& host, int port,
                          size_t buffer_size = 8192);

private:
    /**
     * Perform bidirectional forwarding between client and server
     *
     * @return when either side reaches EOF or an I/O error occurs
     */
    static void forwardTraffic(int client_fd, int server_fd, size_t buffer_size);
};

#endif // HTTPS_TUNNEL_HPP
