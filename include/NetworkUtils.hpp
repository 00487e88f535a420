#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <sys/types.h>

/**
 * NetworkUtils - Common networking utility functions
 *
 * Provides reusable blocking socket operations used across the proxy:
 * - Making outbound TCP connections
 * - Sending data with partial-write handling
 * - Receiving one buffer or everything until the peer closes
 *
 * Failures are reported through return values (-1 / false) and a line on
 * stderr; callers decide whether that becomes an exception.
 *
 * This is a utility class with static methods only.
 */
class NetworkUtils {
public:
    /**
     * Connect to a remote host
     *
     * Performs DNS resolution and establishes a TCP connection, trying each
     * resolved address in turn. Supports both IPv4 and IPv6.
     *
     * @param host Hostname or IP address
     * @param port Port number
     * @return Socket file descriptor on success, -1 on failure
     */
    static int connectToHost(const std::string& host, int port);

    /**
     * Send complete data to socket
     *
     * Ensures all data is sent or returns error.
     * Handles partial sends automatically.
     *
     * @param fd Socket file descriptor
     * @param data Data to send
     * @param length Length of data in bytes
     * @return true on success, false on failure
     */
    static bool sendData(int fd, const char* data, size_t length);

    /**
     * Send string data to socket
     *
     * @param fd Socket file descriptor
     * @param data String data to send
     * @return true on success, false on failure
     */
    static bool sendData(int fd, const std::string& data);

    /**
     * Receive up to max_length bytes from socket
     *
     * @param fd Socket file descriptor
     * @param buffer Buffer to store received data
     * @param max_length Maximum bytes to receive
     * @return Number of bytes received, 0 on EOF, -1 on error
     */
    static ssize_t receiveData(int fd, char* buffer, size_t max_length);

    /**
     * Perform exactly one bounded read
     *
     * @param fd Socket file descriptor
     * @param max_length Maximum bytes to receive
     * @return Bytes received; empty on EOF or error
     */
    static std::string receiveOnce(int fd, size_t max_length);

    /**
     * Read until the peer closes the connection
     *
     * @param fd Socket file descriptor
     * @param chunk_size Size of each individual read
     * @return Everything received before EOF (or before a read error)
     */
    static std::string receiveUntilClose(int fd, size_t chunk_size);

    /**
     * Get last socket error as string
     *
     * @return Human-readable error message
     */
    static std::string getLastError();

private:
    // Utility class - no instances allowed
    NetworkUtils() = delete;
    ~NetworkUtils() = delete;
    NetworkUtils(const NetworkUtils&) = delete;
    NetworkUtils& operator=(const NetworkUtils&) = delete;
};

#endif // NETWORK_UTILS_HPP
