#ifndef FORWARDING_CLIENT_HPP
#define FORWARDING_CLIENT_HPP

#include <cstddef>
#include <string>

/**
 * ForwardingClient - Sends one raw request to an origin server and collects the reply
 *
 * Every call opens a fresh outbound TCP connection and closes it before
 * returning. The request bytes are sent unmodified.
 */
class ForwardingClient {
public:
    /**
     * @param buffer_size Size of each read from the origin
     */
    explicit ForwardingClient(size_t buffer_size = 8192);

    /**
     * Forward a request and read the response
     *
     * In full-read mode the response is read until the origin closes the
     * connection. Otherwise exactly one bounded read is performed; this is
     * what conditional GET probes use, since a 304 carries no body and the
     * origin may keep the connection open after it.
     *
     * @param request Raw request bytes
     * @param host Origin hostname or IP address
     * @param port Origin port
     * @param full_read true to read until close, false for a single read
     * @return Response bytes; empty if the read failed
     * @throws ConnectionError if resolving, connecting or sending fails
     */
    std::string forward(const std::string& request,
                        const std::string& host,
                        int port,
                        bool full_read) const;

    size_t bufferSize() const { return buffer_size; }

private:
    size_t buffer_size;
};

#endif // FORWARDING_CLIENT_HPP
