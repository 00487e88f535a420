#ifndef PROXY_ERRORS_HPP
#define PROXY_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * Errors raised by the proxy core.
 *
 * All of them are local to one client connection: the ConnectionHandler
 * catches them and closes that connection, the listener keeps running.
 */
class ProxyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** Malformed request line (no target token) */
class ParseError : public ProxyError {
public:
    using ProxyError::ProxyError;
};

/** Resolving, connecting or sending to an origin server failed */
class ConnectionError : public ProxyError {
public:
    ConnectionError(const std::string& host, int port, const std::string& reason)
        : ProxyError("cannot reach " + host + ":" + std::to_string(port) + " (" + reason + ")"),
          host_(host), port_(port) {}

    const std::string& host() const { return host_; }
    int port() const { return port_; }

private:
    std::string host_;
    int port_;
};

#endif // PROXY_ERRORS_HPP
