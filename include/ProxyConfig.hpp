#ifndef PROXY_CONFIG_HPP
#define PROXY_CONFIG_HPP

#include <cstddef>
#include <string>

/**
 * ProxyConfig - Runtime settings of the caching proxy
 *
 * Defaults reproduce the classic behavior: listen on 127.0.0.1:4000 with a
 * backlog of 10, 8 KiB reads, origins on 80 (HTTP) / 443 (CONNECT), and no
 * cap on concurrent connections.
 */
struct ProxyConfig {
    std::string host = "127.0.0.1";
    int port = 4000;
    int backlog = 10;
    size_t buffer_size = 8192;

    // Origin ports; the port in the request itself is never used
    int http_port = 80;
    int https_port = 443;

    // 0 = one thread per connection without limit
    size_t max_connections = 0;

    std::string blocklist_file;    // empty = start with an empty block list
    std::string log_file;          // empty = no log file
    bool console = true;           // interactive operator console on stdin

    /**
     * Parse command line options (argv[0] is skipped)
     *
     * @throws std::invalid_argument on unknown options, missing values or bad numbers
     */
    static ProxyConfig parseArgs(int argc, const char* const argv[]);

    /** Usage text for the given program name */
    static std::string usage(const std::string& program);
};

#endif // PROXY_CONFIG_HPP
