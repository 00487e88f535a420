#include "ProxyConfig.hpp"

#include <stdexcept>
#include <string>

namespace {

long parseNumber(const std::string& option, const std::string& value, long min, long max) {
    size_t consumed = 0;
    long number;
    try {
        number = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
    if (consumed != value.size() || number < min || number > max) {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
    return number;
}

} // namespace

ProxyConfig ProxyConfig::parseArgs(int argc, const char* const argv[]) {
    ProxyConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string option = argv[i];

        if (option == "--no-console") {
            config.console = false;
            continue;
        }

        // Every other option takes exactly one value
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + option);
        }
        std::string value = argv[++i];

        if (option == "--host") {
            config.host = value;
        } else if (option == "--port") {
            config.port = static_cast<int>(parseNumber(option, value, 0, 65535));
        } else if (option == "--backlog") {
            config.backlog = static_cast<int>(parseNumber(option, value, 1, 65535));
        } else if (option == "--buffer") {
            config.buffer_size = static_cast<size_t>(parseNumber(option, value, 1, 16 * 1024 * 1024));
        } else if (option == "--http-port") {
            config.http_port = static_cast<int>(parseNumber(option, value, 1, 65535));
        } else if (option == "--https-port") {
            config.https_port = static_cast<int>(parseNumber(option, value, 1, 65535));
        } else if (option == "--max-connections") {
            config.max_connections = static_cast<size_t>(parseNumber(option, value, 0, 1000000));
        } else if (option == "--blocklist") {
            config.blocklist_file = value;
        } else if (option == "--log-file") {
            config.log_file = value;
        } else {
            throw std::invalid_argument("Unknown option: " + option);
        }
    }

    return config;
}

std::string ProxyConfig::usage(const std::string& program) {
    return "Usage:\n"
           "  " + program + " [options]\n"
           "\n"
           "Options:\n"
           "  --host <addr>             Listen address (default 127.0.0.1)\n"
           "  --port <port>             Listen port (default 4000)\n"
           "  --backlog <n>             Pending connection backlog (default 10)\n"
           "  --buffer <bytes>          Socket read size (default 8192)\n"
           "  --http-port <port>        Origin port for HTTP requests (default 80)\n"
           "  --https-port <port>       Origin port for CONNECT tunnels (default 443)\n"
           "  --max-connections <n>     Cap on concurrent connections, 0 = unlimited (default 0)\n"
           "  --blocklist <file>        Initial block list, one target per line\n"
           "  --log-file <file>         Also append log lines to this file\n"
           "  --no-console              Do not read operator commands from stdin\n";
}
