#include "HTTPProxyServer.hpp"

#include <fmt/format.h>

// ====================================================================================================
// Constructor
// ====================================================================================================
HTTPProxyServer::HTTPProxyServer(const ProxyConfig& config, LogCallback on_log)
    : BaseServer(config.host, config.port, config.backlog, config.max_connections),
      proxy_config(config),
      sink(makeSink(config, std::move(on_log))),
      logger("server", *sink),
      forwarding_client(config.buffer_size),
      cache_store(forwarding_client, config.http_port),
      handler(proxy_config, cache_store, block_list, forwarding_client, *sink) {

    if (config.blocklist_file.empty()) {
        return;
    }
    if (block_list.loadFromFile(config.blocklist_file)) {
        logger.logCustomMsg(fmt::format("Loaded {} blocked targets from {}",
                                        block_list.size(), config.blocklist_file));
    } else {
        logger.logCustomMsg("Failed to open block list " + config.blocklist_file);
    }
}

std::shared_ptr<LogSink> HTTPProxyServer::makeSink(const ProxyConfig& config, LogCallback on_log) {
    std::shared_ptr<LogSink> primary;
    if (on_log) {
        primary = std::make_shared<CallbackLogSink>(std::move(on_log));
    } else {
        primary = std::make_shared<ConsoleLogSink>();
    }

    if (config.log_file.empty()) {
        return primary;
    }

    std::vector<std::shared_ptr<LogSink>> sinks{primary, std::make_shared<FileLogSink>(config.log_file)};
    return std::make_shared<TeeLogSink>(std::move(sinks));
}

// ====================================================================================================
// Block List Control
// ====================================================================================================
bool HTTPProxyServer::addBlocked(const std::string& url) {
    if (!block_list.add(url)) {
        return false;
    }
    logger.logCustomMsg("Added blocked URL: " + url);
    return true;
}

bool HTTPProxyServer::removeBlocked(const std::string& url) {
    if (!block_list.remove(url)) {
        return false;
    }
    logger.logCustomMsg("Removed blocked URL: " + url);
    return true;
}

std::vector<std::string> HTTPProxyServer::blockedUrls() const {
    return block_list.entries();
}

// ====================================================================================================
// Listener Hooks
// ====================================================================================================
void HTTPProxyServer::onListening() {
    logger.logCustomMsg(fmt::format("Proxy Server Started: ({}, {})", host(), boundPort()));
    logger.logCustomMsg(fmt::format("Backlog set to {}!", backlog));
    if (max_connections > 0) {
        logger.logCustomMsg(fmt::format("Connection cap set to {}", max_connections));
    }
}

void HTTPProxyServer::handleRequest(int client_fd, const std::string& peer) {
    logger.logConnectionOpened(peer);
    handler.handle(client_fd, peer);
}
