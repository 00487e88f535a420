#ifndef HTTP_PROXY_SERVER_HPP
#define HTTP_PROXY_SERVER_HPP

#include "BaseServer.hpp"
#include "BlockList.hpp"
#include "CacheStore.hpp"
#include "ConnectionHandler.hpp"
#include "ForwardingClient.hpp"
#include "Logger.hpp"
#include "ProxyConfig.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * HTTPProxyServer - Multi-threaded caching HTTP proxy with HTTPS tunneling
 *
 * Features:
 * - HTTP proxying with a response cache revalidated by conditional GET
 * - HTTPS tunneling (CONNECT method), never cached or decrypted
 * - Target block list editable while the server runs
 *
 * The server owns the cache, the block list and the outbound client and
 * hands them to a ConnectionHandler for every accepted connection.
 */
class HTTPProxyServer : public BaseServer {
public:
    using LogCallback = std::function<void(const std::string&)>;

    /**
     * Constructor
     * @param config Listen address, origin ports, buffer size, ...
     * @param on_log Receives every formatted log line; when empty, lines go
     *               to stdout (and to config.log_file if set)
     */
    explicit HTTPProxyServer(const ProxyConfig& config, LogCallback on_log = nullptr);

    /**
     * Block a target
     * @return false if url is empty or already blocked
     */
    bool addBlocked(const std::string& url);

    /**
     * Unblock a target
     * @return false if url was not blocked
     */
    bool removeBlocked(const std::string& url);

    std::vector<std::string> blockedUrls() const;

    const CacheStore& cache() const { return cache_store; }

    const ProxyConfig& config() const { return proxy_config; }

protected:
    /**
     * Handle a client connection
     * This is called by BaseServer for each accepted connection
     */
    void handleRequest(int client_fd, const std::string& peer) override;

    void onListening() override;

private:
    ProxyConfig proxy_config;
    std::shared_ptr<LogSink> sink;
    Logger logger;

    ForwardingClient forwarding_client;
    CacheStore cache_store;
    BlockList block_list;
    ConnectionHandler handler;

    static std::shared_ptr<LogSink> makeSink(const ProxyConfig& config, LogCallback on_log);
};

#endif // HTTP_PROXY_SERVER_HPP
