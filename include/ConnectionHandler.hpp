#ifndef CONNECTION_HANDLER_HPP
#define CONNECTION_HANDLER_HPP

#include "BlockList.hpp"
#include "CacheStore.hpp"
#include "ForwardingClient.hpp"
#include "Logger.hpp"
#include "ProxyConfig.hpp"

#include <chrono>
#include <string>

/**
 * ConnectionHandler - Serves exactly one client connection
 *
 * Workflow: receive one request, classify it, respond, done.
 * Classification, first match wins:
 * 1. Target is blocked       -> fixed 403 (after the 200 line for CONNECT)
 * 2. Target is cached        -> conditional GET; serve cache on 304, else re-fetch
 * 3. Method is CONNECT       -> opaque tunnel to the origin HTTPS port
 * 4. Anything else           -> full fetch from the origin HTTP port, then cache
 *
 * Malformed requests and unreachable origins only affect this connection.
 * The client descriptor is owned by the caller, which closes it afterwards.
 */
class ConnectionHandler {
public:
    enum class Outcome {
        Empty,              // Client closed before sending anything
        Malformed,          // Request line had no target; nothing sent
        Blocked,            // 403 sent
        CacheHit,           // Origin answered 304; cached bytes sent
        CacheRefreshed,     // Cached entry was stale; fetched and replaced
        Fetched,            // Uncached request; fetched and stored
        Tunneled,           // CONNECT relay ran until one side closed
        OriginUnreachable   // Origin could not be reached; 502 sent
    };

    ConnectionHandler(const ProxyConfig& config,
                      CacheStore& cache,
                      const BlockList& blocked,
                      const ForwardingClient& client,
                      LogSink& sink);

    /**
     * Handle one client connection
     *
     * @param client_fd Connected client socket
     * @param peer Printable client address, used to tag log lines
     * @return What was done with the request
     */
    Outcome handle(int client_fd, const std::string& peer);

private:
    using Clock = std::chrono::steady_clock;

    const ProxyConfig& config;
    CacheStore& cache;
    const BlockList& blocked;
    const ForwardingClient& client;
    LogSink& sink;

    Outcome dispatch(int client_fd, const std::string& request,
                     Clock::time_point start, Logger& logger);

    void sendBlocked(int client_fd, bool is_connect, Logger& logger);

    /**
     * Fetch the request in full, send it to the client and store it
     */
    void fetchAndCache(int client_fd,
                       const std::string& request,
                       const std::string& target,
                       const std::string& host,
                       Clock::time_point start,
                       Logger& logger);

    void sendToClient(int client_fd, const std::string& data, Logger& logger);
};

#endif // CONNECTION_HANDLER_HPP
