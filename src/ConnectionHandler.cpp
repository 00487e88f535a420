#include "ConnectionHandler.hpp"
#include "ErrorResponseBuilder.hpp"
#include "HTTPSTunnel.hpp"
#include "HTTPUtils.hpp"
#include "NetworkUtils.hpp"
#include "ProxyErrors.hpp"

#include <fmt/format.h>

ConnectionHandler::ConnectionHandler(const ProxyConfig& config,
                                     CacheStore& cache,
                                     const BlockList& blocked,
                                     const ForwardingClient& client,
                                     LogSink& sink)
    : config(config), cache(cache), blocked(blocked), client(client), sink(sink) {}

// ====================================================================================================
// Main Request Handler
// ====================================================================================================
ConnectionHandler::Outcome ConnectionHandler::handle(int client_fd, const std::string& peer) {
    Logger logger(peer, sink);
    auto start = Clock::now();

    // -------------------------------------------------------
    // RECEIVE: one bounded read
    // -------------------------------------------------------
    std::string request = NetworkUtils::receiveOnce(client_fd, config.buffer_size);
    if (request.empty()) {
        logger.logConnectionClosed(peer);
        return Outcome::Empty;
    }
    logger.logRequest(request);

    Outcome outcome;
    try {
        outcome = dispatch(client_fd, request, start, logger);
    } catch (const ParseError& e) {
        logger.logCustomMsg(std::string("Dropping request: ") + e.what());
        outcome = Outcome::Malformed;
    } catch (const ConnectionError& e) {
        logger.logCustomMsg(std::string("Origin unreachable: ") + e.what());
        sendToClient(client_fd, ErrorResponseBuilder::build502BadGateway(e.what()), logger);
        outcome = Outcome::OriginUnreachable;
    }

    logger.logConnectionClosed(peer);
    return outcome;
}

// ====================================================================================================
// Classification
// ====================================================================================================
ConnectionHandler::Outcome ConnectionHandler::dispatch(int client_fd,
                                                       const std::string& request,
                                                       Clock::time_point start,
                                                       Logger& logger) {
    // -------------------------------------------------------
    // PARSE
    // -------------------------------------------------------
    const std::string target = http_utils::extractTarget(request);
    const std::string host = http_utils::extractHost(request);
    const bool is_connect = http_utils::extractMethod(request) == "CONNECT";

    // -------------------------------------------------------
    // Blocked target
    // -------------------------------------------------------
    if (blocked.contains(target)) {
        sendBlocked(client_fd, is_connect, logger);
        return Outcome::Blocked;
    }

    // -------------------------------------------------------
    // Cached target: revalidate with a conditional GET
    // -------------------------------------------------------
    if (auto entry = cache.lookup(target)) {
        if (cache.revalidate(target, host) == CacheStore::Revalidation::NotModified) {
            sendToClient(client_fd, entry->raw_response, logger);

            std::chrono::duration<double> elapsed = Clock::now() - start;
            logger.logCustomMsg(fmt::format("Served {} from cache in {:.6f}s", target, elapsed.count()));
            logger.logCacheSaving((entry->fetch_latency - elapsed).count());
            return Outcome::CacheHit;
        }

        fetchAndCache(client_fd, request, target, host, start, logger);
        return Outcome::CacheRefreshed;
    }

    // -------------------------------------------------------
    // CONNECT: opaque tunnel, never cached
    // -------------------------------------------------------
    if (is_connect) {
        int server_fd = HTTPSTunnel::openTunnel(client_fd, host, config.https_port);
        logger.logTunnelEstablished(host, config.https_port);
        HTTPSTunnel::relay(client_fd, server_fd, config.buffer_size);
        return Outcome::Tunneled;
    }

    // -------------------------------------------------------
    // Plain HTTP: fetch and cache
    // -------------------------------------------------------
    fetchAndCache(client_fd, request, target, host, start, logger);
    return Outcome::Fetched;
}

// ====================================================================================================
// Responders
// ====================================================================================================
void ConnectionHandler::sendBlocked(int client_fd, bool is_connect, Logger& logger) {
    logger.logCustomMsg("Target is blocked");

    // A CONNECT client expects the tunnel line before anything else
    if (is_connect) {
        sendToClient(client_fd, ErrorResponseBuilder::connectionEstablished(), logger);
    }
    sendToClient(client_fd, ErrorResponseBuilder::build403Forbidden(), logger);
}

void ConnectionHandler::fetchAndCache(int client_fd,
                                      const std::string& request,
                                      const std::string& target,
                                      const std::string& host,
                                      Clock::time_point start,
                                      Logger& logger) {
    std::string response = client.forward(request, host, config.http_port, true);
    logger.logResponse(response);

    sendToClient(client_fd, response, logger);

    std::chrono::duration<double> elapsed = Clock::now() - start;
    cache.put(target, response, http_utils::extractLastModified(response), elapsed);
    logger.logCustomMsg(fmt::format("Fetched {} in {:.6f}s", target, elapsed.count()));
}

void ConnectionHandler::sendToClient(int client_fd, const std::string& data, Logger& logger) {
    if (!NetworkUtils::sendData(client_fd, data)) {
        logger.logCustomMsg("Failed to send " + std::to_string(data.size()) + " bytes to client");
    }
}
