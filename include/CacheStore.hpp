#ifndef CACHE_STORE_HPP
#define CACHE_STORE_HPP

#include "ForwardingClient.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/**
 * One cached origin response
 */
struct CacheEntry {
    std::string raw_response;                       // Status line, headers and body as received
    std::string last_modified;                      // Value sent back in If-Modified-Since
    std::chrono::duration<double> fetch_latency{};  // Time the full fetch took
};

/**
 * CacheStore - Response cache keyed by the raw request-line target
 *
 * Responsibilities:
 * - Store and look up responses (no eviction, no size bound)
 * - Revalidate an entry against its origin with a conditional GET
 *
 * Keys are not host-qualified: "/index.html" requested from two hosts maps
 * to the same entry. Every operation is atomic with respect to the others;
 * the revalidation probe runs without holding the lock.
 */
class CacheStore {
public:
    enum class Revalidation {
        Fresh,        // Origin did not answer 304; caller must re-fetch in full
        NotModified   // Origin answered 304; cached bytes are still valid
    };

    /**
     * @param client Client used for conditional GET probes
     * @param origin_port Port the probes are sent to
     */
    CacheStore(const ForwardingClient& client, int origin_port);

    /**
     * Look up a target
     * @return Copy of the entry, or std::nullopt if not cached
     */
    std::optional<CacheEntry> lookup(const std::string& target) const;

    /**
     * Store a response, replacing any previous entry for the target
     */
    void put(const std::string& target,
             std::string raw_response,
             std::string last_modified,
             std::chrono::duration<double> fetch_latency);

    /**
     * Ask the origin whether the cached response for target is still current
     *
     * Sends "GET <target>" with If-Modified-Since set to the stored
     * last-modified marker and performs a single read of the reply. Only a
     * status code of exactly 304 counts as NotModified; the probe bytes are
     * discarded either way. A target with no entry is reported Fresh without
     * contacting the origin.
     *
     * @param target Cached request-line target
     * @param host Origin host
     * @throws ConnectionError if the probe cannot be sent
     */
    Revalidation revalidate(const std::string& target, const std::string& host) const;

    size_t size() const;

private:
    const ForwardingClient& client;
    int origin_port;

    mutable std::mutex mutex;
    std::unordered_map<std::string, CacheEntry> entries;
};

#endif // CACHE_STORE_HPP
