#include "CacheStore.hpp"
#include "HTTPUtils.hpp"

CacheStore::CacheStore(const ForwardingClient& client, int origin_port)
    : client(client), origin_port(origin_port) {}

std::optional<CacheEntry> CacheStore::lookup(const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(target);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CacheStore::put(const std::string& target,
                     std::string raw_response,
                     std::string last_modified,
                     std::chrono::duration<double> fetch_latency) {
    CacheEntry entry{std::move(raw_response), std::move(last_modified), fetch_latency};

    std::lock_guard<std::mutex> lock(mutex);
    entries.insert_or_assign(target, std::move(entry));
}

CacheStore::Revalidation CacheStore::revalidate(const std::string& target,
                                                const std::string& host) const {
    std::string last_modified;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = entries.find(target);
        if (it == entries.end()) {
            return Revalidation::Fresh;
        }
        last_modified = it->second.last_modified;
    }

    std::string probe = http_utils::buildConditionalGet(target, host, last_modified);
    std::string reply = client.forward(probe, host, origin_port, false);

    if (http_utils::extractStatusCode(reply) == "304") {
        return Revalidation::NotModified;
    }
    return Revalidation::Fresh;
}

size_t CacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}
