/**
 * TOLLGATE - Resilient LLM Provider Client
 * DNS Cache Implementation
 */

#include "pool/dns_cache.hpp"
#include "util/logger.hpp"

namespace tollgate::pool {

using util::log_component::Transport;

DnsCache::DnsCache(std::chrono::seconds ttl)
    : ttl_(ttl) {
}

std::optional<DnsCache::Results> DnsCache::lookup(const std::string& host, std::uint16_t port) {
    return lookup_at(host, port, Clock::now());
}

std::optional<DnsCache::Results> DnsCache::lookup_at(const std::string& host, std::uint16_t port,
                                                     Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(make_key(host, port));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now >= it->second.expires_at) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.results;
}

void DnsCache::store(const std::string& host, std::uint16_t port, Results results) {
    store_at(host, port, std::move(results), Clock::now());
}

void DnsCache::store_at(const std::string& host, std::uint16_t port, Results results,
                        Clock::time_point now) {
    if (ttl_ <= std::chrono::seconds::zero() || results.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[make_key(host, port)] = Entry{
        .results = std::move(results),
        .expires_at = now + ttl_
    };
    TOLLGATE_LOG_TRACE(Transport, "Cached DNS results for {}:{} ({}s)", host, port, ttl_.count());
}

void DnsCache::invalidate(const std::string& host, std::uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(make_key(host, port));
}

void DnsCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::size_t DnsCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string DnsCache::make_key(const std::string& host, std::uint16_t port) {
    return host + ":" + std::to_string(port);
}

} // namespace tollgate::pool
