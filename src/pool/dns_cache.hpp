/**
 * TOLLGATE - Resilient LLM Provider Client
 * DNS Cache - Resolved addresses kept for a fixed TTL
 */

#ifndef TOLLGATE_POOL_DNS_CACHE_HPP
#define TOLLGATE_POOL_DNS_CACHE_HPP

#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tollgate::pool {

using tcp = boost::asio::ip::tcp;

class DnsCache {
public:
    using Clock = std::chrono::steady_clock;
    using Results = tcp::resolver::results_type;

    explicit DnsCache(std::chrono::seconds ttl = std::chrono::seconds(300));

    /**
     * Cached results for host:port, nullopt when absent or expired
     */
    std::optional<Results> lookup(const std::string& host, std::uint16_t port);
    std::optional<Results> lookup_at(const std::string& host, std::uint16_t port,
                                     Clock::time_point now);

    void store(const std::string& host, std::uint16_t port, Results results);
    void store_at(const std::string& host, std::uint16_t port, Results results,
                  Clock::time_point now);

    /**
     * Drop a host after a connect failure so the next attempt re-resolves
     */
    void invalidate(const std::string& host, std::uint16_t port);

    void clear();
    std::size_t size() const;
    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Entry {
        Results results;
        Clock::time_point expires_at;
    };

    static std::string make_key(const std::string& host, std::uint16_t port);

    std::chrono::seconds ttl_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace tollgate::pool

#endif // TOLLGATE_POOL_DNS_CACHE_HPP
