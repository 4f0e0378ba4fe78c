/**
 * TOLLGATE - Resilient LLM Provider Client
 * Provider Registry - Per-provider resilience state built once from configuration
 */

#ifndef TOLLGATE_CLIENT_PROVIDER_REGISTRY_HPP
#define TOLLGATE_CLIENT_PROVIDER_REGISTRY_HPP

#include "breaker/circuit_breaker.hpp"
#include "cache/cache_policy.hpp"
#include "cache/response_cache.hpp"
#include "client/provider_adapter.hpp"
#include "config/config.hpp"
#include "limiter/rate_limiter.hpp"
#include "pool/connection_pool.hpp"
#include "pool/endpoint.hpp"
#include "tokens/token_counter.hpp"
#include "util/metrics.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tollgate::client {

/**
 * Everything the client needs for one provider key
 *
 * The rate limiter bucket and circuit breaker live in the registry's
 * RateLimiter and CircuitBreakerRegistry under the same key.
 */
struct ProviderEntry {
    explicit ProviderEntry(const config::ProviderSettings& provider_settings);

    config::ProviderSettings settings;
    pool::Endpoint endpoint;
    std::string api_key;

    cache::CachePolicy policy;
    cache::ResponseCache cache;
    tokens::TokenCounter tokens;
    std::unique_ptr<ProviderAdapter> adapter;
    util::ProviderMetrics metrics;
};

pool::ConnectionPoolConfig make_pool_config(const config::Config& config);
limiter::RateLimitSettings make_rate_limit_settings(const config::ProviderSettings& settings);
breaker::CircuitBreakerConfig make_breaker_config(const config::ProviderSettings& settings);
cache::ResponseCacheConfig make_cache_config(const config::ProviderSettings& settings);

/**
 * Keyed registry of provider state
 *
 * Built once at startup; the set of providers never changes afterwards, so
 * lookups need no lock. Per-provider components synchronize themselves.
 */
class ProviderRegistry {
public:
    /**
     * @param config Validated configuration
     * @param session_factory Session factory for the pool, defaults to real HTTP sessions
     * @throws std::runtime_error if the configuration is invalid
     */
    explicit ProviderRegistry(const config::Config& config,
                              std::shared_ptr<pool::SessionFactory> session_factory = nullptr);
    ~ProviderRegistry();

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /**
     * Provider entry, nullptr for an unknown key
     */
    ProviderEntry* find(const core::ProviderKey& key) const;

    /**
     * @throws std::out_of_range for an unknown key
     */
    ProviderEntry& get(const core::ProviderKey& key) const;

    bool contains(const core::ProviderKey& key) const;

    /**
     * Provider keys in configuration order
     */
    const std::vector<core::ProviderKey>& keys() const { return order_; }

    limiter::RateLimiter& limiter() { return limiter_; }
    breaker::CircuitBreakerRegistry& breakers() { return breakers_; }
    pool::ConnectionPool& pool() { return pool_; }

    const limiter::RateLimiter& limiter() const { return limiter_; }
    const breaker::CircuitBreakerRegistry& breakers() const { return breakers_; }
    const pool::ConnectionPool& pool() const { return pool_; }

    /**
     * Start / stop background work (the pool's idle reaper)
     */
    void start();
    void stop();

private:
    pool::ConnectionPool pool_;
    limiter::RateLimiter limiter_;
    breaker::CircuitBreakerRegistry breakers_;

    std::unordered_map<core::ProviderKey, std::unique_ptr<ProviderEntry>> entries_;
    std::vector<core::ProviderKey> order_;
};

} // namespace tollgate::client

#endif // TOLLGATE_CLIENT_PROVIDER_REGISTRY_HPP
