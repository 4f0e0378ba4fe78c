/**
 * TOLLGATE - Resilient LLM Provider Client
 * Client Statistics - Read-only snapshots of every provider's state
 */

#ifndef TOLLGATE_CLIENT_STATS_HPP
#define TOLLGATE_CLIENT_STATS_HPP

#include "breaker/circuit_breaker.hpp"
#include "cache/response_cache.hpp"
#include "core/types.hpp"
#include "limiter/rate_limiter.hpp"
#include "pool/connection_pool.hpp"
#include "util/metrics.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tollgate::client {

/**
 * Snapshot for one provider
 */
struct ProviderStats {
    core::ProviderKey key;
    std::string kind;
    std::string endpoint;

    std::optional<pool::PoolStats> pool;   // This provider's host
    limiter::RateLimiterStats limiter;
    breaker::CircuitBreakerStats breaker;
    cache::CacheStats cache;
    util::MetricsSnapshot usage;
};

/**
 * Snapshot for the whole client
 */
struct ClientStats {
    std::vector<ProviderStats> providers;   // Configuration order
    pool::PoolStats pool_total;
    pool::PoolCounters pool_counters;

    const ProviderStats* find(const core::ProviderKey& key) const;
};

// JSON serialization support
void to_json(nlohmann::json& j, const ProviderStats& stats);
void to_json(nlohmann::json& j, const ClientStats& stats);

} // namespace tollgate::client

#endif // TOLLGATE_CLIENT_STATS_HPP
