/**
 * TOLLGATE - Resilient LLM Provider Client
 * Resilient Client - cache -> rate limiter -> circuit breaker -> pool pipeline
 */

#ifndef TOLLGATE_CLIENT_RESILIENT_CLIENT_HPP
#define TOLLGATE_CLIENT_RESILIENT_CLIENT_HPP

#include "cache/cache_key.hpp"
#include "client/provider_registry.hpp"
#include "client/stats.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace tollgate::client {

/**
 * Composition root for provider calls
 *
 * Every call runs the same pipeline:
 *   0. resolve the provider key (unknown key -> ConfigError)
 *   1. cache lookup when the provider's policy allows it; a hit returns
 *      immediately without touching the limiter or breaker
 *   2. rate-limiter acquire, waiting no longer than the configured wait or
 *      the deadline
 *   3. circuit-breaker admission
 *   4. pooled connection and network call under the deadline
 *   5. connection release, breaker record, cache store
 *
 * Call outcomes are returned as values; complete() never throws.
 * The client holds no provider state of its own.
 */
class ResilientClient {
public:
    explicit ResilientClient(ProviderRegistry& registry);

    ResilientClient(const ResilientClient&) = delete;
    ResilientClient& operator=(const ResilientClient&) = delete;

    /**
     * Run one completion call against request.provider
     */
    core::CallResult complete(const core::CompletionRequest& request);

    /**
     * Try providers in order until one succeeds or a failure is not worth
     * failing over (ClientError, ConfigError).
     *
     * request.provider is ignored; an empty list fails with ConfigError.
     * Returns the last failure when every provider failed.
     */
    core::CallResult complete_with_failover(const core::CompletionRequest& request,
                                            const std::vector<core::ProviderKey>& providers);

    /**
     * Snapshot of every provider's state
     */
    ClientStats stats() const;

    ProviderRegistry& registry() { return registry_; }

private:
    using Clock = core::Clock;

    core::CallResult run_pipeline(ProviderEntry& entry,
                                  const core::CompletionRequest& request,
                                  Clock::time_point start,
                                  bool& cache_hit);

    std::optional<core::CompletionResult> lookup_cache(ProviderEntry& entry,
                                                       const cache::CacheKey& key) const;

    void store_cache(ProviderEntry& entry, const cache::CacheKey& key,
                     const core::CompletionRequest& request,
                     const core::CompletionResult& result) const;

    /**
     * Fill in estimates and provider fields on a fresh result
     */
    void finish_result(ProviderEntry& entry, const core::CompletionRequest& request,
                       std::uint32_t estimated_prompt_tokens,
                       core::CompletionResult& result) const;

    void log_call(const core::CompletionRequest& request, const core::CallResult& outcome,
                  bool cache_hit) const;

    ProviderRegistry& registry_;
};

} // namespace tollgate::client

#endif // TOLLGATE_CLIENT_RESILIENT_CLIENT_HPP
