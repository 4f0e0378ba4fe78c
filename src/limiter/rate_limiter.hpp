/**
 * TOLLGATE - Resilient LLM Provider Client
 * Rate Limiter - One token bucket per provider key
 *
 * Features:
 * - Independent buckets, no lock shared between providers
 * - Fail-fast or bounded blocking wait per call
 * - Refund of tokens for calls that never reached the network
 * - Admission/rejection counters for monitoring
 */

#ifndef TOLLGATE_LIMITER_RATE_LIMITER_HPP
#define TOLLGATE_LIMITER_RATE_LIMITER_HPP

#include "core/types.hpp"
#include "limiter/token_bucket.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tollgate::limiter {

/**
 * Bucket parameters for one provider
 */
struct RateLimitSettings {
    double rate_per_second{5.0};   // <= 0 = unlimited
    double burst_capacity{10.0};
};

/**
 * Read-only snapshot for one provider
 */
struct RateLimiterStats {
    double current_tokens{0.0};
    double capacity{0.0};
    double rate_per_second{0.0};
    std::uint64_t admitted{0};
    std::uint64_t rejected{0};
    std::chrono::milliseconds total_wait{0};
};

/**
 * Keyed registry of token buckets
 *
 * Providers are added at startup; the key set is fixed once calls begin, so
 * lookups take no registry lock.
 */
class RateLimiter {
public:
    using Clock = TokenBucket::Clock;

    RateLimiter() = default;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Register a provider's bucket (startup only)
     * @throws std::invalid_argument if the key is already registered
     */
    void add_provider(const core::ProviderKey& key, const RateLimitSettings& settings);

    /**
     * Acquire tokens for a provider
     *
     * @param key Provider key
     * @param tokens Tokens to take
     * @param timeout 0 = fail fast, otherwise wait up to this long
     * @return true if admitted
     * @throws std::out_of_range for an unknown key
     */
    bool try_acquire(const core::ProviderKey& key, double tokens = 1.0,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    /**
     * Acquire tokens, waiting no later than the given deadline
     */
    bool try_acquire_until(const core::ProviderKey& key, double tokens,
                           Clock::time_point deadline);

    /**
     * Take tokens from several providers at once, or from none of them.
     * Never waits.
     * @throws std::out_of_range for an unknown key, before anything is taken
     */
    bool try_acquire_all(const std::vector<core::ProviderKey>& keys, double tokens = 1.0);

    /**
     * Return unused tokens to a provider's bucket
     */
    void refund(const core::ProviderKey& key, double tokens);

    /**
     * Refill a provider's bucket to capacity
     */
    void reset(const core::ProviderKey& key);
    void reset_all();

    bool contains(const core::ProviderKey& key) const;

    /**
     * Capacity of a provider's bucket (used to clamp token-budget requests)
     */
    double capacity(const core::ProviderKey& key) const;

    RateLimiterStats stats(const core::ProviderKey& key) const;

    std::vector<core::ProviderKey> keys() const;

private:
    struct Entry {
        Entry(double rate, double capacity) : bucket(rate, capacity) {}

        TokenBucket bucket;
        std::atomic<std::uint64_t> admitted{0};
        std::atomic<std::uint64_t> rejected{0};
        std::atomic<std::uint64_t> wait_ns{0};
    };

    Entry& entry(const core::ProviderKey& key) const;

    std::unordered_map<core::ProviderKey, std::unique_ptr<Entry>> buckets_;
};

} // namespace tollgate::limiter

#endif // TOLLGATE_LIMITER_RATE_LIMITER_HPP
