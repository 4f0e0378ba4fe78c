/**
 * TOLLGATE - Resilient LLM Provider Client
 * Rate Limiter Implementation
 */

#include "limiter/rate_limiter.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace tollgate::limiter {

using util::log_component::Limiter;

void RateLimiter::add_provider(const core::ProviderKey& key, const RateLimitSettings& settings) {
    auto [it, inserted] = buckets_.try_emplace(
        key, std::make_unique<Entry>(settings.rate_per_second, settings.burst_capacity));
    if (!inserted) {
        throw std::invalid_argument("Rate limiter already has provider '" + key + "'");
    }

    if (settings.rate_per_second > 0.0) {
        TOLLGATE_LOG_DEBUG(Limiter, "Bucket for {}: rate={}/s, capacity={}",
                           key, settings.rate_per_second, settings.burst_capacity);
    } else {
        TOLLGATE_LOG_DEBUG(Limiter, "Bucket for {}: unlimited", key);
    }
}

bool RateLimiter::try_acquire(const core::ProviderKey& key, double tokens,
                              std::chrono::milliseconds timeout) {
    return try_acquire_until(key, tokens, Clock::now() + timeout);
}

bool RateLimiter::try_acquire_until(const core::ProviderKey& key, double tokens,
                                    Clock::time_point deadline) {
    auto& e = entry(key);
    const auto started = Clock::now();

    while (true) {
        auto now = Clock::now();
        auto attempt = e.bucket.try_acquire_at(now, tokens);

        if (attempt.admitted) {
            e.admitted.fetch_add(1, std::memory_order_relaxed);
            if (now > started) {
                e.wait_ns.fetch_add(static_cast<std::uint64_t>(
                    std::chrono::duration_cast<std::chrono::nanoseconds>(now - started).count()),
                    std::memory_order_relaxed);
            }
            return true;
        }

        if (!attempt.satisfiable) {
            e.rejected.fetch_add(1, std::memory_order_relaxed);
            TOLLGATE_LOG_WARN(Limiter, "Request for {} tokens exceeds {} capacity {}",
                              tokens, key, e.bucket.capacity());
            return false;
        }

        auto remaining = deadline - now;
        if (remaining <= Clock::duration::zero() ||
            attempt.retry_after > remaining) {
            // Enough tokens cannot accrue before the deadline
            e.rejected.fetch_add(1, std::memory_order_relaxed);
            TOLLGATE_LOG_DEBUG(Limiter, "Rate limited: {} (need {} tokens, retry in {}ms)",
                               key, tokens,
                               std::chrono::duration_cast<std::chrono::milliseconds>(attempt.retry_after).count());
            return false;
        }

        // Other callers may take the tokens first; re-check after the wait
        std::this_thread::sleep_for(std::min<Clock::duration>(attempt.retry_after, remaining));
    }
}

bool RateLimiter::try_acquire_all(const std::vector<core::ProviderKey>& keys, double tokens) {
    std::vector<Entry*> entries;
    entries.reserve(keys.size());
    for (const auto& key : keys) {
        entries.push_back(&entry(key));
    }

    const auto now = Clock::now();
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (!entries[i]->bucket.try_acquire_at(now, tokens).admitted) {
            for (std::size_t j = 0; j < i; ++j) {
                entries[j]->bucket.refund(tokens);
            }
            entries[i]->rejected.fetch_add(1, std::memory_order_relaxed);
            TOLLGATE_LOG_DEBUG(Limiter, "Bulk acquire of {} tokens stopped at {}", tokens, keys[i]);
            return false;
        }
    }

    for (auto* e : entries) {
        e->admitted.fetch_add(1, std::memory_order_relaxed);
    }
    return true;
}

void RateLimiter::refund(const core::ProviderKey& key, double tokens) {
    entry(key).bucket.refund(tokens);
    TOLLGATE_LOG_TRACE(Limiter, "Refunded {} tokens to {}", tokens, key);
}

void RateLimiter::reset(const core::ProviderKey& key) {
    entry(key).bucket.reset();
}

void RateLimiter::reset_all() {
    for (auto& [key, e] : buckets_) {
        e->bucket.reset();
    }
    TOLLGATE_LOG_INFO(Limiter, "Refilled {} bucket(s)", buckets_.size());
}

bool RateLimiter::contains(const core::ProviderKey& key) const {
    return buckets_.find(key) != buckets_.end();
}

double RateLimiter::capacity(const core::ProviderKey& key) const {
    return entry(key).bucket.capacity();
}

RateLimiterStats RateLimiter::stats(const core::ProviderKey& key) const {
    const auto& e = entry(key);
    RateLimiterStats stats;
    stats.current_tokens = e.bucket.available_tokens();
    stats.capacity = e.bucket.capacity();
    stats.rate_per_second = e.bucket.rate();
    stats.admitted = e.admitted.load(std::memory_order_relaxed);
    stats.rejected = e.rejected.load(std::memory_order_relaxed);
    stats.total_wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::nanoseconds(e.wait_ns.load(std::memory_order_relaxed)));
    return stats;
}

std::vector<core::ProviderKey> RateLimiter::keys() const {
    std::vector<core::ProviderKey> result;
    result.reserve(buckets_.size());
    for (const auto& [key, e] : buckets_) {
        result.push_back(key);
    }
    return result;
}

RateLimiter::Entry& RateLimiter::entry(const core::ProviderKey& key) const {
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        throw std::out_of_range("Unknown provider for rate limiter: " + key);
    }
    return *it->second;
}

} // namespace tollgate::limiter
