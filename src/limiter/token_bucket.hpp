/**
 * TOLLGATE - Resilient LLM Provider Client
 * Token Bucket - Lazily refilled bucket for one provider
 */

#ifndef TOLLGATE_LIMITER_TOKEN_BUCKET_HPP
#define TOLLGATE_LIMITER_TOKEN_BUCKET_HPP

#include <chrono>
#include <mutex>

namespace tollgate::limiter {

/**
 * Outcome of a single acquisition attempt
 */
struct AcquireAttempt {
    bool admitted{false};
    bool satisfiable{true};                    // false when tokens > capacity
    std::chrono::nanoseconds retry_after{0};   // Time until enough tokens accrue
};

/**
 * Token bucket with lazy refill
 *
 * Tokens are refilled from elapsed steady-clock time at each attempt; there
 * is no background timer. The check-and-decrement runs under a per-bucket
 * mutex held only for a few arithmetic operations.
 *
 * A rate <= 0 makes the bucket unlimited.
 */
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(double rate_per_second, double capacity);

    TokenBucket(const TokenBucket&) = delete;
    TokenBucket& operator=(const TokenBucket&) = delete;

    /**
     * Try to take tokens now
     */
    AcquireAttempt try_acquire(double tokens = 1.0);

    /**
     * Try to take tokens at an explicit time point (monotonic)
     */
    AcquireAttempt try_acquire_at(Clock::time_point now, double tokens = 1.0);

    /**
     * Return tokens that were taken but never used, capped at capacity
     */
    void refund(double tokens);

    /**
     * Tokens available now (refill applied to the view, not stored)
     */
    double available_tokens() const;
    double available_tokens_at(Clock::time_point now) const;

    /**
     * Refill to full capacity
     */
    void reset();

    double capacity() const { return capacity_; }
    double rate() const { return rate_; }
    bool unlimited() const { return rate_ <= 0.0; }

private:
    double refilled(Clock::time_point now) const;

    const double rate_;
    const double capacity_;

    mutable std::mutex mutex_;
    double tokens_;
    Clock::time_point last_refill_;
};

} // namespace tollgate::limiter

#endif // TOLLGATE_LIMITER_TOKEN_BUCKET_HPP
