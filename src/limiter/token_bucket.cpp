/**
 * TOLLGATE - Resilient LLM Provider Client
 * Token Bucket Implementation
 */

#include "limiter/token_bucket.hpp"

#include <algorithm>
#include <cmath>

namespace tollgate::limiter {

TokenBucket::TokenBucket(double rate_per_second, double capacity)
    : rate_(rate_per_second)
    , capacity_(std::max(capacity, 0.0))
    , tokens_(std::max(capacity, 0.0))
    , last_refill_(Clock::now())
{
}

AcquireAttempt TokenBucket::try_acquire(double tokens) {
    return try_acquire_at(Clock::now(), tokens);
}

AcquireAttempt TokenBucket::try_acquire_at(Clock::time_point now, double tokens) {
    AcquireAttempt attempt;

    if (unlimited()) {
        attempt.admitted = true;
        return attempt;
    }

    if (tokens > capacity_) {
        attempt.satisfiable = false;
        return attempt;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    tokens_ = refilled(now);
    // Never move the refill point backwards when callers pass stale timestamps
    last_refill_ = std::max(last_refill_, now);

    if (tokens_ >= tokens) {
        tokens_ -= tokens;
        attempt.admitted = true;
        return attempt;
    }

    const double deficit = tokens - tokens_;
    attempt.retry_after = std::chrono::nanoseconds(
        static_cast<std::chrono::nanoseconds::rep>(std::ceil(deficit / rate_ * 1e9)));
    return attempt;
}

void TokenBucket::refund(double tokens) {
    if (unlimited() || tokens <= 0.0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = std::min(capacity_, tokens_ + tokens);
}

double TokenBucket::available_tokens() const {
    return available_tokens_at(Clock::now());
}

double TokenBucket::available_tokens_at(Clock::time_point now) const {
    if (unlimited()) {
        return capacity_;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return refilled(now);
}

void TokenBucket::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = capacity_;
    last_refill_ = Clock::now();
}

double TokenBucket::refilled(Clock::time_point now) const {
    if (now <= last_refill_) {
        return tokens_;
    }
    const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    return std::min(capacity_, tokens_ + elapsed * rate_);
}

} // namespace tollgate::limiter
