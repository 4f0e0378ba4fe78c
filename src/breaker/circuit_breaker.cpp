/**
 * TOLLGATE - Resilient LLM Provider Client
 * Circuit Breaker Implementation
 */

#include "breaker/circuit_breaker.hpp"
#include "util/logger.hpp"

#include <stdexcept>
#include <utility>

namespace tollgate::breaker {

using util::log_component::Breaker;

std::string_view to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half_open";
        default:                     return "unknown";
    }
}

// ============================================================================
// CircuitBreaker Implementation
// ============================================================================

CircuitBreaker::CircuitBreaker(std::string name, const CircuitBreakerConfig& config)
    : name_(std::move(name))
    , config_(config)
    , transitioned_at_(Clock::now())
{
}

bool CircuitBreaker::allow_request() {
    return allow_request_at(Clock::now());
}

bool CircuitBreaker::allow_request_at(Clock::time_point now) {
    std::vector<StateChangeEvent> events;
    bool allowed = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        switch (state_) {
            case CircuitState::Closed:
                allowed = true;
                break;

            case CircuitState::Open:
                if (now - transitioned_at_ >= config_.recovery_timeout) {
                    events.push_back(transition(CircuitState::HalfOpen, now));
                    ++half_open_in_flight_;
                    allowed = true;
                }
                break;

            case CircuitState::HalfOpen:
                if (half_open_in_flight_ < trial_limit()) {
                    ++half_open_in_flight_;
                    allowed = true;
                }
                break;
        }

        if (allowed) {
            ++admitted_;
        } else {
            ++rejected_;
        }
    }

    publish(events);
    return allowed;
}

void CircuitBreaker::record_success() {
    record_success_at(Clock::now());
}

void CircuitBreaker::record_success_at(Clock::time_point now) {
    std::vector<StateChangeEvent> events;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++successes_;

        switch (state_) {
            case CircuitState::Closed:
                consecutive_failures_ = 0;
                break;

            case CircuitState::HalfOpen:
                if (half_open_in_flight_ > 0) {
                    --half_open_in_flight_;
                }
                if (++consecutive_successes_ >= config_.success_threshold) {
                    events.push_back(transition(CircuitState::Closed, now));
                }
                break;

            case CircuitState::Open:
                // Late result from a call admitted before the breaker tripped
                break;
        }
    }

    publish(events);
}

void CircuitBreaker::record_failure(core::FailureKind kind) {
    record_failure_at(Clock::now(), kind);
}

void CircuitBreaker::record_failure_at(Clock::time_point now, core::FailureKind kind) {
    if (!core::counts_against_breaker(kind)) {
        release();
        return;
    }

    std::vector<StateChangeEvent> events;
    std::uint32_t forgotten = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++failures_;

        switch (state_) {
            case CircuitState::Closed:
                if (consecutive_failures_ > 0 &&
                    config_.failure_reset_timeout > std::chrono::milliseconds::zero() &&
                    now - last_failure_at_ >= config_.failure_reset_timeout) {
                    forgotten = std::exchange(consecutive_failures_, 0);
                }
                if (++consecutive_failures_ >= config_.failure_threshold) {
                    events.push_back(transition(CircuitState::Open, now));
                }
                break;

            case CircuitState::HalfOpen:
                // Any trial failure reopens and restarts the recovery timer
                ++consecutive_failures_;
                events.push_back(transition(CircuitState::Open, now));
                break;

            case CircuitState::Open:
                break;
        }
        last_failure_at_ = now;
    }

    if (forgotten > 0) {
        TOLLGATE_LOG_DEBUG(Breaker, "{}: {} stale failure(s) forgotten", name_, forgotten);
    }
    publish(events);
}

void CircuitBreaker::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++ignored_;
    if (state_ == CircuitState::HalfOpen && half_open_in_flight_ > 0) {
        --half_open_in_flight_;
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CircuitBreakerStats stats;
    stats.state = state_;
    stats.consecutive_failures = consecutive_failures_;
    stats.consecutive_successes = consecutive_successes_;
    stats.half_open_in_flight = half_open_in_flight_;
    stats.admitted = admitted_;
    stats.rejected = rejected_;
    stats.successes = successes_;
    stats.failures = failures_;
    stats.ignored = ignored_;
    stats.transitions_to_open = to_open_;
    stats.transitions_to_half_open = to_half_open_;
    stats.transitions_to_closed = to_closed_;
    stats.time_in_state = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - transitioned_at_);
    stats.history.assign(history_.begin(), history_.end());
    return stats;
}

std::vector<StateChangeEvent> CircuitBreaker::recent_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {history_.begin(), history_.end()};
}

void CircuitBreaker::set_on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_state_change_ = std::move(callback);
}

void CircuitBreaker::force_open() {
    std::vector<StateChangeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::Open) {
            events.push_back(transition(CircuitState::Open, Clock::now()));
        }
    }
    publish(events);
}

void CircuitBreaker::force_close() {
    std::vector<StateChangeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::Closed) {
            events.push_back(transition(CircuitState::Closed, Clock::now()));
        }
    }
    publish(events);
}

void CircuitBreaker::force_half_open() {
    std::vector<StateChangeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::HalfOpen) {
            events.push_back(transition(CircuitState::HalfOpen, Clock::now()));
        }
    }
    publish(events);
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::Closed;
    consecutive_failures_ = 0;
    consecutive_successes_ = 0;
    half_open_in_flight_ = 0;
    transitioned_at_ = Clock::now();
    admitted_ = rejected_ = successes_ = failures_ = ignored_ = 0;
    to_open_ = to_half_open_ = to_closed_ = 0;
    history_.clear();
}

std::uint32_t CircuitBreaker::trial_limit() const {
    return config_.half_open_max_calls > 0 ? config_.half_open_max_calls
                                           : config_.success_threshold;
}

StateChangeEvent CircuitBreaker::transition(CircuitState to, Clock::time_point now) {
    StateChangeEvent event{
        .breaker_name = name_,
        .from = state_,
        .to = to,
        .at = now,
        .wall_time = std::chrono::system_clock::now()
    };

    state_ = to;
    transitioned_at_ = now;
    consecutive_successes_ = 0;
    half_open_in_flight_ = 0;

    switch (to) {
        case CircuitState::Open:
            ++to_open_;
            break;
        case CircuitState::HalfOpen:
            consecutive_failures_ = 0;
            ++to_half_open_;
            break;
        case CircuitState::Closed:
            consecutive_failures_ = 0;
            ++to_closed_;
            break;
    }

    history_.push_back(event);
    while (history_.size() > kMaxHistory) {
        history_.pop_front();
    }

    return event;
}

void CircuitBreaker::publish(const std::vector<StateChangeEvent>& events) {
    if (events.empty()) {
        return;
    }

    StateChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = on_state_change_;
    }

    for (const auto& event : events) {
        if (event.to == CircuitState::Open) {
            TOLLGATE_LOG_WARN(Breaker, "Circuit for {} opened ({} -> {})",
                              event.breaker_name, to_string(event.from), to_string(event.to));
        } else {
            TOLLGATE_LOG_INFO(Breaker, "Circuit for {} changed: {} -> {}",
                              event.breaker_name, to_string(event.from), to_string(event.to));
        }
        if (callback) {
            callback(event);
        }
    }
}

// ============================================================================
// CircuitBreakerRegistry Implementation
// ============================================================================

CircuitBreaker& CircuitBreakerRegistry::add(const core::ProviderKey& key,
                                            const CircuitBreakerConfig& config) {
    auto [it, inserted] = breakers_.try_emplace(key, nullptr);
    if (!inserted) {
        throw std::invalid_argument("Circuit breaker already registered for '" + key + "'");
    }
    it->second = std::make_unique<CircuitBreaker>(key, config);

    TOLLGATE_LOG_DEBUG(Breaker, "Breaker for {}: failure_threshold={}, success_threshold={}, recovery={}ms",
                       key, config.failure_threshold, config.success_threshold,
                       config.recovery_timeout.count());
    return *it->second;
}

CircuitBreaker& CircuitBreakerRegistry::get(const core::ProviderKey& key) const {
    auto it = breakers_.find(key);
    if (it == breakers_.end()) {
        throw std::out_of_range("Unknown provider for circuit breaker: " + key);
    }
    return *it->second;
}

bool CircuitBreakerRegistry::contains(const core::ProviderKey& key) const {
    return breakers_.find(key) != breakers_.end();
}

void CircuitBreakerRegistry::set_on_state_change(const StateChangeCallback& callback) {
    for (auto& [key, breaker] : breakers_) {
        breaker->set_on_state_change(callback);
    }
}

void CircuitBreakerRegistry::force_open_all() {
    TOLLGATE_LOG_WARN(Breaker, "Forcing {} circuit(s) open", breakers_.size());
    for (auto& [key, breaker] : breakers_) {
        breaker->force_open();
    }
}

void CircuitBreakerRegistry::force_close_all() {
    TOLLGATE_LOG_INFO(Breaker, "Forcing {} circuit(s) closed", breakers_.size());
    for (auto& [key, breaker] : breakers_) {
        breaker->force_close();
    }
}

void CircuitBreakerRegistry::reset_all() {
    for (auto& [key, breaker] : breakers_) {
        breaker->reset();
    }
}

std::vector<std::pair<core::ProviderKey, CircuitBreakerStats>>
CircuitBreakerRegistry::all_stats() const {
    std::vector<std::pair<core::ProviderKey, CircuitBreakerStats>> result;
    result.reserve(breakers_.size());
    for (const auto& [key, breaker] : breakers_) {
        result.emplace_back(key, breaker->stats());
    }
    return result;
}

} // namespace tollgate::breaker
