/**
 * TOLLGATE - Resilient LLM Provider Client
 * Circuit Breaker - Per-provider failure isolation
 *
 * States:
 * - Closed:   calls pass; consecutive counted failures trip the breaker
 * - Open:     calls rejected without a network attempt until recovery_timeout
 * - HalfOpen: a bounded number of trial calls decide between Closed and Open
 *
 * Only UpstreamError and Timeout outcomes count as failures. Other outcomes
 * release the caller's trial slot without moving the state machine.
 */

#ifndef TOLLGATE_BREAKER_CIRCUIT_BREAKER_HPP
#define TOLLGATE_BREAKER_CIRCUIT_BREAKER_HPP

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tollgate::breaker {

/**
 * Breaker state
 */
enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

std::string_view to_string(CircuitState state);

/**
 * Breaker thresholds
 */
struct CircuitBreakerConfig {
    std::uint32_t failure_threshold{5};               // Consecutive failures to open
    std::uint32_t success_threshold{2};               // Trial successes to close
    std::chrono::milliseconds recovery_timeout{30000}; // Open -> HalfOpen delay
    std::uint32_t half_open_max_calls{0};             // 0 = success_threshold
    std::chrono::milliseconds failure_reset_timeout{300000}; // Quiet period that forgets Closed failures, 0 = never
};

/**
 * Emitted on every state transition
 */
struct StateChangeEvent {
    std::string breaker_name;
    CircuitState from;
    CircuitState to;
    std::chrono::steady_clock::time_point at;
    std::chrono::system_clock::time_point wall_time;
};

/**
 * Read-only snapshot
 */
struct CircuitBreakerStats {
    CircuitState state{CircuitState::Closed};
    std::uint32_t consecutive_failures{0};
    std::uint32_t consecutive_successes{0};
    std::uint32_t half_open_in_flight{0};

    std::uint64_t admitted{0};
    std::uint64_t rejected{0};
    std::uint64_t successes{0};
    std::uint64_t failures{0};
    std::uint64_t ignored{0};       // Outcomes not attributable to the provider

    std::uint64_t transitions_to_open{0};
    std::uint64_t transitions_to_half_open{0};
    std::uint64_t transitions_to_closed{0};

    std::chrono::milliseconds time_in_state{0};
    std::vector<StateChangeEvent> history;  // Oldest first
};

/**
 * Callback type for state change notifications
 */
using StateChangeCallback = std::function<void(const StateChangeEvent&)>;

/**
 * Circuit breaker for one provider
 *
 * Every transition happens under a per-breaker mutex held for a few field
 * updates; callbacks run after the mutex is released.
 *
 * The *_at variants take an explicit steady-clock time so transitions can be
 * driven deterministically.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t kMaxHistory = 100;

    explicit CircuitBreaker(std::string name, const CircuitBreakerConfig& config = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * Check whether a call may proceed.
     * In Open, the first call after recovery_timeout moves the breaker to
     * HalfOpen and is admitted as a trial.
     */
    bool allow_request();
    bool allow_request_at(Clock::time_point now);

    /**
     * Record a successful call
     */
    void record_success();
    void record_success_at(Clock::time_point now);

    /**
     * Record a failed call. Kinds that do not count against the breaker
     * behave like release().
     */
    void record_failure(core::FailureKind kind);
    void record_failure_at(Clock::time_point now, core::FailureKind kind);

    /**
     * Give back an admission whose outcome says nothing about provider health
     */
    void release();

    CircuitState state() const;
    CircuitBreakerStats stats() const;
    std::vector<StateChangeEvent> recent_events() const;

    void set_on_state_change(StateChangeCallback callback);

    /**
     * Manual overrides
     */
    void force_open();
    void force_close();
    void force_half_open();
    void reset();

    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }

private:
    std::uint32_t trial_limit() const;

    // Must be called with mutex_ held; returns the event to publish
    StateChangeEvent transition(CircuitState to, Clock::time_point now);

    void publish(const std::vector<StateChangeEvent>& events);

    std::string name_;
    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::uint32_t consecutive_failures_{0};
    std::uint32_t consecutive_successes_{0};
    std::uint32_t half_open_in_flight_{0};
    Clock::time_point transitioned_at_;
    Clock::time_point last_failure_at_;

    std::uint64_t admitted_{0};
    std::uint64_t rejected_{0};
    std::uint64_t successes_{0};
    std::uint64_t failures_{0};
    std::uint64_t ignored_{0};
    std::uint64_t to_open_{0};
    std::uint64_t to_half_open_{0};
    std::uint64_t to_closed_{0};

    std::deque<StateChangeEvent> history_;
    StateChangeCallback on_state_change_;
};

/**
 * Keyed registry of breakers, built once at startup
 */
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry() = default;

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    /**
     * Register a provider's breaker (startup only)
     * @throws std::invalid_argument if the key is already registered
     */
    CircuitBreaker& add(const core::ProviderKey& key, const CircuitBreakerConfig& config);

    /**
     * @throws std::out_of_range for an unknown key
     */
    CircuitBreaker& get(const core::ProviderKey& key) const;

    bool contains(const core::ProviderKey& key) const;

    /**
     * Install the same callback on every registered breaker
     */
    void set_on_state_change(const StateChangeCallback& callback);

    /**
     * Operator overrides applied to every registered breaker
     */
    void force_open_all();
    void force_close_all();
    void reset_all();

    std::vector<std::pair<core::ProviderKey, CircuitBreakerStats>> all_stats() const;

    std::size_t size() const { return breakers_.size(); }

private:
    std::unordered_map<core::ProviderKey, std::unique_ptr<CircuitBreaker>> breakers_;
};

} // namespace tollgate::breaker

#endif // TOLLGATE_BREAKER_CIRCUIT_BREAKER_HPP
