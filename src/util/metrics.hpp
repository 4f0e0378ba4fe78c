/**
 * TOLLGATE - Resilient LLM Provider Client
 * Metrics - Thread-safe per-provider usage counters
 *
 * Provides:
 * - Call counters (total, active, success, failures by kind)
 * - Cache hit/miss counts as seen by the client
 * - Reported and estimated token usage, estimated cost
 * - Latency (average and maximum)
 */

#ifndef TOLLGATE_UTIL_METRICS_HPP
#define TOLLGATE_UTIL_METRICS_HPP

#include "core/errors.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace tollgate::util {

/**
 * Point-in-time copy of a provider's counters
 */
struct MetricsSnapshot {
    std::uint64_t calls_total{0};
    std::uint64_t calls_active{0};
    std::uint64_t calls_success{0};
    std::uint64_t calls_failed{0};
    std::array<std::uint64_t, core::kFailureKindCount> failures_by_kind{};

    std::uint64_t cache_hits{0};
    std::uint64_t cache_misses{0};
    std::uint64_t network_calls{0};

    std::uint64_t prompt_tokens{0};
    std::uint64_t completion_tokens{0};
    std::uint64_t estimated_prompt_tokens{0};
    double estimated_cost{0.0};

    double latency_avg_ms{0.0};
    std::uint64_t latency_max_ms{0};

    double cache_hit_rate() const;
    double error_rate() const;
};

/**
 * Counters for one provider
 *
 * Lock-free; every counter is a relaxed atomic. Snapshots are not atomic
 * across counters and are meant for reporting only.
 */
class ProviderMetrics {
public:
    ProviderMetrics() = default;

    ProviderMetrics(const ProviderMetrics&) = delete;
    ProviderMetrics& operator=(const ProviderMetrics&) = delete;

    void call_started();

    void cache_hit();
    void cache_miss();
    void network_call();

    /**
     * Record a successful call and its token usage
     */
    void call_succeeded(std::chrono::milliseconds latency,
                        std::uint32_t prompt_tokens,
                        std::uint32_t completion_tokens,
                        std::uint32_t estimated_prompt_tokens,
                        double estimated_cost);

    void call_failed(core::FailureKind kind, std::chrono::milliseconds latency);

    MetricsSnapshot snapshot() const;

private:
    void record_latency(std::chrono::milliseconds latency);

    std::atomic<std::uint64_t> calls_total_{0};
    std::atomic<std::uint64_t> calls_active_{0};
    std::atomic<std::uint64_t> calls_success_{0};
    std::atomic<std::uint64_t> calls_failed_{0};
    std::array<std::atomic<std::uint64_t>, core::kFailureKindCount> failures_by_kind_{};

    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};
    std::atomic<std::uint64_t> network_calls_{0};

    std::atomic<std::uint64_t> prompt_tokens_{0};
    std::atomic<std::uint64_t> completion_tokens_{0};
    std::atomic<std::uint64_t> estimated_prompt_tokens_{0};
    std::atomic<std::uint64_t> cost_micros_{0};   // Millionths of a dollar

    std::atomic<std::uint64_t> latency_sum_ms_{0};
    std::atomic<std::uint64_t> latency_count_{0};
    std::atomic<std::uint64_t> latency_max_ms_{0};
};

void to_json(nlohmann::json& j, const MetricsSnapshot& snapshot);

} // namespace tollgate::util

#endif // TOLLGATE_UTIL_METRICS_HPP
