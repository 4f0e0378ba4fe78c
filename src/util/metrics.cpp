/**
 * TOLLGATE - Resilient LLM Provider Client
 * Metrics Implementation
 */

#include "util/metrics.hpp"

#include <cmath>

namespace tollgate::util {

double MetricsSnapshot::cache_hit_rate() const {
    auto total = cache_hits + cache_misses;
    return total > 0 ? static_cast<double>(cache_hits) / total : 0.0;
}

double MetricsSnapshot::error_rate() const {
    auto finished = calls_success + calls_failed;
    return finished > 0 ? static_cast<double>(calls_failed) / finished : 0.0;
}

void ProviderMetrics::call_started() {
    calls_total_.fetch_add(1, std::memory_order_relaxed);
    calls_active_.fetch_add(1, std::memory_order_relaxed);
}

void ProviderMetrics::cache_hit() {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
}

void ProviderMetrics::cache_miss() {
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
}

void ProviderMetrics::network_call() {
    network_calls_.fetch_add(1, std::memory_order_relaxed);
}

void ProviderMetrics::call_succeeded(std::chrono::milliseconds latency,
                                     std::uint32_t prompt_tokens,
                                     std::uint32_t completion_tokens,
                                     std::uint32_t estimated_prompt_tokens,
                                     double estimated_cost) {
    calls_active_.fetch_sub(1, std::memory_order_relaxed);
    calls_success_.fetch_add(1, std::memory_order_relaxed);

    prompt_tokens_.fetch_add(prompt_tokens, std::memory_order_relaxed);
    completion_tokens_.fetch_add(completion_tokens, std::memory_order_relaxed);
    estimated_prompt_tokens_.fetch_add(estimated_prompt_tokens, std::memory_order_relaxed);
    if (estimated_cost > 0.0) {
        cost_micros_.fetch_add(static_cast<std::uint64_t>(std::llround(estimated_cost * 1e6)),
                               std::memory_order_relaxed);
    }

    record_latency(latency);
}

void ProviderMetrics::call_failed(core::FailureKind kind, std::chrono::milliseconds latency) {
    calls_active_.fetch_sub(1, std::memory_order_relaxed);
    calls_failed_.fetch_add(1, std::memory_order_relaxed);
    failures_by_kind_[static_cast<std::size_t>(kind)].fetch_add(1, std::memory_order_relaxed);

    record_latency(latency);
}

void ProviderMetrics::record_latency(std::chrono::milliseconds latency) {
    auto ms = static_cast<std::uint64_t>(latency.count() > 0 ? latency.count() : 0);
    latency_sum_ms_.fetch_add(ms, std::memory_order_relaxed);
    latency_count_.fetch_add(1, std::memory_order_relaxed);

    auto current = latency_max_ms_.load(std::memory_order_relaxed);
    while (ms > current &&
           !latency_max_ms_.compare_exchange_weak(current, ms, std::memory_order_relaxed)) {
    }
}

MetricsSnapshot ProviderMetrics::snapshot() const {
    MetricsSnapshot snap;

    snap.calls_total = calls_total_.load(std::memory_order_relaxed);
    snap.calls_active = calls_active_.load(std::memory_order_relaxed);
    snap.calls_success = calls_success_.load(std::memory_order_relaxed);
    snap.calls_failed = calls_failed_.load(std::memory_order_relaxed);
    for (std::size_t i = 0; i < failures_by_kind_.size(); ++i) {
        snap.failures_by_kind[i] = failures_by_kind_[i].load(std::memory_order_relaxed);
    }

    snap.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    snap.cache_misses = cache_misses_.load(std::memory_order_relaxed);
    snap.network_calls = network_calls_.load(std::memory_order_relaxed);

    snap.prompt_tokens = prompt_tokens_.load(std::memory_order_relaxed);
    snap.completion_tokens = completion_tokens_.load(std::memory_order_relaxed);
    snap.estimated_prompt_tokens = estimated_prompt_tokens_.load(std::memory_order_relaxed);
    snap.estimated_cost = static_cast<double>(cost_micros_.load(std::memory_order_relaxed)) / 1e6;

    auto count = latency_count_.load(std::memory_order_relaxed);
    snap.latency_avg_ms = count > 0
        ? static_cast<double>(latency_sum_ms_.load(std::memory_order_relaxed)) / count
        : 0.0;
    snap.latency_max_ms = latency_max_ms_.load(std::memory_order_relaxed);

    return snap;
}

void to_json(nlohmann::json& j, const MetricsSnapshot& s) {
    nlohmann::json by_kind = nlohmann::json::object();
    for (std::size_t i = 0; i < s.failures_by_kind.size(); ++i) {
        if (s.failures_by_kind[i] > 0) {
            by_kind[std::string(core::to_string(static_cast<core::FailureKind>(i)))] =
                s.failures_by_kind[i];
        }
    }

    j = nlohmann::json{
        {"calls", {
            {"total", s.calls_total},
            {"active", s.calls_active},
            {"success", s.calls_success},
            {"failed", s.calls_failed},
            {"failures_by_kind", by_kind},
            {"error_rate", s.error_rate()}
        }},
        {"cache", {
            {"hits", s.cache_hits},
            {"misses", s.cache_misses},
            {"hit_rate", s.cache_hit_rate()}
        }},
        {"network_calls", s.network_calls},
        {"tokens", {
            {"prompt", s.prompt_tokens},
            {"completion", s.completion_tokens},
            {"estimated_prompt", s.estimated_prompt_tokens}
        }},
        {"estimated_cost", s.estimated_cost},
        {"latency", {
            {"avg_ms", s.latency_avg_ms},
            {"max_ms", s.latency_max_ms}
        }}
    };
}

} // namespace tollgate::util
