/**
 * TOLLGATE - Resilient LLM Provider Client
 * Core Types - Request/response contract shared by every component
 */

#ifndef TOLLGATE_CORE_TYPES_HPP
#define TOLLGATE_CORE_TYPES_HPP

#include "core/errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tollgate::core {

/**
 * Identifies one configured upstream target (provider + base URL).
 * Created from configuration at startup and never mutated.
 */
using ProviderKey = std::string;

using Clock = std::chrono::steady_clock;

/**
 * A single chat message
 */
struct Message {
    std::string role;     // system, user, assistant, tool
    std::string content;

    bool operator==(const Message&) const = default;
};

/**
 * Sampling parameters that affect model output
 */
struct SamplingParams {
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<std::int32_t> top_k;
    std::optional<std::uint32_t> max_tokens;
    std::optional<std::int64_t> seed;
    std::vector<std::string> stop;
    bool stream{false};

    bool operator==(const SamplingParams&) const = default;
};

/**
 * One logical completion call
 */
struct CompletionRequest {
    ProviderKey provider;
    std::string model;
    std::vector<Message> messages;
    SamplingParams sampling;

    std::string request_id;                       // Generated when empty
    std::optional<Clock::time_point> deadline;    // End-to-end; provider default when unset
};

/**
 * Result of a completion call
 */
struct CompletionResult {
    ProviderKey provider;
    std::string model;
    std::string content;
    std::string finish_reason;

    // Usage as reported by the provider (0 when not reported)
    std::uint32_t prompt_tokens{0};
    std::uint32_t completion_tokens{0};

    // Local estimate for the request
    std::uint32_t estimated_prompt_tokens{0};
    double estimated_cost{0.0};

    bool from_cache{false};
};

/**
 * Outcome of ResilientClient::complete - exactly one of result/failure is set
 */
struct CallResult {
    std::optional<CompletionResult> result;
    std::optional<Failure> failure;
    std::chrono::milliseconds latency{0};

    bool ok() const { return result.has_value(); }

    static CallResult success(CompletionResult value, std::chrono::milliseconds latency = {}) {
        CallResult r;
        r.result = std::move(value);
        r.latency = latency;
        return r;
    }

    static CallResult fail(Failure failure, std::chrono::milliseconds latency = {}) {
        CallResult r;
        r.failure = std::move(failure);
        r.latency = latency;
        return r;
    }
};

// JSON serialization support
void to_json(nlohmann::json& j, const Message& m);
void from_json(const nlohmann::json& j, Message& m);
void to_json(nlohmann::json& j, const CompletionResult& r);
void from_json(const nlohmann::json& j, CompletionResult& r);

} // namespace tollgate::core

#endif // TOLLGATE_CORE_TYPES_HPP
