/**
 * TOLLGATE - Resilient LLM Provider Client
 * Token Counter - Per-provider request size and cost estimation
 *
 * Stateless: a TokenCounter holds only the calibration for one provider and
 * every estimate is a pure function of its inputs.
 */

#ifndef TOLLGATE_TOKENS_TOKEN_COUNTER_HPP
#define TOLLGATE_TOKENS_TOKEN_COUNTER_HPP

#include "config/config.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::tokens {

/**
 * Calibration for one provider family
 */
struct TokenProfile {
    double chars_per_token{4.0};
    std::uint32_t message_overhead{4};       // Role markers and separators per message
    std::uint32_t system_overhead{0};        // Extra tokens for each system message
    std::uint32_t reply_overhead{3};         // Priming for the assistant reply
    double non_ascii_weight{0.0};            // Extra tokens per non-ASCII byte
    std::uint32_t citation_overhead{0};      // Extra tokens per [n] citation marker
    std::uint32_t default_context_window{4096};
};

/**
 * Per-1k-token prices in USD
 */
struct ModelPrice {
    double input_per_1k{0.0};
    double output_per_1k{0.0};

    double blended() const { return (input_per_1k + output_per_1k) / 2.0; }
};

/**
 * Result of an estimate
 */
struct TokenEstimate {
    std::uint32_t token_count{0};
    double estimated_cost{0.0};
    std::uint32_t context_window{0};
    bool exceeds_context{false};
};

/**
 * Built-in calibration for a provider kind
 */
TokenProfile default_profile(config::ProviderKind kind);

/**
 * Token counter for one provider
 */
class TokenCounter {
public:
    /**
     * Build from provider settings. chars_per_token, price_per_1k_tokens and
     * context_window override the built-in tables when set.
     */
    explicit TokenCounter(const config::ProviderSettings& settings);

    TokenCounter(config::ProviderKind kind, TokenProfile profile);

    /**
     * Estimate the prompt size and cost of a message list
     */
    TokenEstimate estimate(const std::vector<core::Message>& messages,
                           std::string_view model) const;

    /**
     * Estimate tokens in a single text (e.g. a response body)
     */
    std::uint32_t estimate_text(std::string_view text, std::string_view model) const;

    /**
     * Cost of a call with split input/output pricing
     */
    double estimate_cost(std::uint32_t input_tokens, std::uint32_t output_tokens,
                         std::string_view model) const;

    /**
     * Context window ceiling for a model
     */
    std::uint32_t context_window(std::string_view model) const;

    /**
     * Price for a model (override when configured)
     */
    ModelPrice price(std::string_view model) const;

    const TokenProfile& profile() const { return profile_; }
    config::ProviderKind kind() const { return kind_; }

private:
    double chars_per_token_for(std::string_view model) const;

    config::ProviderKind kind_;
    TokenProfile profile_;
    std::optional<double> price_override_;
    std::uint32_t context_override_{0};
    bool chars_overridden_{false};
};

} // namespace tollgate::tokens

#endif // TOLLGATE_TOKENS_TOKEN_COUNTER_HPP
