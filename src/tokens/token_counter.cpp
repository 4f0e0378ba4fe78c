/**
 * TOLLGATE - Resilient LLM Provider Client
 * Token Counter Implementation
 */

#include "tokens/token_counter.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tollgate::tokens {

namespace {

struct ContextEntry {
    std::string_view prefix;
    std::uint32_t window;
};

struct PriceEntry {
    std::string_view prefix;
    ModelPrice price;
};

struct RatioEntry {
    std::string_view prefix;
    double chars_per_token;
};

constexpr ContextEntry kContextWindows[] = {
    {"gpt-4o", 128000},
    {"gpt-4-turbo", 128000},
    {"gpt-4-32k", 32768},
    {"gpt-4", 8192},
    {"gpt-3.5-turbo", 16385},
    {"o1", 128000},
    {"claude", 200000},
    {"gemini-1.5", 1048576},
    {"gemini-2", 1048576},
    {"gemini", 32768},
    {"sonar", 127072},
    {"llama3.1", 131072},
    {"llama3", 8192},
    {"llama2", 4096},
    {"mistral", 32768},
    {"mixtral", 32768},
    {"codellama", 16384},
    {"vicuna", 4096},
};

constexpr PriceEntry kPrices[] = {
    {"gpt-4o-mini", {0.00015, 0.0006}},
    {"gpt-4o", {0.005, 0.015}},
    {"gpt-4-turbo", {0.01, 0.03}},
    {"gpt-4", {0.03, 0.06}},
    {"gpt-3.5-turbo", {0.001, 0.002}},
    {"claude", {0.015, 0.075}},
    {"gemini", {0.001, 0.002}},
    {"sonar", {0.001, 0.001}},
};

// Local model families tokenize differently enough to matter
constexpr RatioEntry kOllamaRatios[] = {
    {"codellama", 4.0},
    {"llama", 3.57},
    {"mistral", 3.85},
    {"vicuna", 3.7},
};

template <typename Entry, std::size_t N>
const Entry* longest_prefix(const Entry (&table)[N], std::string_view model) {
    const Entry* best = nullptr;
    for (const auto& entry : table) {
        if (model.starts_with(entry.prefix) &&
            (!best || entry.prefix.size() > best->prefix.size())) {
            best = &entry;
        }
    }
    return best;
}

ModelPrice provider_price(config::ProviderKind kind) {
    switch (kind) {
        case config::ProviderKind::OpenAi:     return {0.001, 0.002};
        case config::ProviderKind::Anthropic:  return {0.015, 0.075};
        case config::ProviderKind::Gemini:     return {0.001, 0.002};
        case config::ProviderKind::Perplexity: return {0.001, 0.001};
        default:                               return {0.0, 0.0};
    }
}

std::size_t count_non_ascii(std::string_view text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(),
        [](char c) { return static_cast<unsigned char>(c) >= 0x80; }));
}

// Counts "[n]" markers where n is one or more digits
std::size_t count_citations(std::string_view text) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '[') continue;
        std::size_t j = i + 1;
        while (j < text.size() && text[j] >= '0' && text[j] <= '9') ++j;
        if (j > i + 1 && j < text.size() && text[j] == ']') {
            ++count;
            i = j;
        }
    }
    return count;
}

} // namespace

TokenProfile default_profile(config::ProviderKind kind) {
    TokenProfile p;
    switch (kind) {
        case config::ProviderKind::OpenAi:
            p.chars_per_token = 4.0;
            p.message_overhead = 4;
            p.system_overhead = 10;
            p.reply_overhead = 3;
            p.default_context_window = 8192;
            break;
        case config::ProviderKind::Anthropic:
            p.chars_per_token = 3.5;
            p.message_overhead = 4;
            p.system_overhead = 6;
            p.reply_overhead = 3;
            p.default_context_window = 200000;
            break;
        case config::ProviderKind::Gemini:
            p.chars_per_token = 4.5;
            p.message_overhead = 5;
            p.system_overhead = 8;
            p.reply_overhead = 0;
            p.non_ascii_weight = 0.1;
            p.default_context_window = 32768;
            break;
        case config::ProviderKind::Perplexity:
            p.chars_per_token = 3.85;
            p.message_overhead = 4;
            p.system_overhead = 4;
            p.reply_overhead = 3;
            p.citation_overhead = 2;
            p.default_context_window = 127072;
            break;
        case config::ProviderKind::Ollama:
            p.chars_per_token = 3.7;
            p.message_overhead = 3;
            p.system_overhead = 0;
            p.reply_overhead = 0;
            p.default_context_window = 4096;
            break;
        case config::ProviderKind::OpenAiCompatible:
        default:
            p.chars_per_token = 4.0;
            p.message_overhead = 4;
            p.system_overhead = 4;
            p.reply_overhead = 3;
            p.default_context_window = 4096;
            break;
    }
    return p;
}

TokenCounter::TokenCounter(const config::ProviderSettings& settings)
    : kind_(settings.kind)
    , profile_(default_profile(settings.kind))
    , price_override_(settings.price_per_1k_tokens)
    , context_override_(settings.context_window)
{
    if (settings.chars_per_token > 0.0) {
        profile_.chars_per_token = settings.chars_per_token;
        chars_overridden_ = true;
    }
}

TokenCounter::TokenCounter(config::ProviderKind kind, TokenProfile profile)
    : kind_(kind)
    , profile_(std::move(profile))
{
}

TokenEstimate TokenCounter::estimate(const std::vector<core::Message>& messages,
                                     std::string_view model) const {
    double content_tokens = 0.0;
    std::uint32_t overhead = 0;

    for (const auto& message : messages) {
        content_tokens += static_cast<double>(estimate_text(message.content, model));
        overhead += profile_.message_overhead;
        if (message.role == "system") {
            overhead += profile_.system_overhead;
        }
    }
    if (!messages.empty()) {
        overhead += profile_.reply_overhead;
    }

    TokenEstimate result;
    result.token_count = static_cast<std::uint32_t>(content_tokens) + overhead;
    result.estimated_cost = static_cast<double>(result.token_count) / 1000.0 * price(model).blended();
    result.context_window = context_window(model);
    result.exceeds_context = result.token_count > result.context_window;
    return result;
}

std::uint32_t TokenCounter::estimate_text(std::string_view text, std::string_view model) const {
    if (text.empty()) {
        return 0;
    }

    double tokens = static_cast<double>(text.size()) / chars_per_token_for(model);
    if (profile_.non_ascii_weight > 0.0) {
        tokens += static_cast<double>(count_non_ascii(text)) * profile_.non_ascii_weight;
    }
    if (profile_.citation_overhead > 0) {
        tokens += static_cast<double>(count_citations(text) * profile_.citation_overhead);
    }
    return static_cast<std::uint32_t>(std::ceil(tokens));
}

double TokenCounter::estimate_cost(std::uint32_t input_tokens, std::uint32_t output_tokens,
                                   std::string_view model) const {
    auto p = price(model);
    return static_cast<double>(input_tokens) / 1000.0 * p.input_per_1k +
           static_cast<double>(output_tokens) / 1000.0 * p.output_per_1k;
}

std::uint32_t TokenCounter::context_window(std::string_view model) const {
    if (context_override_ > 0) {
        return context_override_;
    }
    if (const auto* entry = longest_prefix(kContextWindows, model)) {
        return entry->window;
    }
    return profile_.default_context_window;
}

ModelPrice TokenCounter::price(std::string_view model) const {
    if (price_override_) {
        return ModelPrice{*price_override_, *price_override_};
    }
    if (kind_ == config::ProviderKind::Ollama) {
        return ModelPrice{};
    }
    if (const auto* entry = longest_prefix(kPrices, model)) {
        return entry->price;
    }
    return provider_price(kind_);
}

double TokenCounter::chars_per_token_for(std::string_view model) const {
    if (!chars_overridden_ && kind_ == config::ProviderKind::Ollama) {
        if (const auto* entry = longest_prefix(kOllamaRatios, model)) {
            return entry->chars_per_token;
        }
    }
    return profile_.chars_per_token;
}

} // namespace tollgate::tokens
