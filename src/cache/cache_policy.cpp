/**
 * TOLLGATE - Resilient LLM Provider Client
 * Cache Policy Implementation
 */

#include "cache/cache_policy.hpp"

#include <algorithm>

namespace tollgate::cache {

std::string_view to_string(CacheMode mode) {
    switch (mode) {
        case CacheMode::Aggressive:   return "aggressive";
        case CacheMode::Conservative: return "conservative";
        case CacheMode::Selective:    return "selective";
        case CacheMode::Disabled:     return "disabled";
        default:                      return "unknown";
    }
}

std::optional<CacheMode> parse_cache_mode(std::string_view str) {
    if (str == "aggressive") return CacheMode::Aggressive;
    if (str == "conservative") return CacheMode::Conservative;
    if (str == "selective") return CacheMode::Selective;
    if (str == "disabled" || str == "off") return CacheMode::Disabled;
    return std::nullopt;
}

CachePolicyConfig make_policy_config(const config::ProviderSettings& settings) {
    CachePolicyConfig cfg;
    cfg.mode = parse_cache_mode(settings.cache_mode).value_or(CacheMode::Disabled);
    cfg.default_ttl = std::chrono::seconds(settings.default_ttl_s);
    cfg.min_ttl = std::chrono::seconds(settings.min_ttl_s);
    cfg.max_ttl = std::chrono::seconds(settings.max_ttl_s);
    cfg.cacheable_models = settings.cacheable_models;
    return cfg;
}

CachePolicy::CachePolicy(CachePolicyConfig config)
    : config_(std::move(config)) {
}

bool CachePolicy::is_cacheable(const core::CompletionRequest& request) const {
    const auto& temperature = request.sampling.temperature;
    const bool streaming = request.sampling.stream;

    switch (config_.mode) {
        case CacheMode::Aggressive:
            return true;

        case CacheMode::Conservative:
            return !streaming && temperature &&
                   *temperature <= config_.deterministic_temperature;

        case CacheMode::Selective:
            if (streaming) {
                return false;
            }
            return model_allowed(request.model) ||
                   (temperature && *temperature <= config_.selective_temperature);

        case CacheMode::Disabled:
        default:
            return false;
    }
}

std::chrono::seconds CachePolicy::ttl_for(const core::CompletionRequest& request) const {
    using std::chrono::seconds;

    const auto& temperature = request.sampling.temperature;
    seconds ttl = config_.min_ttl;

    if (request.sampling.stream) {
        ttl = config_.min_ttl;
    } else if (temperature && *temperature <= 0.1) {
        ttl = config_.default_ttl * 2;
    } else if (temperature && *temperature <= 0.5) {
        ttl = seconds(config_.default_ttl.count() * 3 / 2);
    } else if (!temperature || model_allowed(request.model)) {
        ttl = config_.default_ttl;
    }

    return std::clamp(ttl, config_.min_ttl, config_.max_ttl);
}

bool CachePolicy::model_allowed(std::string_view model) const {
    return std::any_of(config_.cacheable_models.begin(), config_.cacheable_models.end(),
        [model](const std::string& prefix) {
            return !prefix.empty() && model.starts_with(prefix);
        });
}

} // namespace tollgate::cache
