/**
 * TOLLGATE - Resilient LLM Provider Client
 * Cache Policy - Decides whether and for how long a response is cached
 */

#ifndef TOLLGATE_CACHE_CACHE_POLICY_HPP
#define TOLLGATE_CACHE_CACHE_POLICY_HPP

#include "config/config.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::cache {

/**
 * Caching mode
 */
enum class CacheMode {
    Aggressive,     // Cache every successful response; streaming gets the short TTL
    Conservative,   // Only clearly deterministic requests
    Selective,      // Allow-listed models or low-temperature requests
    Disabled
};

std::string_view to_string(CacheMode mode);
std::optional<CacheMode> parse_cache_mode(std::string_view str);

/**
 * Policy parameters
 */
struct CachePolicyConfig {
    CacheMode mode{CacheMode::Selective};
    std::chrono::seconds default_ttl{300};
    std::chrono::seconds min_ttl{30};
    std::chrono::seconds max_ttl{3600};
    std::vector<std::string> cacheable_models;   // Selective allow-list (prefix match)

    double deterministic_temperature{0.1};   // Conservative threshold
    double selective_temperature{0.3};       // Selective threshold
};

CachePolicyConfig make_policy_config(const config::ProviderSettings& settings);

/**
 * Cache policy for one provider
 */
class CachePolicy {
public:
    explicit CachePolicy(CachePolicyConfig config = {});

    /**
     * Whether lookups happen at all
     */
    bool enabled() const { return config_.mode != CacheMode::Disabled; }

    /**
     * Whether a request's response may be looked up / stored
     */
    bool is_cacheable(const core::CompletionRequest& request) const;

    /**
     * TTL for a request's response, clamped to [min_ttl, max_ttl]
     */
    std::chrono::seconds ttl_for(const core::CompletionRequest& request) const;

    CacheMode mode() const { return config_.mode; }
    const CachePolicyConfig& config() const { return config_; }

private:
    bool model_allowed(std::string_view model) const;

    CachePolicyConfig config_;
};

} // namespace tollgate::cache

#endif // TOLLGATE_CACHE_CACHE_POLICY_HPP
