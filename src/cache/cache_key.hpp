/**
 * TOLLGATE - Resilient LLM Provider Client
 * Cache Key - XXH3-based request fingerprints
 *
 * A fingerprint covers everything that affects the model's output:
 * - Provider key and model
 * - Ordered messages (role + content)
 * - Sampling parameters (temperature, top_p, top_k, max_tokens, seed, stop, stream)
 *
 * Request id and deadline are excluded. The digest is computed over a
 * canonical JSON rendering (sorted keys), so it is stable across restarts.
 */

#ifndef TOLLGATE_CACHE_CACHE_KEY_HPP
#define TOLLGATE_CACHE_CACHE_KEY_HPP

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace tollgate::cache {

/**
 * Request fingerprint - 128-bit digest of normalized request content
 */
struct CacheKey {
    std::uint64_t high{0};
    std::uint64_t low{0};

    bool operator==(const CacheKey& other) const = default;

    bool operator<(const CacheKey& other) const {
        return high != other.high ? high < other.high : low < other.low;
    }

    /**
     * Convert to a 32-character hex string for logging/debugging
     */
    std::string to_string() const;
};

/**
 * Hash functor for use with std::unordered_map
 */
struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const noexcept {
        return static_cast<std::size_t>(key.low ^ (key.high * 0x9E3779B97F4A7C15ULL));
    }
};

/**
 * Canonical JSON rendering of the output-affecting fields of a request
 */
std::string canonical_request(const core::CompletionRequest& request);

/**
 * Fingerprint a request
 */
CacheKey generate_cache_key(const core::CompletionRequest& request);

/**
 * Fingerprint arbitrary canonical content
 */
CacheKey generate_cache_key(std::string_view canonical);

} // namespace tollgate::cache

#endif // TOLLGATE_CACHE_CACHE_KEY_HPP
