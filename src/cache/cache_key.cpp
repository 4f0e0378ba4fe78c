/**
 * TOLLGATE - Resilient LLM Provider Client
 * Cache Key Implementation - XXH3 request fingerprints
 */

#include "cache/cache_key.hpp"

#include <nlohmann/json.hpp>
#include <xxhash.h>

#include <iomanip>
#include <sstream>

namespace tollgate::cache {

std::string CacheKey::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << high
        << std::setw(16) << low;
    return oss.str();
}

std::string canonical_request(const core::CompletionRequest& request) {
    // nlohmann::json objects are std::map backed, so keys serialize sorted
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : request.messages) {
        messages.push_back({{"role", message.role}, {"content", message.content}});
    }

    const auto& s = request.sampling;
    nlohmann::json sampling = nlohmann::json::object();
    if (s.temperature) sampling["temperature"] = *s.temperature;
    if (s.top_p) sampling["top_p"] = *s.top_p;
    if (s.top_k) sampling["top_k"] = *s.top_k;
    if (s.max_tokens) sampling["max_tokens"] = *s.max_tokens;
    if (s.seed) sampling["seed"] = *s.seed;
    if (!s.stop.empty()) sampling["stop"] = s.stop;
    sampling["stream"] = s.stream;

    nlohmann::json canonical{
        {"provider", request.provider},
        {"model", request.model},
        {"messages", std::move(messages)},
        {"sampling", std::move(sampling)}
    };
    // Invalid UTF-8 is replaced here; the raw bytes are hashed separately
    return canonical.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

CacheKey generate_cache_key(const core::CompletionRequest& request) {
    const auto canonical = canonical_request(request);

    XXH3_state_t* state = XXH3_createState();
    XXH3_128bits_reset(state);
    XXH3_128bits_update(state, canonical.data(), canonical.size());

    for (const auto& message : request.messages) {
        const std::uint64_t length = message.content.size();
        XXH3_128bits_update(state, &length, sizeof(length));
        XXH3_128bits_update(state, message.content.data(), message.content.size());
    }

    XXH128_hash_t digest = XXH3_128bits_digest(state);
    XXH3_freeState(state);

    CacheKey key;
    key.high = digest.high64;
    key.low = digest.low64;
    return key;
}

CacheKey generate_cache_key(std::string_view canonical) {
    XXH128_hash_t digest = XXH3_128bits(canonical.data(), canonical.size());

    CacheKey key;
    key.high = digest.high64;
    key.low = digest.low64;
    return key;
}

} // namespace tollgate::cache
