/**
 * TOLLGATE - Resilient LLM Provider Client
 * Client Statistics Implementation
 */

#include "client/stats.hpp"

#include <algorithm>

namespace tollgate::client {

using json = nlohmann::json;

namespace {

json pool_json(const pool::PoolStats& s) {
    return json{
        {"available", s.available},
        {"in_use", s.in_use},
        {"total", s.total}
    };
}

json breaker_json(const breaker::CircuitBreakerStats& s) {
    json history = json::array();
    for (const auto& event : s.history) {
        history.push_back(json{
            {"from", std::string(breaker::to_string(event.from))},
            {"to", std::string(breaker::to_string(event.to))},
            {"at_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                          event.wall_time.time_since_epoch()).count()}
        });
    }

    return json{
        {"state", std::string(breaker::to_string(s.state))},
        {"consecutive_failures", s.consecutive_failures},
        {"consecutive_successes", s.consecutive_successes},
        {"half_open_in_flight", s.half_open_in_flight},
        {"admitted", s.admitted},
        {"rejected", s.rejected},
        {"successes", s.successes},
        {"failures", s.failures},
        {"ignored", s.ignored},
        {"transitions", {
            {"open", s.transitions_to_open},
            {"half_open", s.transitions_to_half_open},
            {"closed", s.transitions_to_closed}
        }},
        {"time_in_state_ms", s.time_in_state.count()},
        {"history", history}
    };
}

} // anonymous namespace

const ProviderStats* ClientStats::find(const core::ProviderKey& key) const {
    auto it = std::find_if(providers.begin(), providers.end(),
                           [&key](const ProviderStats& p) { return p.key == key; });
    return it == providers.end() ? nullptr : &*it;
}

void to_json(json& j, const ProviderStats& s) {
    j = json{
        {"key", s.key},
        {"kind", s.kind},
        {"endpoint", s.endpoint},
        {"pool", s.pool ? pool_json(*s.pool) : json(nullptr)},
        {"limiter", {
            {"tokens", s.limiter.current_tokens},
            {"capacity", s.limiter.capacity},
            {"rate_per_second", s.limiter.rate_per_second},
            {"admitted", s.limiter.admitted},
            {"rejected", s.limiter.rejected},
            {"total_wait_ms", s.limiter.total_wait.count()}
        }},
        {"breaker", breaker_json(s.breaker)},
        {"cache", {
            {"hits", s.cache.hits},
            {"misses", s.cache.misses},
            {"hit_rate", s.cache.hit_rate()},
            {"evictions", s.cache.evictions},
            {"expired", s.cache.expired},
            {"rejected", s.cache.rejected},
            {"entries", s.cache.entries},
            {"max_entries", s.cache.max_entries},
            {"size_bytes", s.cache.size_bytes},
            {"original_bytes", s.cache.original_bytes},
            {"compressed_entries", s.cache.compressed_entries}
        }},
        {"usage", s.usage}
    };
}

void to_json(json& j, const ClientStats& s) {
    j = json{
        {"providers", s.providers},
        {"pool", {
            {"total", pool_json(s.pool_total)},
            {"created", s.pool_counters.created},
            {"reused", s.pool_counters.reused},
            {"discarded", s.pool_counters.discarded},
            {"reaped", s.pool_counters.reaped},
            {"exhausted", s.pool_counters.exhausted}
        }}
    };
}

} // namespace tollgate::client
