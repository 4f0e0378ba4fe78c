/**
 * TOLLGATE - Resilient LLM Provider Client
 * Provider Registry Implementation
 */

#include "client/provider_registry.hpp"
#include "util/logger.hpp"

#include <stdexcept>

namespace tollgate::client {

using util::log_component::Client;

namespace {

const config::Config& validated(const config::Config& config) {
    config.validate();
    return config;
}

} // anonymous namespace

ProviderEntry::ProviderEntry(const config::ProviderSettings& provider_settings)
    : settings(provider_settings)
    , endpoint(pool::Endpoint::parse(provider_settings.base_url))
    , api_key(config::resolve_api_key(provider_settings))
    , policy(cache::make_policy_config(provider_settings))
    , cache(provider_settings.key, make_cache_config(provider_settings))
    , tokens(provider_settings)
    , adapter(make_adapter(provider_settings.kind)) {
}

pool::ConnectionPoolConfig make_pool_config(const config::Config& config) {
    const auto& p = config.pool;
    return pool::ConnectionPoolConfig{
        .max_total_connections = config.effective_max_total_connections(),
        .default_host_limits = pool::HostLimits{
            .max_connections = p.max_connections_per_host,
            .idle_timeout = std::chrono::seconds(p.idle_timeout_s)
        },
        .dns_cache_ttl = std::chrono::seconds(p.dns_cache_ttl_s),
        .acquire_timeout = std::chrono::milliseconds(p.acquire_timeout_ms),
        .reap_interval = std::chrono::seconds(p.reap_interval_s),
        .connect_timeout = std::chrono::milliseconds(p.connect_timeout_ms),
        .verify_tls = p.verify_tls
    };
}

limiter::RateLimitSettings make_rate_limit_settings(const config::ProviderSettings& settings) {
    return limiter::RateLimitSettings{
        .rate_per_second = settings.rate_limit_per_s,
        .burst_capacity = settings.burst_capacity
    };
}

breaker::CircuitBreakerConfig make_breaker_config(const config::ProviderSettings& settings) {
    return breaker::CircuitBreakerConfig{
        .failure_threshold = settings.failure_threshold,
        .success_threshold = settings.success_threshold,
        .recovery_timeout = std::chrono::seconds(settings.recovery_timeout_s),
        .half_open_max_calls = settings.half_open_max_calls,
        .failure_reset_timeout = std::chrono::seconds(settings.failure_reset_timeout_s)
    };
}

cache::ResponseCacheConfig make_cache_config(const config::ProviderSettings& settings) {
    return cache::ResponseCacheConfig{
        .max_entries = settings.max_cache_entries,
        .default_ttl = std::chrono::seconds(settings.default_ttl_s),
        .max_entry_bytes = settings.max_cache_entry_bytes,
        .compression = cache::CompressionConfig{
            .threshold_bytes = settings.compression_threshold_bytes
        }
    };
}

ProviderRegistry::ProviderRegistry(const config::Config& config,
                                   std::shared_ptr<pool::SessionFactory> session_factory)
    : pool_(make_pool_config(validated(config)), std::move(session_factory)) {
    for (const auto& settings : config.providers) {
        auto entry = std::make_unique<ProviderEntry>(settings);

        pool_.register_host(entry->endpoint, pool::HostLimits{
            .max_connections = settings.max_connections_per_host,
            .idle_timeout = std::chrono::seconds(settings.idle_timeout_s)
        });
        limiter_.add_provider(settings.key, make_rate_limit_settings(settings));
        breakers_.add(settings.key, make_breaker_config(settings));

        TOLLGATE_LOG_INFO(Client, "Provider {} ({}) -> {} [rate={}/s burst={} {}, cache={}]",
                          settings.key, config::to_string(settings.kind), entry->endpoint.key(),
                          settings.rate_limit_per_s, settings.burst_capacity,
                          settings.rate_limit_unit, settings.cache_mode);
        if (entry->api_key.empty() && !settings.api_key_env.empty()) {
            TOLLGATE_LOG_WARN(Client, "Provider {}: {} is not set", settings.key, settings.api_key_env);
        }

        order_.push_back(settings.key);
        entries_.emplace(settings.key, std::move(entry));
    }
}

ProviderRegistry::~ProviderRegistry() {
    stop();
}

ProviderEntry* ProviderRegistry::find(const core::ProviderKey& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : it->second.get();
}

ProviderEntry& ProviderRegistry::get(const core::ProviderKey& key) const {
    auto* entry = find(key);
    if (!entry) {
        throw std::out_of_range("Unknown provider: " + key);
    }
    return *entry;
}

bool ProviderRegistry::contains(const core::ProviderKey& key) const {
    return entries_.find(key) != entries_.end();
}

void ProviderRegistry::start() {
    pool_.start();
}

void ProviderRegistry::stop() {
    pool_.stop();
}

} // namespace tollgate::client
