/**
 * TOLLGATE - Resilient LLM Provider Client
 * Configuration System - Supports JSON file and environment variables
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Environment variables (TOLLGATE_*)
 * 2. Configuration file (JSON)
 * 3. Per-provider-kind defaults
 * 4. Default values
 */

#ifndef TOLLGATE_CONFIG_CONFIG_HPP
#define TOLLGATE_CONFIG_CONFIG_HPP

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::config {

/**
 * Provider family; selects wire adapter, token profile and defaults
 */
enum class ProviderKind {
    OpenAi,
    Anthropic,
    Gemini,
    Perplexity,
    Ollama,
    OpenAiCompatible
};

std::string_view to_string(ProviderKind kind);
std::optional<ProviderKind> parse_provider_kind(std::string_view str);

/**
 * Connection pool settings (process-wide)
 */
struct PoolSettings {
    std::uint32_t max_connections_per_host{20};
    std::uint32_t max_total_connections{0};      // 0 = derive from providers
    std::uint32_t idle_timeout_s{300};
    std::uint32_t dns_cache_ttl_s{300};
    std::uint32_t acquire_timeout_ms{30000};
    std::uint32_t reap_interval_s{60};
    std::uint32_t connect_timeout_ms{10000};
    bool verify_tls{true};
};

/**
 * Logging settings
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * One configured provider
 */
struct ProviderSettings {
    std::string key;
    ProviderKind kind{ProviderKind::OpenAiCompatible};
    std::string base_url;
    std::string api_key_env;                     // Environment variable holding the API key
    std::string default_model;
    std::uint32_t request_timeout_ms{60000};     // Deadline applied when the caller sets none

    // Connection pool slice for this provider's host
    std::uint32_t max_connections_per_host{20};
    std::uint32_t max_total_connections{100};
    std::uint32_t idle_timeout_s{300};

    // Rate limiting
    double rate_limit_per_s{5.0};                // <= 0 disables limiting
    double burst_capacity{10.0};
    std::string rate_limit_unit{"calls"};        // "calls" or "tokens"
    std::uint32_t rate_limit_wait_ms{0};         // 0 = fail fast

    // Circuit breaker
    std::uint32_t failure_threshold{5};
    std::uint32_t success_threshold{2};
    std::uint32_t recovery_timeout_s{30};
    std::uint32_t half_open_max_calls{0};        // 0 = success_threshold
    std::uint32_t failure_reset_timeout_s{300};  // 0 = Closed failures never expire

    // Response cache
    std::string cache_mode{"selective"};
    std::uint32_t default_ttl_s{300};
    std::uint32_t min_ttl_s{30};
    std::uint32_t max_ttl_s{3600};
    std::uint32_t max_cache_entries{1000};
    std::uint32_t compression_threshold_bytes{1024};
    std::uint32_t max_cache_entry_bytes{1024 * 1024};
    std::vector<std::string> cacheable_models;

    // Token estimation
    double chars_per_token{0.0};                 // 0 = provider default
    std::optional<double> price_per_1k_tokens;   // Unset = built-in price table
    std::uint32_t context_window{0};             // 0 = built-in model table

    bool limits_tokens() const { return rate_limit_unit == "tokens"; }
};

/**
 * Defaults for a provider kind before file values are applied
 */
ProviderSettings provider_defaults(ProviderKind kind);

/**
 * Complete application configuration
 */
struct Config {
    PoolSettings pool;
    LogSettings logging;
    std::vector<ProviderSettings> providers;

    /**
     * Validate configuration and throw std::runtime_error if invalid
     */
    void validate() const;

    /**
     * Find a provider by key, nullptr if absent
     */
    const ProviderSettings* find_provider(std::string_view key) const;

    /**
     * Global connection ceiling: pool.max_total_connections when set,
     * otherwise the largest provider value
     */
    std::uint32_t effective_max_total_connections() const;
};

/**
 * Configuration manager - handles loading and environment overrides
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Load configuration from a JSON file (or TOLLGATE_CONFIG when path is empty),
     * then apply environment overrides and validate.
     *
     * @throws std::runtime_error on configuration errors
     */
    void load(const std::filesystem::path& path = {});

    /**
     * Load configuration from a JSON document held in memory
     *
     * @throws std::runtime_error on configuration errors
     */
    void load_from_string(std::string_view json_text);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    std::filesystem::path get_config_path() const;

private:
    void load_from_file(const std::filesystem::path& path);
    void apply_environment_overrides();

    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
};

/**
 * Resolve a provider's API key from its api_key_env variable (empty if unset)
 */
std::string resolve_api_key(const ProviderSettings& provider);

/**
 * Translate logging settings into a logger configuration
 */
util::LogConfig make_log_config(const LogSettings& settings);

// JSON serialization support
void to_json(nlohmann::json& j, const PoolSettings& p);
void from_json(const nlohmann::json& j, PoolSettings& p);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const ProviderSettings& p);
void from_json(const nlohmann::json& j, ProviderSettings& p);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace tollgate::config

#endif // TOLLGATE_CONFIG_CONFIG_HPP
