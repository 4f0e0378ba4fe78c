/**
 * TOLLGATE - Resilient LLM Provider Client
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace tollgate::config {

namespace {

constexpr std::string_view kCacheModes[] = {"aggressive", "conservative", "selective", "disabled"};

bool is_known_cache_mode(std::string_view mode) {
    return std::find(std::begin(kCacheModes), std::end(kCacheModes), mode) != std::end(kCacheModes);
}

std::string provider_path(std::size_t index, const ProviderSettings& p) {
    return "providers[" + std::to_string(index) + "]" + (p.key.empty() ? "" : " (" + p.key + ")");
}

} // namespace

std::string_view to_string(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::OpenAi:           return "openai";
        case ProviderKind::Anthropic:        return "anthropic";
        case ProviderKind::Gemini:           return "gemini";
        case ProviderKind::Perplexity:       return "perplexity";
        case ProviderKind::Ollama:           return "ollama";
        case ProviderKind::OpenAiCompatible: return "openai_compatible";
        default:                             return "unknown";
    }
}

std::optional<ProviderKind> parse_provider_kind(std::string_view str) {
    if (str == "openai") return ProviderKind::OpenAi;
    if (str == "anthropic") return ProviderKind::Anthropic;
    if (str == "gemini") return ProviderKind::Gemini;
    if (str == "perplexity") return ProviderKind::Perplexity;
    if (str == "ollama") return ProviderKind::Ollama;
    if (str == "openai_compatible" || str == "generic") return ProviderKind::OpenAiCompatible;
    return std::nullopt;
}

ProviderSettings provider_defaults(ProviderKind kind) {
    ProviderSettings p;
    p.kind = kind;

    switch (kind) {
        case ProviderKind::OpenAi:
            p.base_url = "https://api.openai.com/v1";
            p.api_key_env = "OPENAI_API_KEY";
            p.default_model = "gpt-3.5-turbo";
            p.rate_limit_per_s = 60.0;
            p.burst_capacity = 100.0;
            p.failure_threshold = 3;
            p.recovery_timeout_s = 30;
            p.max_cache_entries = 500;
            break;
        case ProviderKind::Anthropic:
            p.base_url = "https://api.anthropic.com";
            p.api_key_env = "ANTHROPIC_API_KEY";
            p.default_model = "claude-3-haiku-20240307";
            p.rate_limit_per_s = 20.0;
            p.burst_capacity = 40.0;
            p.failure_threshold = 3;
            p.recovery_timeout_s = 30;
            p.max_cache_entries = 500;
            break;
        case ProviderKind::Gemini:
            p.base_url = "https://generativelanguage.googleapis.com/v1beta/openai";
            p.api_key_env = "GEMINI_API_KEY";
            p.default_model = "gemini-1.5-flash";
            p.rate_limit_per_s = 15.0;
            p.burst_capacity = 30.0;
            p.failure_threshold = 3;
            p.recovery_timeout_s = 60;
            p.max_cache_entries = 500;
            break;
        case ProviderKind::Perplexity:
            p.base_url = "https://api.perplexity.ai";
            p.api_key_env = "PERPLEXITY_API_KEY";
            p.default_model = "sonar";
            p.rate_limit_per_s = 5.0;
            p.burst_capacity = 10.0;
            p.failure_threshold = 2;
            p.recovery_timeout_s = 120;
            p.cache_mode = "conservative";
            p.default_ttl_s = 180;
            p.max_cache_entries = 100;
            break;
        case ProviderKind::Ollama:
            p.base_url = "http://localhost:11434";
            p.default_model = "llama3";
            p.request_timeout_ms = 120000;
            p.rate_limit_per_s = 10.0;
            p.burst_capacity = 20.0;
            p.failure_threshold = 5;
            p.recovery_timeout_s = 10;
            p.cache_mode = "aggressive";
            p.default_ttl_s = 600;
            p.max_cache_entries = 200;
            break;
        case ProviderKind::OpenAiCompatible:
        default:
            break;
    }

    return p;
}

// JSON serialization implementations
void to_json(nlohmann::json& j, const PoolSettings& p) {
    j = nlohmann::json{
        {"max_connections_per_host", p.max_connections_per_host},
        {"max_total_connections", p.max_total_connections},
        {"idle_timeout_s", p.idle_timeout_s},
        {"dns_cache_ttl_s", p.dns_cache_ttl_s},
        {"acquire_timeout_ms", p.acquire_timeout_ms},
        {"reap_interval_s", p.reap_interval_s},
        {"connect_timeout_ms", p.connect_timeout_ms},
        {"verify_tls", p.verify_tls}
    };
}

void from_json(const nlohmann::json& j, PoolSettings& p) {
    if (j.contains("max_connections_per_host")) j.at("max_connections_per_host").get_to(p.max_connections_per_host);
    if (j.contains("max_total_connections")) j.at("max_total_connections").get_to(p.max_total_connections);
    if (j.contains("idle_timeout_s")) j.at("idle_timeout_s").get_to(p.idle_timeout_s);
    if (j.contains("dns_cache_ttl_s")) j.at("dns_cache_ttl_s").get_to(p.dns_cache_ttl_s);
    if (j.contains("acquire_timeout_ms")) j.at("acquire_timeout_ms").get_to(p.acquire_timeout_ms);
    if (j.contains("reap_interval_s")) j.at("reap_interval_s").get_to(p.reap_interval_s);
    if (j.contains("connect_timeout_ms")) j.at("connect_timeout_ms").get_to(p.connect_timeout_ms);
    if (j.contains("verify_tls")) j.at("verify_tls").get_to(p.verify_tls);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const ProviderSettings& p) {
    j = nlohmann::json{
        {"key", p.key},
        {"kind", std::string(to_string(p.kind))},
        {"base_url", p.base_url},
        {"api_key_env", p.api_key_env},
        {"default_model", p.default_model},
        {"request_timeout_ms", p.request_timeout_ms},
        {"max_connections_per_host", p.max_connections_per_host},
        {"max_total_connections", p.max_total_connections},
        {"idle_timeout_s", p.idle_timeout_s},
        {"rate_limit_per_s", p.rate_limit_per_s},
        {"burst_capacity", p.burst_capacity},
        {"rate_limit_unit", p.rate_limit_unit},
        {"rate_limit_wait_ms", p.rate_limit_wait_ms},
        {"failure_threshold", p.failure_threshold},
        {"success_threshold", p.success_threshold},
        {"recovery_timeout_s", p.recovery_timeout_s},
        {"half_open_max_calls", p.half_open_max_calls},
        {"failure_reset_timeout_s", p.failure_reset_timeout_s},
        {"cache_mode", p.cache_mode},
        {"default_ttl_s", p.default_ttl_s},
        {"min_ttl_s", p.min_ttl_s},
        {"max_ttl_s", p.max_ttl_s},
        {"max_cache_entries", p.max_cache_entries},
        {"compression_threshold_bytes", p.compression_threshold_bytes},
        {"max_cache_entry_bytes", p.max_cache_entry_bytes},
        {"cacheable_models", p.cacheable_models},
        {"chars_per_token", p.chars_per_token},
        {"context_window", p.context_window}
    };
    if (p.price_per_1k_tokens) {
        j["price_per_1k_tokens"] = *p.price_per_1k_tokens;
    }
}

void from_json(const nlohmann::json& j, ProviderSettings& p) {
    // Kind decides the defaults every other field falls back to
    auto kind = ProviderKind::OpenAiCompatible;
    if (j.contains("kind")) {
        auto kind_str = j.at("kind").get<std::string>();
        auto parsed = parse_provider_kind(kind_str);
        if (!parsed) {
            throw std::runtime_error("Configuration error: unknown provider kind '" + kind_str + "'");
        }
        kind = *parsed;
    }
    p = provider_defaults(kind);

    if (j.contains("key")) j.at("key").get_to(p.key);
    if (j.contains("base_url")) j.at("base_url").get_to(p.base_url);
    if (j.contains("api_key_env")) j.at("api_key_env").get_to(p.api_key_env);
    if (j.contains("default_model")) j.at("default_model").get_to(p.default_model);
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(p.request_timeout_ms);
    if (j.contains("max_connections_per_host")) j.at("max_connections_per_host").get_to(p.max_connections_per_host);
    if (j.contains("max_total_connections")) j.at("max_total_connections").get_to(p.max_total_connections);
    if (j.contains("idle_timeout_s")) j.at("idle_timeout_s").get_to(p.idle_timeout_s);
    if (j.contains("rate_limit_per_s")) j.at("rate_limit_per_s").get_to(p.rate_limit_per_s);
    if (j.contains("burst_capacity")) j.at("burst_capacity").get_to(p.burst_capacity);
    if (j.contains("rate_limit_unit")) j.at("rate_limit_unit").get_to(p.rate_limit_unit);
    if (j.contains("rate_limit_wait_ms")) j.at("rate_limit_wait_ms").get_to(p.rate_limit_wait_ms);
    if (j.contains("failure_threshold")) j.at("failure_threshold").get_to(p.failure_threshold);
    if (j.contains("success_threshold")) j.at("success_threshold").get_to(p.success_threshold);
    if (j.contains("recovery_timeout_s")) j.at("recovery_timeout_s").get_to(p.recovery_timeout_s);
    if (j.contains("half_open_max_calls")) j.at("half_open_max_calls").get_to(p.half_open_max_calls);
    if (j.contains("failure_reset_timeout_s")) j.at("failure_reset_timeout_s").get_to(p.failure_reset_timeout_s);
    if (j.contains("cache_mode")) j.at("cache_mode").get_to(p.cache_mode);
    if (j.contains("default_ttl_s")) j.at("default_ttl_s").get_to(p.default_ttl_s);
    if (j.contains("min_ttl_s")) j.at("min_ttl_s").get_to(p.min_ttl_s);
    if (j.contains("max_ttl_s")) j.at("max_ttl_s").get_to(p.max_ttl_s);
    if (j.contains("max_cache_entries")) j.at("max_cache_entries").get_to(p.max_cache_entries);
    if (j.contains("compression_threshold_bytes")) j.at("compression_threshold_bytes").get_to(p.compression_threshold_bytes);
    if (j.contains("max_cache_entry_bytes")) j.at("max_cache_entry_bytes").get_to(p.max_cache_entry_bytes);
    if (j.contains("cacheable_models")) j.at("cacheable_models").get_to(p.cacheable_models);
    if (j.contains("chars_per_token")) j.at("chars_per_token").get_to(p.chars_per_token);
    if (j.contains("price_per_1k_tokens")) p.price_per_1k_tokens = j.at("price_per_1k_tokens").get<double>();
    if (j.contains("context_window")) j.at("context_window").get_to(p.context_window);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"pool", c.pool},
        {"logging", c.logging},
        {"providers", c.providers}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("pool")) j.at("pool").get_to(c.pool);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("providers")) j.at("providers").get_to(c.providers);
}

// Config validation
void Config::validate() const {
    if (pool.max_connections_per_host == 0) {
        throw std::runtime_error("Configuration error: pool.max_connections_per_host must be non-zero");
    }
    if (pool.reap_interval_s == 0) {
        throw std::runtime_error("Configuration error: pool.reap_interval_s must be non-zero");
    }
    if (pool.connect_timeout_ms == 0) {
        throw std::runtime_error("Configuration error: pool.connect_timeout_ms must be non-zero");
    }

    if (!util::Logger::parse_level(logging.level)) {
        throw std::runtime_error("Configuration error: logging.level '" + logging.level + "' is not a valid level");
    }

    if (providers.empty()) {
        throw std::runtime_error("Configuration error: at least one provider must be configured");
    }

    std::unordered_set<std::string> keys;
    for (std::size_t i = 0; i < providers.size(); ++i) {
        const auto& p = providers[i];
        const auto where = provider_path(i, p);

        if (p.key.empty()) {
            throw std::runtime_error("Configuration error: " + where + ".key cannot be empty");
        }
        if (!keys.insert(p.key).second) {
            throw std::runtime_error("Configuration error: duplicate provider key '" + p.key + "'");
        }
        if (!p.base_url.starts_with("http://") && !p.base_url.starts_with("https://")) {
            throw std::runtime_error("Configuration error: " + where + ".base_url must start with http:// or https://");
        }
        if (p.request_timeout_ms == 0) {
            throw std::runtime_error("Configuration error: " + where + ".request_timeout_ms must be non-zero");
        }
        if (p.max_connections_per_host == 0 || p.max_total_connections == 0) {
            throw std::runtime_error("Configuration error: " + where + " connection limits must be non-zero");
        }
        if (p.rate_limit_unit != "calls" && p.rate_limit_unit != "tokens") {
            throw std::runtime_error("Configuration error: " + where + ".rate_limit_unit must be 'calls' or 'tokens'");
        }
        if (p.rate_limit_per_s > 0.0 && p.burst_capacity < 1.0) {
            throw std::runtime_error("Configuration error: " + where + ".burst_capacity must be at least 1");
        }
        if (p.failure_threshold == 0 || p.success_threshold == 0) {
            throw std::runtime_error("Configuration error: " + where + " breaker thresholds must be non-zero");
        }
        if (p.recovery_timeout_s == 0) {
            throw std::runtime_error("Configuration error: " + where + ".recovery_timeout_s must be non-zero");
        }
        if (!is_known_cache_mode(p.cache_mode)) {
            throw std::runtime_error("Configuration error: " + where + ".cache_mode '" + p.cache_mode + "' is not a valid mode");
        }
        if (p.cache_mode != "disabled" && p.max_cache_entries == 0) {
            throw std::runtime_error("Configuration error: " + where + ".max_cache_entries must be non-zero when caching");
        }
        if (p.min_ttl_s > p.max_ttl_s) {
            throw std::runtime_error("Configuration error: " + where + ".min_ttl_s cannot exceed max_ttl_s");
        }
        if (p.chars_per_token < 0.0) {
            throw std::runtime_error("Configuration error: " + where + ".chars_per_token cannot be negative");
        }
        if (p.price_per_1k_tokens && *p.price_per_1k_tokens < 0.0) {
            throw std::runtime_error("Configuration error: " + where + ".price_per_1k_tokens cannot be negative");
        }
    }

    TOLLGATE_LOG_DEBUG(util::log_component::Config, "Configuration validated successfully");
}

const ProviderSettings* Config::find_provider(std::string_view key) const {
    for (const auto& p : providers) {
        if (p.key == key) {
            return &p;
        }
    }
    return nullptr;
}

std::uint32_t Config::effective_max_total_connections() const {
    if (pool.max_total_connections > 0) {
        return pool.max_total_connections;
    }
    std::uint32_t result = 0;
    for (const auto& p : providers) {
        result = std::max(result, p.max_total_connections);
    }
    return result > 0 ? result : 100;
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

void ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    config_ = Config{};
    config_path_ = path;

    if (config_path_.empty()) {
        if (auto env = get_env("TOLLGATE_CONFIG")) {
            config_path_ = *env;
        }
    }

    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    apply_environment_overrides();
    config_.validate();
    util::Logger::init(make_log_config(config_.logging));

    TOLLGATE_LOG_INFO(util::log_component::Config, "Configuration loaded: {} provider(s)",
                      config_.providers.size());
}

void ConfigManager::load_from_string(std::string_view json_text) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    config_ = Config{};
    config_path_.clear();

    try {
        config_ = nlohmann::json::parse(json_text).get<Config>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration: " + std::string(e.what()));
    }

    apply_environment_overrides();
    config_.validate();
    util::Logger::init(make_log_config(config_.logging));
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        TOLLGATE_LOG_DEBUG(util::log_component::Config, "Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    if (auto env = get_env("TOLLGATE_LOG_LEVEL")) {
        config_.logging.level = *env;
        TOLLGATE_LOG_DEBUG(util::log_component::Config, "Applied TOLLGATE_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("TOLLGATE_LOG_FILE")) {
        config_.logging.file = *env;
        TOLLGATE_LOG_DEBUG(util::log_component::Config, "Applied TOLLGATE_LOG_FILE={}", config_.logging.file);
    }

    if (auto env = get_env("TOLLGATE_POOL_MAX_TOTAL")) {
        try {
            config_.pool.max_total_connections = static_cast<std::uint32_t>(std::stoul(*env));
            TOLLGATE_LOG_DEBUG(util::log_component::Config, "Applied TOLLGATE_POOL_MAX_TOTAL={}", config_.pool.max_total_connections);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid TOLLGATE_POOL_MAX_TOTAL value: " + *env);
        }
    }

    if (auto env = get_env("TOLLGATE_POOL_MAX_PER_HOST")) {
        std::uint32_t per_host = 0;
        try {
            per_host = static_cast<std::uint32_t>(std::stoul(*env));
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid TOLLGATE_POOL_MAX_PER_HOST value: " + *env);
        }
        config_.pool.max_connections_per_host = per_host;
        for (auto& p : config_.providers) {
            p.max_connections_per_host = per_host;
        }
        TOLLGATE_LOG_DEBUG(util::log_component::Config, "Applied TOLLGATE_POOL_MAX_PER_HOST={}", per_host);
    }

    if (auto env = get_env("TOLLGATE_CACHE_MODE")) {
        for (auto& p : config_.providers) {
            p.cache_mode = *env;
        }
        TOLLGATE_LOG_DEBUG(util::log_component::Config, "Applied TOLLGATE_CACHE_MODE={}", *env);
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

std::string resolve_api_key(const ProviderSettings& provider) {
    if (provider.api_key_env.empty()) {
        return {};
    }
    const char* value = std::getenv(provider.api_key_env.c_str());
    return value ? std::string(value) : std::string{};
}

util::LogConfig make_log_config(const LogSettings& settings) {
    util::LogConfig config;
    config.level = util::Logger::parse_level(settings.level).value_or(util::LogLevel::Info);
    config.file_path = settings.file;
    config.max_file_size_mb = settings.max_file_size_mb;
    config.max_files = settings.max_files;
    config.enable_console = settings.enable_console;
    config.enable_colors = settings.enable_colors;
    return config;
}

} // namespace tollgate::config
