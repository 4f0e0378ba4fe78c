#include <gtest/gtest.h>

#include "config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace tollgate;
using config::ConfigManager;
using config::ProviderKind;

class ConfigTest : public ::testing::Test {
protected:
    ConfigManager manager_;

    void TearDown() override {
        for (const char* name : {"TOLLGATE_LOG_LEVEL", "TOLLGATE_POOL_MAX_TOTAL",
                                 "TOLLGATE_POOL_MAX_PER_HOST", "TOLLGATE_CACHE_MODE",
                                 "TOLLGATE_TEST_KEY"}) {
            ::unsetenv(name);
        }
        util::Logger::init(util::LogConfig{});
    }

    static constexpr const char* kTwoProviders = R"({
        "pool": {"max_connections_per_host": 8, "idle_timeout_s": 120},
        "logging": {"level": "debug"},
        "providers": [
            {"key": "local-x", "kind": "ollama", "base_url": "http://localhost:11434",
             "rate_limit_per_s": 10, "burst_capacity": 10, "failure_threshold": 3,
             "cache_mode": "aggressive"},
            {"key": "cloud-y", "kind": "openai", "api_key_env": "TOLLGATE_TEST_KEY"}
        ]
    })";
};

// ============================================================================
// Parsing and defaults
// ============================================================================

TEST_F(ConfigTest, LoadsProvidersInOrder) {
    manager_.load_from_string(kTwoProviders);
    auto cfg = manager_.get_config();

    ASSERT_EQ(cfg.providers.size(), 2u);
    EXPECT_EQ(cfg.providers[0].key, "local-x");
    EXPECT_EQ(cfg.providers[1].key, "cloud-y");
    EXPECT_EQ(cfg.pool.max_connections_per_host, 8u);
    EXPECT_EQ(cfg.pool.idle_timeout_s, 120u);
    EXPECT_EQ(cfg.logging.level, "debug");
}

TEST_F(ConfigTest, LoadAppliesLoggingSettings) {
    manager_.load_from_string(kTwoProviders);
    EXPECT_EQ(util::Logger::instance().get_level(), util::LogLevel::Debug);

    auto log_config = config::make_log_config(manager_.get_config().logging);
    EXPECT_EQ(log_config.level, util::LogLevel::Debug);
    EXPECT_TRUE(log_config.file_path.empty());
}

TEST_F(ConfigTest, KindDefaultsFillUnsetFields) {
    manager_.load_from_string(kTwoProviders);
    auto cfg = manager_.get_config();

    const auto* local = cfg.find_provider("local-x");
    ASSERT_NE(local, nullptr);
    EXPECT_EQ(local->kind, ProviderKind::Ollama);
    EXPECT_DOUBLE_EQ(local->rate_limit_per_s, 10.0);
    EXPECT_EQ(local->failure_threshold, 3u);
    EXPECT_EQ(local->recovery_timeout_s, 10u);     // Ollama default
    EXPECT_EQ(local->request_timeout_ms, 120000u);

    const auto* cloud = cfg.find_provider("cloud-y");
    ASSERT_NE(cloud, nullptr);
    EXPECT_EQ(cloud->base_url, "https://api.openai.com/v1");
    EXPECT_DOUBLE_EQ(cloud->rate_limit_per_s, 60.0);
    EXPECT_EQ(cloud->cache_mode, "selective");

    EXPECT_EQ(cfg.find_provider("missing"), nullptr);
}

TEST_F(ConfigTest, ProviderKindNames) {
    EXPECT_EQ(config::parse_provider_kind("ollama"), ProviderKind::Ollama);
    EXPECT_EQ(config::parse_provider_kind("generic"), ProviderKind::OpenAiCompatible);
    EXPECT_FALSE(config::parse_provider_kind("bard").has_value());
    EXPECT_EQ(config::to_string(ProviderKind::Perplexity), "perplexity");
}

TEST_F(ConfigTest, SerializesBackToJson) {
    manager_.load_from_string(kTwoProviders);
    nlohmann::json j = manager_.get_config();

    EXPECT_EQ(j["providers"][0]["kind"], "ollama");
    auto reparsed = j.get<config::Config>();
    EXPECT_EQ(reparsed.providers[1].base_url, "https://api.openai.com/v1");
}

TEST_F(ConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "tollgate_config_test.json";
    {
        std::ofstream out(path);
        out << kTwoProviders;
    }

    manager_.load(path);
    EXPECT_EQ(manager_.get_config().providers.size(), 2u);
    EXPECT_EQ(manager_.get_config_path(), path);

    std::filesystem::remove(path);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(manager_.load("/nonexistent/tollgate.json"), std::runtime_error);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, RejectsMalformedJson) {
    EXPECT_THROW(manager_.load_from_string("{not json"), std::runtime_error);
}

TEST_F(ConfigTest, RejectsEmptyProviderList) {
    EXPECT_THROW(manager_.load_from_string(R"({"providers": []})"), std::runtime_error);
}

TEST_F(ConfigTest, RejectsDuplicateKeys) {
    EXPECT_THROW(manager_.load_from_string(R"({"providers": [
        {"key": "a", "kind": "ollama"}, {"key": "a", "kind": "ollama"}]})"),
        std::runtime_error);
}

TEST_F(ConfigTest, RejectsUnknownKind) {
    EXPECT_THROW(manager_.load_from_string(R"({"providers": [{"key": "a", "kind": "bard"}]})"),
                 std::runtime_error);
}

TEST_F(ConfigTest, RejectsBadProviderValues) {
    EXPECT_THROW(manager_.load_from_string(R"({"providers": [
        {"key": "a", "kind": "ollama", "base_url": "ftp://host"}]})"), std::runtime_error);
    EXPECT_THROW(manager_.load_from_string(R"({"providers": [
        {"key": "a", "kind": "ollama", "rate_limit_unit": "bytes"}]})"), std::runtime_error);
    EXPECT_THROW(manager_.load_from_string(R"({"providers": [
        {"key": "a", "kind": "ollama", "failure_threshold": 0}]})"), std::runtime_error);
    EXPECT_THROW(manager_.load_from_string(R"({"providers": [
        {"key": "a", "kind": "ollama", "cache_mode": "sometimes"}]})"), std::runtime_error);
    EXPECT_THROW(manager_.load_from_string(R"({"providers": [
        {"key": "a", "kind": "ollama", "min_ttl_s": 100, "max_ttl_s": 10}]})"), std::runtime_error);
    EXPECT_THROW(manager_.load_from_string(R"({"providers": [
        {"key": "", "kind": "ollama"}]})"), std::runtime_error);
}

TEST_F(ConfigTest, UnlimitedRateSkipsBurstCheck) {
    EXPECT_NO_THROW(manager_.load_from_string(R"({"providers": [
        {"key": "a", "kind": "ollama", "rate_limit_per_s": 0, "burst_capacity": 0}]})"));
}

// ============================================================================
// Environment
// ============================================================================

TEST_F(ConfigTest, EnvironmentOverridesFileValues) {
    ::setenv("TOLLGATE_LOG_LEVEL", "warn", 1);
    ::setenv("TOLLGATE_POOL_MAX_PER_HOST", "3", 1);
    ::setenv("TOLLGATE_CACHE_MODE", "disabled", 1);

    manager_.load_from_string(kTwoProviders);
    auto cfg = manager_.get_config();

    EXPECT_EQ(cfg.logging.level, "warn");
    EXPECT_EQ(cfg.pool.max_connections_per_host, 3u);
    for (const auto& p : cfg.providers) {
        EXPECT_EQ(p.max_connections_per_host, 3u);
        EXPECT_EQ(p.cache_mode, "disabled");
    }
}

TEST_F(ConfigTest, InvalidEnvironmentNumberThrows) {
    ::setenv("TOLLGATE_POOL_MAX_TOTAL", "lots", 1);
    EXPECT_THROW(manager_.load_from_string(kTwoProviders), std::runtime_error);
}

TEST_F(ConfigTest, InvalidEnvironmentLevelFailsValidation) {
    ::setenv("TOLLGATE_LOG_LEVEL", "loud", 1);
    EXPECT_THROW(manager_.load_from_string(kTwoProviders), std::runtime_error);
}

TEST_F(ConfigTest, ApiKeyResolvedFromEnvironment) {
    manager_.load_from_string(kTwoProviders);
    const auto* cloud = manager_.get_config().find_provider("cloud-y");
    ASSERT_NE(cloud, nullptr);

    EXPECT_EQ(config::resolve_api_key(*cloud), "");
    ::setenv("TOLLGATE_TEST_KEY", "sk-test", 1);
    EXPECT_EQ(config::resolve_api_key(*cloud), "sk-test");
}

TEST_F(ConfigTest, EffectiveGlobalConnectionLimit) {
    config::Config cfg;
    auto a = config::provider_defaults(ProviderKind::Ollama);
    a.max_total_connections = 40;
    auto b = config::provider_defaults(ProviderKind::OpenAi);
    b.max_total_connections = 25;
    cfg.providers = {a, b};

    EXPECT_EQ(cfg.effective_max_total_connections(), 40u);
    cfg.pool.max_total_connections = 10;
    EXPECT_EQ(cfg.effective_max_total_connections(), 10u);
}
