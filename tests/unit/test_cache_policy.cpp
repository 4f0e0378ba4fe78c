#include <gtest/gtest.h>

#include "cache/cache_policy.hpp"

using namespace tollgate;
using namespace std::chrono_literals;
using cache::CacheMode;
using cache::CachePolicy;
using cache::CachePolicyConfig;

class CachePolicyTest : public ::testing::Test {
protected:
    CachePolicyConfig config_{
        .mode = CacheMode::Selective,
        .default_ttl = 300s,
        .min_ttl = 30s,
        .max_ttl = 3600s,
        .cacheable_models = {"gpt-3.5"}
    };

    static core::CompletionRequest request(std::string model, std::optional<double> temperature,
                                           bool stream = false) {
        core::CompletionRequest r;
        r.provider = "p";
        r.model = std::move(model);
        r.messages = {{.role = "user", .content = "hi"}};
        r.sampling.temperature = temperature;
        r.sampling.stream = stream;
        return r;
    }
};

// ============================================================================
// Modes
// ============================================================================

TEST_F(CachePolicyTest, ModeNamesRoundTrip) {
    for (auto mode : {CacheMode::Aggressive, CacheMode::Conservative,
                      CacheMode::Selective, CacheMode::Disabled}) {
        EXPECT_EQ(cache::parse_cache_mode(cache::to_string(mode)), mode);
    }
    EXPECT_EQ(cache::parse_cache_mode("off"), CacheMode::Disabled);
    EXPECT_FALSE(cache::parse_cache_mode("sometimes").has_value());
}

TEST_F(CachePolicyTest, AggressiveCachesEverything) {
    config_.mode = CacheMode::Aggressive;
    CachePolicy policy(config_);

    EXPECT_TRUE(policy.enabled());
    EXPECT_TRUE(policy.is_cacheable(request("llama3", 1.2)));
    EXPECT_TRUE(policy.is_cacheable(request("llama3", std::nullopt, true)));
}

TEST_F(CachePolicyTest, ConservativeNeedsLowTemperature) {
    config_.mode = CacheMode::Conservative;
    CachePolicy policy(config_);

    EXPECT_TRUE(policy.is_cacheable(request("gpt-4", 0.0)));
    EXPECT_TRUE(policy.is_cacheable(request("gpt-4", 0.1)));
    EXPECT_FALSE(policy.is_cacheable(request("gpt-4", 0.2)));
    EXPECT_FALSE(policy.is_cacheable(request("gpt-4", std::nullopt)));
    EXPECT_FALSE(policy.is_cacheable(request("gpt-4", 0.0, true)));
}

TEST_F(CachePolicyTest, SelectiveUsesAllowListOrTemperature) {
    CachePolicy policy(config_);

    EXPECT_TRUE(policy.is_cacheable(request("gpt-3.5-turbo", 0.9)));
    EXPECT_TRUE(policy.is_cacheable(request("gpt-4", 0.3)));
    EXPECT_FALSE(policy.is_cacheable(request("gpt-4", 0.7)));
    EXPECT_FALSE(policy.is_cacheable(request("gpt-3.5-turbo", 0.0, true)));
}

TEST_F(CachePolicyTest, DisabledCachesNothing) {
    config_.mode = CacheMode::Disabled;
    CachePolicy policy(config_);

    EXPECT_FALSE(policy.enabled());
    EXPECT_FALSE(policy.is_cacheable(request("gpt-3.5-turbo", 0.0)));
}

// ============================================================================
// TTL
// ============================================================================

TEST_F(CachePolicyTest, DeterministicRequestsLiveLonger) {
    CachePolicy policy(config_);

    EXPECT_EQ(policy.ttl_for(request("gpt-4", 0.0)), 600s);
    EXPECT_EQ(policy.ttl_for(request("gpt-4", 0.4)), 450s);
    EXPECT_EQ(policy.ttl_for(request("gpt-4", std::nullopt)), 300s);
    EXPECT_EQ(policy.ttl_for(request("gpt-3.5-turbo", 0.9)), 300s);
}

TEST_F(CachePolicyTest, StreamingGetsMinimumTtl) {
    CachePolicy policy(config_);
    EXPECT_EQ(policy.ttl_for(request("gpt-4", 0.0, true)), 30s);
}

TEST_F(CachePolicyTest, TtlClampedToBounds) {
    config_.max_ttl = 400s;
    CachePolicy policy(config_);
    EXPECT_EQ(policy.ttl_for(request("gpt-4", 0.0)), 400s);

    config_.max_ttl = 3600s;
    config_.min_ttl = 500s;
    CachePolicy floor_policy(config_);
    EXPECT_EQ(floor_policy.ttl_for(request("gpt-4", std::nullopt)), 500s);
}

TEST_F(CachePolicyTest, BuiltFromProviderSettings) {
    config::ProviderSettings settings = config::provider_defaults(config::ProviderKind::Ollama);
    auto cfg = cache::make_policy_config(settings);

    EXPECT_EQ(cfg.mode, CacheMode::Aggressive);
    EXPECT_EQ(cfg.default_ttl, 600s);
}
