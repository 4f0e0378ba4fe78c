#include <gtest/gtest.h>

#include "client/resilient_client.hpp"
#include "mocks/fake_session.hpp"

#include <atomic>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace tollgate;
using namespace std::chrono_literals;
using client::ProviderRegistry;
using client::ResilientClient;
using core::FailureKind;
using core::Stage;
using tollgate::testing::FakeSessionFactory;
using tollgate::testing::ScriptedReply;
using tollgate::testing::ollama_body;
using tollgate::testing::openai_body;

class ResilientClientTest : public ::testing::Test {
protected:
    config::Config config_;
    std::shared_ptr<FakeSessionFactory> factory_;
    std::unique_ptr<ProviderRegistry> registry_;
    std::unique_ptr<ResilientClient> client_;

    void SetUp() override {
        ::setenv("TOLLGATE_TEST_CLOUD_KEY", "sk-cloud", 1);

        auto local = config::provider_defaults(config::ProviderKind::Ollama);
        local.key = "local-x";
        local.base_url = "http://localhost:11434";
        local.rate_limit_per_s = 10.0;
        local.burst_capacity = 10.0;
        local.failure_threshold = 3;
        local.recovery_timeout_s = 10;
        local.cache_mode = "aggressive";

        auto cloud = config::provider_defaults(config::ProviderKind::OpenAi);
        cloud.key = "cloud-y";
        cloud.base_url = "https://api.example.com/v1";
        cloud.api_key_env = "TOLLGATE_TEST_CLOUD_KEY";
        cloud.rate_limit_per_s = 50.0;
        cloud.burst_capacity = 50.0;
        cloud.failure_threshold = 3;
        cloud.cache_mode = "disabled";

        config_.providers = {local, cloud};
        build();
    }

    void TearDown() override {
        client_.reset();
        registry_.reset();
        ::unsetenv("TOLLGATE_TEST_CLOUD_KEY");
    }

    void build() {
        client_.reset();
        registry_.reset();
        factory_ = std::make_shared<FakeSessionFactory>();
        registry_ = std::make_unique<ProviderRegistry>(config_, factory_);
        client_ = std::make_unique<ResilientClient>(*registry_);
    }

    config::ProviderSettings& provider(const std::string& key) {
        for (auto& p : config_.providers) {
            if (p.key == key) return p;
        }
        throw std::out_of_range(key);
    }

    static core::CompletionRequest ask(const std::string& provider, const std::string& prompt,
                                       std::optional<double> temperature = 0.0) {
        core::CompletionRequest r;
        r.provider = provider;
        r.model = provider == "local-x" ? "llama3" : "gpt-4o-mini";
        r.messages = {{.role = "user", .content = prompt}};
        r.sampling.temperature = temperature;
        return r;
    }
};

// ============================================================================
// Happy path and caching
// ============================================================================

TEST_F(ResilientClientTest, SuccessfulCallFillsResult) {
    factory_->push_ok(openai_body("Four", 12, 5));

    auto outcome = client_->complete(ask("cloud-y", "What is 2+2?"));

    ASSERT_TRUE(outcome.ok()) << outcome.failure->to_string();
    const auto& r = *outcome.result;
    EXPECT_EQ(r.content, "Four");
    EXPECT_EQ(r.provider, "cloud-y");
    EXPECT_EQ(r.prompt_tokens, 12u);
    EXPECT_EQ(r.completion_tokens, 5u);
    EXPECT_GT(r.estimated_prompt_tokens, 0u);
    EXPECT_GT(r.estimated_cost, 0.0);
    EXPECT_FALSE(r.from_cache);

    auto sent = factory_->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].target, "/v1/chat/completions");
    EXPECT_EQ(sent[0].host, "api.example.com");
    EXPECT_EQ(sent[0].authorization, "Bearer sk-cloud");
    EXPECT_FALSE(sent[0].request_id.empty());
}

TEST_F(ResilientClientTest, CacheHitSkipsLimiterBreakerAndNetwork) {
    factory_->push_ok(ollama_body("4"));

    auto first = client_->complete(ask("local-x", "What is 2+2?"));
    ASSERT_TRUE(first.ok());
    EXPECT_FALSE(first.result->from_cache);

    auto second = client_->complete(ask("local-x", "What is 2+2?"));
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(second.result->from_cache);
    EXPECT_EQ(second.result->content, "4");
    EXPECT_EQ(second.result->provider, "local-x");

    EXPECT_EQ(factory_->sends(), 1u);
    EXPECT_EQ(registry_->limiter().stats("local-x").admitted, 1u);
    EXPECT_EQ(registry_->breakers().get("local-x").stats().admitted, 1u);

    auto usage = registry_->get("local-x").metrics.snapshot();
    EXPECT_EQ(usage.cache_hits, 1u);
    EXPECT_EQ(usage.cache_misses, 1u);
    EXPECT_EQ(usage.network_calls, 1u);
    EXPECT_EQ(usage.calls_success, 2u);
}

TEST_F(ResilientClientTest, DifferentPromptsMissCache) {
    factory_->set_default(ScriptedReply{.body = ollama_body("ok")});

    ASSERT_TRUE(client_->complete(ask("local-x", "one")).ok());
    ASSERT_TRUE(client_->complete(ask("local-x", "two")).ok());
    EXPECT_EQ(factory_->sends(), 2u);
}

TEST_F(ResilientClientTest, DisabledCacheAlwaysCallsUpstream) {
    factory_->set_default(ScriptedReply{.body = openai_body("same")});

    ASSERT_TRUE(client_->complete(ask("cloud-y", "repeat")).ok());
    ASSERT_TRUE(client_->complete(ask("cloud-y", "repeat")).ok());
    EXPECT_EQ(factory_->sends(), 2u);
}

TEST_F(ResilientClientTest, ConnectionIsReusedAcrossCalls) {
    factory_->set_default(ScriptedReply{.body = openai_body("hi")});

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(client_->complete(ask("cloud-y", "call " + std::to_string(i))).ok());
    }
    EXPECT_EQ(factory_->sessions_created(), 1u);
    EXPECT_EQ(registry_->pool().counters().reused, 4u);
}

// ============================================================================
// Failure classification
// ============================================================================

TEST_F(ResilientClientTest, UnknownProviderIsConfigError) {
    auto outcome = client_->complete(ask("nope", "hello"));

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::ConfigError);
    EXPECT_EQ(outcome.failure->stage, Stage::Config);
    EXPECT_EQ(factory_->sends(), 0u);
}

TEST_F(ResilientClientTest, UpstreamRateLimitDoesNotTripBreaker) {
    for (int i = 0; i < 5; ++i) {
        factory_->push_status(429);
    }

    for (int i = 0; i < 5; ++i) {
        auto outcome = client_->complete(ask("cloud-y", "q" + std::to_string(i)));
        ASSERT_FALSE(outcome.ok());
        EXPECT_EQ(outcome.failure->kind, FailureKind::RateLimited);
        EXPECT_EQ(outcome.failure->stage, Stage::Network);
        EXPECT_EQ(outcome.failure->http_status.value_or(0), 429);
    }
    EXPECT_EQ(registry_->breakers().get("cloud-y").state(), breaker::CircuitState::Closed);
}

TEST_F(ResilientClientTest, ClientErrorsDoNotTripBreaker) {
    for (int i = 0; i < 5; ++i) {
        factory_->push_status(400, R"({"error":{"message":"bad request"}})");
    }
    for (int i = 0; i < 5; ++i) {
        auto outcome = client_->complete(ask("cloud-y", "q" + std::to_string(i)));
        EXPECT_EQ(outcome.failure->kind, FailureKind::ClientError);
    }
    EXPECT_EQ(registry_->breakers().get("cloud-y").state(), breaker::CircuitState::Closed);
}

TEST_F(ResilientClientTest, ServerErrorsOpenBreakerAndStopTraffic) {
    for (int i = 0; i < 3; ++i) {
        factory_->push_status(500);
    }

    for (int i = 0; i < 3; ++i) {
        auto outcome = client_->complete(ask("local-x", "q" + std::to_string(i)));
        ASSERT_FALSE(outcome.ok());
        EXPECT_EQ(outcome.failure->kind, FailureKind::UpstreamError);
    }
    EXPECT_EQ(registry_->breakers().get("local-x").state(), breaker::CircuitState::Open);

    auto rejected = client_->complete(ask("local-x", "q3"));
    ASSERT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.failure->kind, FailureKind::CircuitOpen);
    EXPECT_EQ(rejected.failure->stage, Stage::CircuitBreaker);
    EXPECT_EQ(factory_->sends(), 3u);
}

TEST_F(ResilientClientTest, FailuresAreNotCached) {
    factory_->push_status(503);
    factory_->push_ok(ollama_body("recovered"));

    EXPECT_FALSE(client_->complete(ask("local-x", "same")).ok());

    auto outcome = client_->complete(ask("local-x", "same"));
    ASSERT_TRUE(outcome.ok());
    EXPECT_FALSE(outcome.result->from_cache);
    EXPECT_EQ(outcome.result->content, "recovered");
}

TEST_F(ResilientClientTest, MalformedBodyIsUpstreamError) {
    factory_->push_ok("not json");

    auto outcome = client_->complete(ask("cloud-y", "hello"));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::UpstreamError);
    EXPECT_EQ(registry_->breakers().get("cloud-y").stats().consecutive_failures, 1u);
}

TEST_F(ResilientClientTest, TransportErrorDiscardsConnection) {
    factory_->push_error(boost::asio::error::connection_reset);

    auto outcome = client_->complete(ask("cloud-y", "hello"));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::UpstreamError);
    EXPECT_EQ(outcome.failure->stage, Stage::Network);

    auto stats = registry_->pool().host_stats(registry_->get("cloud-y").endpoint);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 0u);
    EXPECT_EQ(registry_->pool().counters().discarded, 1u);
}

// ============================================================================
// Deadlines and local limits
// ============================================================================

TEST_F(ResilientClientTest, DeadlineExpiryIsTimeoutAndDiscardsConnection) {
    factory_->push(ScriptedReply{.body = openai_body("late"), .delay = 500ms});

    auto request = ask("cloud-y", "slow");
    request.deadline = core::Clock::now() + 100ms;

    auto start = core::Clock::now();
    auto outcome = client_->complete(request);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::Timeout);
    EXPECT_EQ(outcome.failure->stage, Stage::Network);
    EXPECT_LT(core::Clock::now() - start, 400ms);

    EXPECT_EQ(factory_->sessions_closed(), 1u);
    EXPECT_EQ(registry_->pool().host_stats(registry_->get("cloud-y").endpoint)->total, 0u);
    EXPECT_EQ(registry_->breakers().get("cloud-y").stats().consecutive_failures, 1u);
}

TEST_F(ResilientClientTest, ExpiredDeadlineCostsProviderNothing) {
    factory_->set_default(ScriptedReply{.body = ollama_body("never")});
    const auto threshold = provider("local-x").failure_threshold;

    for (std::uint32_t i = 0; i < threshold; ++i) {
        auto request = ask("local-x", "stale " + std::to_string(i));
        request.deadline = core::Clock::now() - 1ms;

        auto outcome = client_->complete(request);
        ASSERT_FALSE(outcome.ok());
        EXPECT_EQ(outcome.failure->kind, FailureKind::Timeout);
        EXPECT_NE(outcome.failure->stage, Stage::Network);
    }

    auto breaker = registry_->breakers().get("local-x").stats();
    EXPECT_EQ(breaker.state, breaker::CircuitState::Closed);
    EXPECT_EQ(breaker.consecutive_failures, 0u);

    auto limiter = registry_->limiter().stats("local-x");
    EXPECT_DOUBLE_EQ(limiter.current_tokens, limiter.capacity);
    EXPECT_EQ(factory_->sends(), 0u);
    EXPECT_EQ(factory_->sessions_closed(), 0u);

    // A live caller still gets through
    EXPECT_TRUE(client_->complete(ask("local-x", "fresh")).ok());
}

TEST_F(ResilientClientTest, SessionRejectsExpiredDeadlineWithoutClosing) {
    auto session = factory_->create(pool::Endpoint::parse("http://localhost:11434"));
    pool::HttpRequest request{boost::beast::http::verb::post, "/api/chat", 11};

    EXPECT_THROW(session->send(request, core::Clock::now() - 1ms), boost::system::system_error);
    EXPECT_TRUE(session->is_open());
    EXPECT_EQ(factory_->sends(), 0u);
}

TEST_F(ResilientClientTest, LocalRateLimitFailsFast) {
    provider("cloud-y").rate_limit_per_s = 1.0;
    provider("cloud-y").burst_capacity = 2.0;
    build();
    factory_->set_default(ScriptedReply{.body = openai_body("ok")});

    EXPECT_TRUE(client_->complete(ask("cloud-y", "a")).ok());
    EXPECT_TRUE(client_->complete(ask("cloud-y", "b")).ok());

    auto limited = client_->complete(ask("cloud-y", "c"));
    ASSERT_FALSE(limited.ok());
    EXPECT_EQ(limited.failure->kind, FailureKind::RateLimited);
    EXPECT_EQ(limited.failure->stage, Stage::RateLimiter);
    EXPECT_EQ(factory_->sends(), 2u);

    // Local rate limiting says nothing about provider health
    EXPECT_EQ(registry_->breakers().get("cloud-y").stats().failures, 0u);
}

TEST_F(ResilientClientTest, ConfiguredWaitAbsorbsShortBursts) {
    provider("cloud-y").rate_limit_per_s = 20.0;
    provider("cloud-y").burst_capacity = 1.0;
    provider("cloud-y").rate_limit_wait_ms = 500;
    build();
    factory_->set_default(ScriptedReply{.body = openai_body("ok")});

    EXPECT_TRUE(client_->complete(ask("cloud-y", "a")).ok());
    // Next token accrues in 50ms, inside the configured wait
    EXPECT_TRUE(client_->complete(ask("cloud-y", "b")).ok());
}

TEST_F(ResilientClientTest, TokenBudgetChargesPromptEstimate) {
    auto tok = config::provider_defaults(config::ProviderKind::OpenAiCompatible);
    tok.key = "tok";
    tok.base_url = "http://tok.local:8080/v1";
    tok.rate_limit_unit = "tokens";
    tok.rate_limit_per_s = 0.01;
    tok.burst_capacity = 60.0;
    tok.cache_mode = "disabled";
    config_.providers.push_back(tok);
    build();
    factory_->set_default(ScriptedReply{.body = openai_body("ok")});

    // ~25 prompt tokens each
    const std::string prompt(80, 'x');
    EXPECT_TRUE(client_->complete(ask("tok", prompt)).ok());
    EXPECT_TRUE(client_->complete(ask("tok", prompt)).ok());

    auto third = client_->complete(ask("tok", prompt));
    ASSERT_FALSE(third.ok());
    EXPECT_EQ(third.failure->kind, FailureKind::RateLimited);

    EXPECT_LT(registry_->limiter().stats("tok").current_tokens, 20.0);
}

TEST_F(ResilientClientTest, OversizedPromptIsClampedToBucketCapacity) {
    auto tok = config::provider_defaults(config::ProviderKind::OpenAiCompatible);
    tok.key = "tok";
    tok.base_url = "http://tok.local:8080/v1";
    tok.rate_limit_unit = "tokens";
    tok.rate_limit_per_s = 0.01;
    tok.burst_capacity = 10.0;
    tok.cache_mode = "disabled";
    config_.providers.push_back(tok);
    build();
    factory_->set_default(ScriptedReply{.body = openai_body("ok")});

    // Far more than 10 tokens, still admitted once against a full bucket
    EXPECT_TRUE(client_->complete(ask("tok", std::string(4000, 'x'))).ok());
}

TEST_F(ResilientClientTest, CircuitOpenRefundsRateLimitTokens) {
    provider("cloud-y").rate_limit_per_s = 0.01;
    provider("cloud-y").burst_capacity = 1.0;
    build();

    registry_->breakers().get("cloud-y").force_open();
    auto outcome = client_->complete(ask("cloud-y", "x"));
    EXPECT_EQ(outcome.failure->kind, FailureKind::CircuitOpen);

    // The single token came back, so a call is admitted once the breaker closes
    registry_->breakers().get("cloud-y").force_close();
    factory_->push_ok(openai_body("ok"));
    EXPECT_TRUE(client_->complete(ask("cloud-y", "y")).ok());
}

// ============================================================================
// Failover
// ============================================================================

TEST_F(ResilientClientTest, FailsOverToNextProviderOnUpstreamError) {
    factory_->push_status(503);
    factory_->push_ok(ollama_body("from local"));

    auto request = ask("ignored", "hello");
    request.model = "llama3";
    request.request_id = "trace-1";

    auto outcome = client_->complete_with_failover(request, {"cloud-y", "local-x"});

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->provider, "local-x");
    EXPECT_EQ(outcome.result->content, "from local");

    auto sent = factory_->sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].request_id, "trace-1");
    EXPECT_EQ(sent[1].request_id, "trace-1");
    EXPECT_EQ(sent[1].target, "/api/chat");
}

TEST_F(ResilientClientTest, FailoverSkipsOpenCircuit) {
    registry_->breakers().get("local-x").force_open();
    factory_->push_ok(openai_body("cloud answer"));

    auto outcome = client_->complete_with_failover(ask("", "hi"), {"local-x", "cloud-y"});
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->provider, "cloud-y");
    EXPECT_EQ(factory_->sends(), 1u);
}

TEST_F(ResilientClientTest, FailoverStopsOnClientError) {
    factory_->push_status(400);
    factory_->push_ok(ollama_body("never"));

    auto outcome = client_->complete_with_failover(ask("", "hi"), {"cloud-y", "local-x"});
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::ClientError);
    EXPECT_EQ(factory_->sends(), 1u);
}

TEST_F(ResilientClientTest, FailoverReturnsLastFailureWhenAllFail) {
    factory_->push_status(500);
    factory_->push_status(502);

    auto outcome = client_->complete_with_failover(ask("", "hi"), {"cloud-y", "local-x"});
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::UpstreamError);
    EXPECT_EQ(outcome.failure->http_status.value_or(0), 502);
}

TEST_F(ResilientClientTest, FailoverWithoutProvidersIsConfigError) {
    auto outcome = client_->complete_with_failover(ask("", "hi"), {});
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::ConfigError);
}

// ============================================================================
// Concurrency and statistics
// ============================================================================

TEST_F(ResilientClientTest, ConcurrentCallsShareBoundedConnections) {
    provider("cloud-y").max_connections_per_host = 2;
    build();
    factory_->set_default(ScriptedReply{.body = openai_body("ok"), .delay = 10ms});

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([this, t, &ok] {
            for (int i = 0; i < 3; ++i) {
                auto outcome = client_->complete(ask("cloud-y", "t" + std::to_string(t) + "-" + std::to_string(i)));
                if (outcome.ok()) ok.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(ok.load(), 18);
    EXPECT_LE(factory_->sessions_created(), 2u);
}

TEST_F(ResilientClientTest, StatsReportEveryProvider) {
    factory_->push_ok(ollama_body("4"));
    ASSERT_TRUE(client_->complete(ask("local-x", "2+2")).ok());
    ASSERT_TRUE(client_->complete(ask("local-x", "2+2")).ok());
    registry_->breakers().get("cloud-y").force_open();

    auto stats = client_->stats();
    ASSERT_EQ(stats.providers.size(), 2u);
    EXPECT_EQ(stats.providers[0].key, "local-x");

    const auto* local = stats.find("local-x");
    ASSERT_NE(local, nullptr);
    EXPECT_EQ(local->kind, "ollama");
    EXPECT_EQ(local->cache.hits, 1u);
    EXPECT_EQ(local->cache.entries, 1u);
    EXPECT_EQ(local->usage.calls_total, 2u);
    ASSERT_TRUE(local->pool.has_value());
    EXPECT_EQ(local->pool->available, 1u);
    EXPECT_EQ(stats.pool_counters.created, 1u);

    nlohmann::json j = stats;
    EXPECT_EQ(j["providers"][1]["key"], "cloud-y");
    EXPECT_EQ(j["providers"][1]["breaker"]["state"], "open");
    EXPECT_EQ(j["providers"][1]["breaker"]["history"].size(), 1u);
    EXPECT_EQ(j["pool"]["created"], 1);
}

TEST_F(ResilientClientTest, InvalidConfigurationRejectedAtConstruction) {
    provider("cloud-y").failure_threshold = 0;
    EXPECT_THROW(ProviderRegistry registry(config_, factory_), std::runtime_error);

    provider("cloud-y").failure_threshold = 3;
    provider("cloud-y").base_url = "https://";
    EXPECT_THROW(ProviderRegistry registry(config_, factory_), std::invalid_argument);
}
