#include <gtest/gtest.h>

#include "mocks/fake_session.hpp"
#include "pool/connection_pool.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace tollgate;
using namespace std::chrono_literals;
using pool::ConnectionGuard;
using pool::ConnectionPool;
using pool::ConnectionPoolConfig;
using pool::Endpoint;
using pool::HostLimits;

class ConnectionPoolTest : public ::testing::Test {
protected:
    std::shared_ptr<tollgate::testing::FakeSessionFactory> factory_ =
        std::make_shared<tollgate::testing::FakeSessionFactory>();
    ConnectionPoolConfig config_{
        .max_total_connections = 100,
        .default_host_limits = {.max_connections = 5, .idle_timeout = 300s},
        .acquire_timeout = 200ms,
        .reap_interval = 60s
    };
    Endpoint local_ = Endpoint::parse("http://localhost:11434");
    Endpoint remote_ = Endpoint::parse("https://api.example.com/v1");

    std::unique_ptr<ConnectionPool> make_pool() {
        return std::make_unique<ConnectionPool>(config_, factory_);
    }
};

// ============================================================================
// Endpoint
// ============================================================================

TEST(EndpointTest, ParsesSchemeHostPortAndPath) {
    auto ep = Endpoint::parse("https://api.openai.com/v1/");
    EXPECT_EQ(ep.scheme, "https");
    EXPECT_EQ(ep.host, "api.openai.com");
    EXPECT_EQ(ep.port, 443);
    EXPECT_EQ(ep.base_path, "/v1");
    EXPECT_TRUE(ep.tls());
    EXPECT_EQ(ep.key(), "https://api.openai.com:443");
    EXPECT_EQ(ep.host_header(), "api.openai.com");
    EXPECT_EQ(ep.target("/chat/completions"), "/v1/chat/completions");
}

TEST(EndpointTest, ExplicitPortAppearsInHostHeader) {
    auto ep = Endpoint::parse("http://localhost:11434");
    EXPECT_EQ(ep.port, 11434);
    EXPECT_EQ(ep.base_path, "");
    EXPECT_EQ(ep.host_header(), "localhost:11434");
    EXPECT_EQ(ep.target("/api/chat"), "/api/chat");
}

TEST(EndpointTest, ParsesIpv6Literal) {
    auto ep = Endpoint::parse("http://[::1]:8080/base");
    EXPECT_EQ(ep.host, "::1");
    EXPECT_EQ(ep.port, 8080);
    EXPECT_EQ(ep.base_path, "/base");
}

TEST(EndpointTest, RejectsMalformedUrls) {
    EXPECT_THROW(Endpoint::parse("localhost:8080"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("ftp://host"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("http://:8080"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("http://host:99999"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("http://host:abc"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("http://[::1"), std::invalid_argument);
}

// ============================================================================
// Reuse
// ============================================================================

TEST_F(ConnectionPoolTest, ReusesReturnedConnection) {
    auto pool = make_pool();

    std::uint64_t first_id = 0;
    {
        auto guard = pool->acquire(local_);
        ASSERT_TRUE(guard.has_value());
        first_id = (*guard)->id();
    }
    {
        auto guard = pool->acquire(local_);
        ASSERT_TRUE(guard.has_value());
        EXPECT_EQ((*guard)->id(), first_id);
        EXPECT_EQ((*guard)->usage_count(), 2u);
    }

    EXPECT_EQ(factory_->sessions_created(), 1u);
    auto counters = pool->counters();
    EXPECT_EQ(counters.created, 1u);
    EXPECT_EQ(counters.reused, 1u);
}

TEST_F(ConnectionPoolTest, MostRecentlyReturnedIsReusedFirst) {
    auto pool = make_pool();

    auto a = pool->acquire(local_);
    auto b = pool->acquire(local_);
    ASSERT_TRUE(a && b);
    const auto b_id = (*b)->id();

    a->release();
    b->release();

    auto next = pool->acquire(local_);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ((*next)->id(), b_id);
}

TEST_F(ConnectionPoolTest, FailedConnectionIsDiscarded) {
    auto pool = make_pool();
    {
        auto guard = pool->acquire(local_);
        ASSERT_TRUE(guard.has_value());
        guard->mark_failed();
    }

    auto stats = pool->host_stats(local_);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 0u);
    EXPECT_EQ(stats->available, 0u);
    EXPECT_EQ(factory_->sessions_closed(), 1u);
    EXPECT_EQ(pool->counters().discarded, 1u);

    auto fresh = pool->acquire(local_);
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(factory_->sessions_created(), 2u);
}

TEST_F(ConnectionPoolTest, ClosedIdleSessionIsSkippedOnAcquire) {
    auto pool = make_pool();
    {
        auto guard = pool->acquire(local_);
        ASSERT_TRUE(guard.has_value());
        (*guard)->session().close();   // Server hung up while idle
        guard->release();
    }
    // A closed session is not returned to the idle list
    EXPECT_EQ(pool->host_stats(local_)->available, 0u);

    auto guard = pool->acquire(local_);
    ASSERT_TRUE(guard.has_value());
    EXPECT_TRUE((*guard)->is_valid());
}

TEST_F(ConnectionPoolTest, HostsArePooledSeparately) {
    auto pool = make_pool();

    auto a = pool->acquire(local_);
    auto b = pool->acquire(remote_);
    ASSERT_TRUE(a && b);
    EXPECT_NE((*a)->id(), (*b)->id());
    EXPECT_EQ((*b)->endpoint(), remote_);

    EXPECT_EQ(pool->host_stats(local_)->in_use, 1u);
    EXPECT_EQ(pool->host_stats(remote_)->in_use, 1u);
    EXPECT_EQ(pool->total_stats().total, 2u);
}

// ============================================================================
// Limits
// ============================================================================

TEST_F(ConnectionPoolTest, SixthAcquireWaitsForRelease) {
    auto pool = make_pool();

    std::vector<ConnectionGuard> held;
    for (int i = 0; i < 5; ++i) {
        auto guard = pool->acquire(local_, ConnectionPool::Clock::now() + 50ms);
        ASSERT_TRUE(guard.has_value());
        held.push_back(std::move(*guard));
    }

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto guard = pool->acquire(local_, ConnectionPool::Clock::now() + 2s);
        acquired = guard.has_value();
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(acquired.load());
    EXPECT_EQ(pool->host_stats(local_)->total, 5u);

    held.front().release();
    waiter.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(factory_->sessions_created(), 5u);
}

TEST_F(ConnectionPoolTest, AcquireTimesOutAtLimit) {
    auto pool = make_pool();

    std::vector<ConnectionGuard> held;
    for (int i = 0; i < 5; ++i) {
        held.push_back(std::move(*pool->acquire(local_)));
    }

    auto start = ConnectionPool::Clock::now();
    auto guard = pool->acquire(local_, start + 100ms);
    EXPECT_FALSE(guard.has_value());
    EXPECT_GE(ConnectionPool::Clock::now() - start, 90ms);
    EXPECT_EQ(pool->counters().exhausted, 1u);
}

TEST_F(ConnectionPoolTest, RegisteredLimitsApplyPerHost) {
    auto pool = make_pool();
    pool->register_host(local_, HostLimits{.max_connections = 1, .idle_timeout = 300s});
    // Second registration of the same host does not override the first
    pool->register_host(local_, HostLimits{.max_connections = 10, .idle_timeout = 300s});

    auto first = pool->acquire(local_);
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(pool->acquire(local_, ConnectionPool::Clock::now() + 20ms).has_value());
}

TEST_F(ConnectionPoolTest, GlobalLimitEvictsIdleConnectionOfAnotherHost) {
    config_.max_total_connections = 2;
    auto pool = make_pool();

    {
        auto a = pool->acquire(remote_);
        auto b = pool->acquire(remote_);
        ASSERT_TRUE(a && b);
    }
    ASSERT_EQ(pool->host_stats(remote_)->available, 2u);

    auto local = pool->acquire(local_, ConnectionPool::Clock::now() + 50ms);
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(pool->host_stats(remote_)->total, 1u);
    EXPECT_EQ(pool->total_stats().total, 2u);
}

TEST_F(ConnectionPoolTest, GlobalLimitEvictsLongestIdleAcrossHosts) {
    config_.max_total_connections = 2;
    auto pool = make_pool();
    auto other = Endpoint::parse("https://api.other.example.com");

    pool->acquire(remote_).reset();
    std::this_thread::sleep_for(20ms);
    pool->acquire(other).reset();

    auto local = pool->acquire(local_, ConnectionPool::Clock::now() + 50ms);
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(pool->host_stats(remote_)->total, 0u);
    EXPECT_EQ(pool->host_stats(other)->total, 1u);
}

TEST_F(ConnectionPoolTest, GlobalLimitBlocksWhenNothingIdle) {
    config_.max_total_connections = 1;
    auto pool = make_pool();

    auto a = pool->acquire(remote_);
    ASSERT_TRUE(a.has_value());
    EXPECT_FALSE(pool->acquire(local_, ConnectionPool::Clock::now() + 20ms).has_value());
}

TEST_F(ConnectionPoolTest, ConcurrentCheckoutsRespectHostLimit) {
    auto pool = make_pool();
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto guard = pool->acquire(local_, ConnectionPool::Clock::now() + 2s);
                if (!guard) {
                    failures.fetch_add(1);
                    continue;
                }
                int now = in_flight.fetch_add(1) + 1;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(1ms);
                in_flight.fetch_sub(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_LE(peak.load(), 5);
    EXPECT_LE(factory_->sessions_created(), 5u);
    EXPECT_EQ(pool->host_stats(local_)->in_use, 0u);
}

// ============================================================================
// Idle reaping
// ============================================================================

TEST_F(ConnectionPoolTest, ReapsConnectionsIdlePastTimeout) {
    auto pool = make_pool();
    pool->register_host(local_, HostLimits{.max_connections = 5, .idle_timeout = 10s});
    {
        auto guard = pool->acquire(local_);
        ASSERT_TRUE(guard.has_value());
    }

    const auto now = ConnectionPool::Clock::now();
    EXPECT_EQ(pool->reap_idle_at(now + 5s), 0u);
    EXPECT_EQ(pool->reap_idle_at(now + 11s), 1u);

    EXPECT_EQ(pool->host_stats(local_)->total, 0u);
    EXPECT_EQ(pool->counters().reaped, 1u);
    EXPECT_EQ(factory_->sessions_closed(), 1u);
}

TEST_F(ConnectionPoolTest, ReaperNeverTouchesCheckedOutConnections) {
    auto pool = make_pool();
    pool->register_host(local_, HostLimits{.max_connections = 5, .idle_timeout = 1s});

    auto guard = pool->acquire(local_);
    ASSERT_TRUE(guard.has_value());
    EXPECT_EQ(pool->reap_idle_at(ConnectionPool::Clock::now() + 1h), 0u);
    EXPECT_TRUE((*guard)->is_valid());
}

TEST_F(ConnectionPoolTest, CloseIdleEmptiesEveryHost) {
    auto pool = make_pool();
    {
        auto a = pool->acquire(local_);
        auto b = pool->acquire(remote_);
    }
    pool->close_idle();

    EXPECT_EQ(pool->total_stats().total, 0u);
    EXPECT_EQ(factory_->sessions_closed(), 2u);
}

TEST_F(ConnectionPoolTest, StartAndStopReaper) {
    auto pool = make_pool();
    pool->start();
    EXPECT_TRUE(pool->running());
    pool->stop();
    EXPECT_FALSE(pool->running());
    // Idempotent
    pool->stop();
}

// ============================================================================
// Session creation failures
// ============================================================================

namespace {

class ThrowingFactory : public pool::SessionFactory {
public:
    std::unique_ptr<pool::Session> create(const Endpoint&) override {
        throw std::runtime_error("resolve failed");
    }
};

} // namespace

TEST_F(ConnectionPoolTest, FactoryFailureReleasesSlot) {
    ConnectionPool pool(config_, std::make_shared<ThrowingFactory>());

    EXPECT_THROW(pool.acquire(local_), std::runtime_error);
    auto stats = pool.host_stats(local_);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 0u);
    EXPECT_EQ(stats->in_use, 0u);
}
