/**
 * TOLLGATE - Resilient LLM Provider Client
 * Connection Pool - Reuse provider sessions under per-host and global limits
 */

#ifndef TOLLGATE_POOL_CONNECTION_POOL_HPP
#define TOLLGATE_POOL_CONNECTION_POOL_HPP

#include "pool/endpoint.hpp"
#include "pool/session.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace tollgate::pool {

namespace asio = boost::asio;

/**
 * Limits for a single host
 */
struct HostLimits {
    std::size_t max_connections{20};
    std::chrono::seconds idle_timeout{300};
};

/**
 * Configuration for the connection pool
 */
struct ConnectionPoolConfig {
    std::size_t max_total_connections{100};         // Global ceiling across hosts
    HostLimits default_host_limits;                 // For hosts never registered
    std::chrono::seconds dns_cache_ttl{300};
    std::chrono::milliseconds acquire_timeout{30000};
    std::chrono::seconds reap_interval{60};
    std::chrono::milliseconds connect_timeout{10000};
    bool verify_tls{true};
};

/**
 * A pooled session bound to one endpoint
 */
class PooledConnection {
public:
    using Ptr = std::shared_ptr<PooledConnection>;
    using Clock = std::chrono::steady_clock;

    PooledConnection(std::unique_ptr<Session> session, Endpoint endpoint, std::uint64_t id);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Session& session() { return *session_; }
    const Endpoint& endpoint() const { return endpoint_; }
    std::uint64_t id() const { return id_; }

    /**
     * Check if the session can still carry requests
     */
    bool is_valid() const;

    /**
     * Check if connection has been idle longer than max_idle
     */
    bool is_idle(std::chrono::seconds max_idle, Clock::time_point now) const;

    void mark_in_use(Clock::time_point now);
    void mark_returned(Clock::time_point now);

    Clock::duration idle_time(Clock::time_point now) const;

    /**
     * How many times this connection has been checked out
     */
    std::size_t usage_count() const { return usage_count_; }

private:
    std::unique_ptr<Session> session_;
    Endpoint endpoint_;
    std::uint64_t id_;
    Clock::time_point last_used_;
    std::size_t usage_count_{0};
    bool in_use_{false};
};

/**
 * RAII wrapper for checked-out connections
 * Returns the connection to the pool on destruction
 */
class ConnectionGuard {
public:
    using ReleaseFunc = std::function<void(PooledConnection::Ptr, bool)>;

    ConnectionGuard(PooledConnection::Ptr conn, ReleaseFunc release_func);
    ~ConnectionGuard();

    // Move-only
    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;
    ConnectionGuard(ConnectionGuard&& other) noexcept;
    ConnectionGuard& operator=(ConnectionGuard&& other) noexcept;

    PooledConnection& operator*() { return *conn_; }
    PooledConnection* operator->() { return conn_.get(); }

    /**
     * Mark connection as failed (discarded instead of returned)
     */
    void mark_failed() { failed_ = true; }

    /**
     * Release early (returns to pool or discards)
     */
    void release();

    explicit operator bool() const { return conn_ != nullptr; }

private:
    PooledConnection::Ptr conn_;
    ReleaseFunc release_func_;
    bool failed_{false};
    bool released_{false};
};

/**
 * Pool counters for one host or for the whole pool
 */
struct PoolStats {
    std::size_t available{0};
    std::size_t in_use{0};
    std::size_t total{0};
};

/**
 * Lifetime counters
 */
struct PoolCounters {
    std::uint64_t created{0};
    std::uint64_t reused{0};
    std::uint64_t discarded{0};
    std::uint64_t reaped{0};
    std::uint64_t exhausted{0};   // Acquisitions that hit their deadline
};

/**
 * Connection pool for every provider host
 *
 * Features:
 * - LIFO reuse of idle sessions per host
 * - Per-host and global connection ceilings; callers block until a slot
 *   frees up or their deadline passes
 * - Idle sessions of other hosts are closed to make room at the global limit
 * - Background reaper for sessions idle past their host's timeout
 * - RAII-based checkout via ConnectionGuard
 *
 * Guards must not outlive the pool.
 */
class ConnectionPool {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param config Pool configuration
     * @param factory Session factory, defaults to HttpSessionFactory
     */
    explicit ConnectionPool(const ConnectionPoolConfig& config = {},
                            std::shared_ptr<SessionFactory> factory = nullptr);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * Set limits for a host; the first registration of a host wins
     */
    void register_host(const Endpoint& endpoint, const HostLimits& limits);

    /**
     * Check out a connection, waiting until the deadline for a free slot
     * @return Guard, or nullopt when the deadline passed first
     */
    std::optional<ConnectionGuard> acquire(const Endpoint& endpoint, Clock::time_point deadline);

    /**
     * Check out a connection using the configured acquire timeout
     */
    std::optional<ConnectionGuard> acquire(const Endpoint& endpoint);

    /**
     * Close idle connections past their host's idle timeout
     * @return Number of connections closed
     */
    std::size_t reap_idle();
    std::size_t reap_idle_at(Clock::time_point now);

    /**
     * Close every idle connection
     */
    void close_idle();

    /**
     * Start / stop the background reaper
     */
    void start();
    void stop();
    bool running() const { return running_.load(); }

    std::optional<PoolStats> host_stats(const Endpoint& endpoint) const;
    PoolStats total_stats() const;
    PoolCounters counters() const;

    const ConnectionPoolConfig& config() const { return config_; }

private:
    struct HostPool {
        HostLimits limits;
        std::deque<PooledConnection::Ptr> available;   // Front is most recently returned
        std::size_t in_use{0};
        std::size_t total{0};
    };

    HostPool& host_pool_locked(const Endpoint& endpoint);

    /**
     * Pop one idle connection from any host other than `except`
     */
    PooledConnection::Ptr take_idle_elsewhere_locked(const HostPool& except);

    void release(PooledConnection::Ptr conn, bool reusable);

    void schedule_reap();

    ConnectionPoolConfig config_;
    std::shared_ptr<SessionFactory> factory_;

    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    std::unordered_map<std::string, HostPool> hosts_;
    std::size_t total_{0};
    std::uint64_t next_id_{1};
    PoolCounters counters_;

    // Reaper
    asio::io_context reaper_io_;
    asio::steady_timer reap_timer_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> reaper_work_;
    std::jthread reaper_thread_;
    std::atomic<bool> running_{false};
};

} // namespace tollgate::pool

#endif // TOLLGATE_POOL_CONNECTION_POOL_HPP
