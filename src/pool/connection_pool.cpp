/**
 * TOLLGATE - Resilient LLM Provider Client
 * Connection Pool - Implementation
 */

#include "pool/connection_pool.hpp"
#include "pool/http_session.hpp"
#include "util/logger.hpp"

#include <stdexcept>
#include <vector>

namespace tollgate::pool {

using util::log_component::Pool;

// ============================================================================
// PooledConnection Implementation
// ============================================================================

PooledConnection::PooledConnection(std::unique_ptr<Session> session, Endpoint endpoint,
                                   std::uint64_t id)
    : session_(std::move(session))
    , endpoint_(std::move(endpoint))
    , id_(id)
    , last_used_(Clock::now()) {
}

PooledConnection::~PooledConnection() {
    if (session_) {
        session_->close();
    }
}

bool PooledConnection::is_valid() const {
    return session_ && session_->is_open();
}

bool PooledConnection::is_idle(std::chrono::seconds max_idle, Clock::time_point now) const {
    if (in_use_) return false;
    return (now - last_used_) > max_idle;
}

void PooledConnection::mark_in_use(Clock::time_point now) {
    in_use_ = true;
    usage_count_++;
    last_used_ = now;
}

void PooledConnection::mark_returned(Clock::time_point now) {
    in_use_ = false;
    last_used_ = now;
}

PooledConnection::Clock::duration PooledConnection::idle_time(Clock::time_point now) const {
    if (in_use_) return Clock::duration::zero();
    return now - last_used_;
}

// ============================================================================
// ConnectionGuard Implementation
// ============================================================================

ConnectionGuard::ConnectionGuard(PooledConnection::Ptr conn, ReleaseFunc release_func)
    : conn_(std::move(conn))
    , release_func_(std::move(release_func)) {
}

ConnectionGuard::~ConnectionGuard() {
    release();
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : conn_(std::move(other.conn_))
    , release_func_(std::move(other.release_func_))
    , failed_(other.failed_)
    , released_(other.released_) {
    other.released_ = true;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
    if (this != &other) {
        release();
        conn_ = std::move(other.conn_);
        release_func_ = std::move(other.release_func_);
        failed_ = other.failed_;
        released_ = other.released_;
        other.released_ = true;
    }
    return *this;
}

void ConnectionGuard::release() {
    if (!released_ && conn_ && release_func_) {
        released_ = true;
        release_func_(std::move(conn_), !failed_);
    }
}

// ============================================================================
// ConnectionPool Implementation
// ============================================================================

ConnectionPool::ConnectionPool(const ConnectionPoolConfig& config,
                               std::shared_ptr<SessionFactory> factory)
    : config_(config)
    , factory_(std::move(factory))
    , reap_timer_(reaper_io_) {
    if (!factory_) {
        factory_ = std::make_shared<HttpSessionFactory>(HttpSessionConfig{
            .connect_timeout = config_.connect_timeout,
            .dns_cache_ttl = config_.dns_cache_ttl,
            .verify_tls = config_.verify_tls
        });
    }

    TOLLGATE_LOG_DEBUG(Pool, "Connection pool: max_total={}, default_per_host={}, idle={}s",
                       config_.max_total_connections,
                       config_.default_host_limits.max_connections,
                       config_.default_host_limits.idle_timeout.count());
}

ConnectionPool::~ConnectionPool() {
    stop();
}

void ConnectionPool::register_host(const Endpoint& endpoint, const HostLimits& limits) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto [it, inserted] = hosts_.try_emplace(endpoint.key());
    if (inserted) {
        it->second.limits = limits;
        TOLLGATE_LOG_INFO(Pool, "Registered host {} (max_connections={}, idle_timeout={}s)",
                          endpoint.key(), limits.max_connections, limits.idle_timeout.count());
    } else {
        TOLLGATE_LOG_DEBUG(Pool, "Host {} already registered, keeping max_connections={}",
                           endpoint.key(), it->second.limits.max_connections);
    }
}

std::optional<ConnectionGuard> ConnectionPool::acquire(const Endpoint& endpoint) {
    return acquire(endpoint, Clock::now() + config_.acquire_timeout);
}

std::optional<ConnectionGuard> ConnectionPool::acquire(const Endpoint& endpoint,
                                                       Clock::time_point deadline) {
    PooledConnection::Ptr conn;
    PooledConnection::Ptr evicted;
    std::vector<PooledConnection::Ptr> stale;   // Closed after the lock is dropped
    bool create = false;
    std::uint64_t id = 0;

    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto& host = host_pool_locked(endpoint);

        while (true) {
            // Reuse the most recently returned connection
            while (!host.available.empty()) {
                auto candidate = std::move(host.available.front());
                host.available.pop_front();

                if (candidate->is_valid()) {
                    conn = std::move(candidate);
                    break;
                }
                --host.total;
                --total_;
                ++counters_.discarded;
                stale.push_back(std::move(candidate));
            }

            if (conn) {
                ++host.in_use;
                ++counters_.reused;
                break;
            }

            if (host.total < host.limits.max_connections) {
                if (total_ < config_.max_total_connections) {
                    create = true;
                } else if ((evicted = take_idle_elsewhere_locked(host))) {
                    create = true;
                }

                if (create) {
                    ++host.total;
                    ++host.in_use;
                    ++total_;
                    ++counters_.created;
                    id = next_id_++;
                    break;
                }
            }

            if (Clock::now() >= deadline) {
                ++counters_.exhausted;
                TOLLGATE_LOG_WARN(Pool, "Connection pool exhausted for {} (host {}/{}, total {}/{})",
                                  endpoint.key(), host.total, host.limits.max_connections,
                                  total_, config_.max_total_connections);
                return std::nullopt;
            }

            slot_freed_.wait_until(lock, deadline);
        }
    }

    if (!stale.empty()) {
        slot_freed_.notify_all();
    }
    if (evicted) {
        TOLLGATE_LOG_DEBUG(Pool, "Closed idle connection to {} to make room for {}",
                           evicted->endpoint().key(), endpoint.key());
    }

    if (create) {
        try {
            auto session = factory_->create(endpoint);
            if (!session) {
                throw std::runtime_error("Session factory returned no session for " + endpoint.key());
            }
            conn = std::make_shared<PooledConnection>(std::move(session), endpoint, id);
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto& host = hosts_.at(endpoint.key());
                --host.total;
                --host.in_use;
                --total_;
            }
            slot_freed_.notify_all();
            TOLLGATE_LOG_ERROR(Pool, "Failed to create session for {}: {}", endpoint.key(), e.what());
            throw;
        }
        TOLLGATE_LOG_DEBUG(Pool, "Created connection #{} to {}", id, endpoint.key());
    }

    conn->mark_in_use(Clock::now());

    auto release_func = [this](PooledConnection::Ptr c, bool reusable) {
        release(std::move(c), reusable);
    };

    return ConnectionGuard(std::move(conn), std::move(release_func));
}

void ConnectionPool::release(PooledConnection::Ptr conn, bool reusable) {
    if (!conn) return;

    PooledConnection::Ptr discard;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = hosts_.find(conn->endpoint().key());
        if (it == hosts_.end()) {
            return;
        }
        auto& host = it->second;

        if (host.in_use > 0) {
            --host.in_use;
        }

        if (reusable && conn->is_valid()) {
            conn->mark_returned(Clock::now());
            TOLLGATE_LOG_TRACE(Pool, "Returned connection #{} to {} (available={}, in_use={})",
                               conn->id(), it->first, host.available.size() + 1, host.in_use);
            // LIFO
            host.available.push_front(std::move(conn));
        } else {
            --host.total;
            --total_;
            ++counters_.discarded;
            TOLLGATE_LOG_DEBUG(Pool, "Discarding connection #{} to {}", conn->id(), it->first);
            discard = std::move(conn);
        }
    }

    slot_freed_.notify_all();
}

std::size_t ConnectionPool::reap_idle() {
    return reap_idle_at(Clock::now());
}

std::size_t ConnectionPool::reap_idle_at(Clock::time_point now) {
    std::vector<PooledConnection::Ptr> reaped;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto& [key, host] : hosts_) {
            auto it = host.available.begin();
            while (it != host.available.end()) {
                if (!(*it)->is_valid() || (*it)->is_idle(host.limits.idle_timeout, now)) {
                    reaped.push_back(std::move(*it));
                    it = host.available.erase(it);
                    --host.total;
                    --total_;
                } else {
                    ++it;
                }
            }
        }
        counters_.reaped += reaped.size();
    }

    if (!reaped.empty()) {
        slot_freed_.notify_all();
        TOLLGATE_LOG_DEBUG(Pool, "Reaped {} idle connections", reaped.size());
    }
    return reaped.size();
}

void ConnectionPool::close_idle() {
    std::vector<PooledConnection::Ptr> closed;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, host] : hosts_) {
            host.total -= host.available.size();
            total_ -= host.available.size();
            for (auto& conn : host.available) {
                closed.push_back(std::move(conn));
            }
            host.available.clear();
        }
    }

    if (!closed.empty()) {
        slot_freed_.notify_all();
        TOLLGATE_LOG_DEBUG(Pool, "Closed {} idle connections", closed.size());
    }
}

void ConnectionPool::start() {
    if (config_.reap_interval <= std::chrono::seconds::zero()) {
        TOLLGATE_LOG_WARN(Pool, "Reap interval is {}s, idle reaper not started",
                          config_.reap_interval.count());
        return;
    }
    if (running_.exchange(true)) {
        return;  // Already running
    }

    reaper_io_.restart();
    reaper_work_.emplace(asio::make_work_guard(reaper_io_));
    schedule_reap();
    reaper_thread_ = std::jthread([this] { reaper_io_.run(); });

    TOLLGATE_LOG_INFO(Pool, "Started idle reaper (interval={}s)", config_.reap_interval.count());
}

void ConnectionPool::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    asio::post(reaper_io_, [this] { reap_timer_.cancel(); });
    reaper_work_.reset();
    if (reaper_thread_.joinable()) {
        reaper_thread_.join();
    }

    TOLLGATE_LOG_INFO(Pool, "Stopped idle reaper");
}

void ConnectionPool::schedule_reap() {
    reap_timer_.expires_after(config_.reap_interval);
    reap_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                TOLLGATE_LOG_ERROR(Pool, "Reap timer error: {}", ec.message());
            }
            return;
        }
        if (!running_) return;

        reap_idle();
        schedule_reap();
    });
}

std::optional<PoolStats> ConnectionPool::host_stats(const Endpoint& endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = hosts_.find(endpoint.key());
    if (it == hosts_.end()) {
        return std::nullopt;
    }

    return PoolStats{
        .available = it->second.available.size(),
        .in_use = it->second.in_use,
        .total = it->second.total
    };
}

PoolStats ConnectionPool::total_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats total;
    for (const auto& [key, host] : hosts_) {
        total.available += host.available.size();
        total.in_use += host.in_use;
        total.total += host.total;
    }
    return total;
}

PoolCounters ConnectionPool::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

ConnectionPool::HostPool& ConnectionPool::host_pool_locked(const Endpoint& endpoint) {
    auto [it, inserted] = hosts_.try_emplace(endpoint.key());
    if (inserted) {
        it->second.limits = config_.default_host_limits;
    }
    return it->second;
}

PooledConnection::Ptr ConnectionPool::take_idle_elsewhere_locked(const HostPool& except) {
    // The back of each idle list is that host's least recently used connection
    const auto now = Clock::now();
    HostPool* oldest = nullptr;
    for (auto& [key, host] : hosts_) {
        if (&host == &except || host.available.empty()) {
            continue;
        }
        if (!oldest || host.available.back()->idle_time(now) > oldest->available.back()->idle_time(now)) {
            oldest = &host;
        }
    }
    if (!oldest) {
        return nullptr;
    }

    auto conn = std::move(oldest->available.back());
    oldest->available.pop_back();
    --oldest->total;
    --total_;
    ++counters_.discarded;
    return conn;
}

} // namespace tollgate::pool
