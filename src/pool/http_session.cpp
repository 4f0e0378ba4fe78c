/**
 * TOLLGATE - Resilient LLM Provider Client
 * HTTP Session Implementation
 */

#include "pool/http_session.hpp"
#include "util/logger.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <stdexcept>

namespace tollgate::pool {

using util::log_component::Transport;

// ============================================================================
// HttpSession Implementation
// ============================================================================

HttpSession::HttpSession(Endpoint endpoint, DnsCache& dns, ssl::context* tls_context,
                         const HttpSessionConfig& config)
    : endpoint_(std::move(endpoint))
    , dns_(dns)
    , config_(config) {
    if (endpoint_.tls()) {
        if (tls_context == nullptr) {
            throw std::invalid_argument("TLS endpoint " + endpoint_.key() + " needs an SSL context");
        }
        tls_.emplace(io_, *tls_context);
    } else {
        plain_.emplace(io_);
    }
}

HttpSession::~HttpSession() {
    close();
}

HttpResponse HttpSession::send(HttpRequest& request, Clock::time_point deadline) {
    if (state_ == State::Closed) {
        throw beast::system_error{asio::error::not_connected};
    }
    if (Clock::now() >= deadline) {
        throw beast::system_error{beast::error::timeout};
    }

    try {
        if (state_ == State::Idle) {
            connect(deadline);
        }

        HttpResponse response = tls_ ? exchange(*tls_, request, deadline)
                                     : exchange(*plain_, request, deadline);
        ++requests_sent_;

        if (!response.keep_alive()) {
            TOLLGATE_LOG_TRACE(Transport, "{} closed keep-alive after {} requests",
                               endpoint_.key(), requests_sent_);
            close();
        }
        return response;

    } catch (const beast::system_error& e) {
        TOLLGATE_LOG_DEBUG(Transport, "Session to {} failed: {}", endpoint_.key(), e.code().message());
        close();
        throw;
    }
}

bool HttpSession::is_open() const {
    switch (state_) {
        case State::Idle:
            return true;
        case State::Connected:
            return tls_ ? tls_->next_layer().socket().is_open()
                        : plain_->socket().is_open();
        case State::Closed:
        default:
            return false;
    }
}

void HttpSession::close() {
    if (state_ == State::Closed) {
        return;
    }

    if (state_ == State::Connected) {
        auto& socket = lowest_layer().socket();
        if (socket.is_open()) {
            boost::system::error_code ec;
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    }
    state_ = State::Closed;
}

void HttpSession::connect(Clock::time_point deadline) {
    auto connect_deadline = std::min(deadline, Clock::now() + config_.connect_timeout);
    auto results = resolve(connect_deadline);

    auto& stream = lowest_layer();
    beast::error_code ec;

    stream.expires_at(connect_deadline);
    stream.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) {
        ec = e;
    });
    run_pending();

    if (ec) {
        dns_.invalidate(endpoint_.host, endpoint_.port);
        throw beast::system_error{ec};
    }

    // Disable Nagle's algorithm
    stream.socket().set_option(tcp::no_delay(true), ec);
    if (ec) {
        TOLLGATE_LOG_DEBUG(Transport, "Could not set TCP_NODELAY on {}: {}", endpoint_.key(), ec.message());
    }

    if (tls_) {
        // SNI
        if (!SSL_set_tlsext_host_name(tls_->native_handle(), endpoint_.host.c_str())) {
            throw beast::system_error{beast::error_code(static_cast<int>(::ERR_get_error()),
                                                        asio::error::get_ssl_category())};
        }
        if (config_.verify_tls) {
            tls_->set_verify_callback(ssl::host_name_verification(endpoint_.host));
        }

        stream.expires_at(connect_deadline);
        tls_->async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) {
            ec = e;
        });
        run_pending();

        if (ec) {
            throw beast::system_error{ec};
        }
    }

    stream.expires_never();
    state_ = State::Connected;
    TOLLGATE_LOG_DEBUG(Transport, "Connected to {}{}", endpoint_.key(), tls_ ? " (tls)" : "");
}

DnsCache::Results HttpSession::resolve(Clock::time_point deadline) {
    if (auto cached = dns_.lookup(endpoint_.host, endpoint_.port)) {
        return *cached;
    }

    tcp::resolver resolver(io_);
    beast::error_code ec;
    DnsCache::Results results;
    bool done = false;

    resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
        [&](beast::error_code e, tcp::resolver::results_type r) {
            ec = e;
            results = std::move(r);
            done = true;
        });

    io_.restart();
    io_.run_until(deadline);

    if (!done) {
        resolver.cancel();
        run_pending();
        throw beast::system_error{beast::error::timeout};
    }
    if (ec) {
        throw beast::system_error{ec};
    }

    dns_.store(endpoint_.host, endpoint_.port, results);
    return results;
}

template <typename Stream>
HttpResponse HttpSession::exchange(Stream& stream, HttpRequest& request, Clock::time_point deadline) {
    beast::error_code ec;

    lowest_layer().expires_at(deadline);
    http::async_write(stream, request, [&ec](beast::error_code e, std::size_t) {
        ec = e;
    });
    run_pending();
    if (ec) {
        throw beast::system_error{ec};
    }

    HttpResponse response;
    http::async_read(stream, buffer_, response, [&ec](beast::error_code e, std::size_t) {
        ec = e;
    });
    run_pending();
    if (ec) {
        throw beast::system_error{ec};
    }

    lowest_layer().expires_never();
    return response;
}

void HttpSession::run_pending() {
    io_.restart();
    io_.run();
}

beast::tcp_stream& HttpSession::lowest_layer() {
    return tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
}

// ============================================================================
// HttpSessionFactory Implementation
// ============================================================================

HttpSessionFactory::HttpSessionFactory(const HttpSessionConfig& config)
    : config_(config)
    , dns_(config.dns_cache_ttl)
    , tls_context_(ssl::context::tls_client) {
    boost::system::error_code ec;
    tls_context_.set_default_verify_paths(ec);
    if (ec) {
        TOLLGATE_LOG_WARN(Transport, "Could not load default CA paths: {}", ec.message());
    }
    tls_context_.set_verify_mode(config_.verify_tls ? ssl::verify_peer : ssl::verify_none);
}

std::unique_ptr<Session> HttpSessionFactory::create(const Endpoint& endpoint) {
    return std::make_unique<HttpSession>(endpoint, dns_,
                                         endpoint.tls() ? &tls_context_ : nullptr, config_);
}

} // namespace tollgate::pool
