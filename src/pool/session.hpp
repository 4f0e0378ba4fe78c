/**
 * TOLLGATE - Resilient LLM Provider Client
 * Session - Abstract network session handed out by the connection pool
 */

#ifndef TOLLGATE_POOL_SESSION_HPP
#define TOLLGATE_POOL_SESSION_HPP

#include "pool/endpoint.hpp"

#include <boost/beast/http.hpp>

#include <chrono>
#include <memory>

namespace tollgate::pool {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/**
 * One reusable connection to a single endpoint
 *
 * Implementations connect lazily on the first send and report transport
 * failures (including deadline expiry as beast::error::timeout) by throwing
 * boost::system::system_error. A failure during I/O closes the session. A
 * deadline that has already passed when send() is called throws
 * beast::error::timeout before any I/O and leaves the session open.
 */
class Session {
public:
    virtual ~Session() = default;

    /**
     * Send a request and read the full response, all before the deadline
     * @throws boost::system::system_error on transport failure
     */
    virtual HttpResponse send(HttpRequest& request,
                              std::chrono::steady_clock::time_point deadline) = 0;

    /**
     * False once the session has been closed or the peer ended keep-alive
     */
    virtual bool is_open() const = 0;

    virtual void close() = 0;
};

/**
 * Creates sessions for an endpoint; must be thread-safe
 */
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual std::unique_ptr<Session> create(const Endpoint& endpoint) = 0;
};

} // namespace tollgate::pool

#endif // TOLLGATE_POOL_SESSION_HPP
