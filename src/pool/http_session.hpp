/**
 * TOLLGATE - Resilient LLM Provider Client
 * HTTP Session - Beast HTTP/1.1 session over TCP or TLS with deadline-bounded I/O
 */

#ifndef TOLLGATE_POOL_HTTP_SESSION_HPP
#define TOLLGATE_POOL_HTTP_SESSION_HPP

#include "pool/dns_cache.hpp"
#include "pool/session.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <optional>

namespace tollgate::pool {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace ssl = asio::ssl;

/**
 * Session settings shared by every session a factory creates
 */
struct HttpSessionConfig {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::seconds dns_cache_ttl{300};
    bool verify_tls{true};
};

/**
 * A single keep-alive connection to one endpoint
 *
 * Each session owns a private io_context and drives every asynchronous step
 * (resolve, connect, TLS handshake, write, read) to completion on the
 * calling thread, with the stream's expiry set to the caller's deadline.
 * Connection happens on the first send. After a transport error or a
 * response without keep-alive the session is closed for good.
 */
class HttpSession : public Session {
public:
    HttpSession(Endpoint endpoint, DnsCache& dns, ssl::context* tls_context,
                const HttpSessionConfig& config);
    ~HttpSession() override;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    HttpResponse send(HttpRequest& request,
                      std::chrono::steady_clock::time_point deadline) override;

    bool is_open() const override;
    void close() override;

    const Endpoint& endpoint() const { return endpoint_; }
    std::size_t requests_sent() const { return requests_sent_; }

private:
    using Clock = std::chrono::steady_clock;

    enum class State { Idle, Connected, Closed };

    void connect(Clock::time_point deadline);
    DnsCache::Results resolve(Clock::time_point deadline);

    template <typename Stream>
    HttpResponse exchange(Stream& stream, HttpRequest& request, Clock::time_point deadline);

    /**
     * Run queued handlers until no work is left
     */
    void run_pending();

    beast::tcp_stream& lowest_layer();

    Endpoint endpoint_;
    DnsCache& dns_;
    HttpSessionConfig config_;

    asio::io_context io_;
    std::optional<beast::tcp_stream> plain_;
    std::optional<beast::ssl_stream<beast::tcp_stream>> tls_;
    beast::flat_buffer buffer_;

    State state_{State::Idle};
    std::size_t requests_sent_{0};
};

/**
 * Default session factory: Beast sessions sharing one TLS context and DNS cache
 */
class HttpSessionFactory : public SessionFactory {
public:
    explicit HttpSessionFactory(const HttpSessionConfig& config = {});

    std::unique_ptr<Session> create(const Endpoint& endpoint) override;

    DnsCache& dns_cache() { return dns_; }

private:
    HttpSessionConfig config_;
    DnsCache dns_;
    ssl::context tls_context_;
};

} // namespace tollgate::pool

#endif // TOLLGATE_POOL_HTTP_SESSION_HPP
