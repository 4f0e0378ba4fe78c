/**
 * TOLLGATE - Resilient LLM Provider Client
 * Endpoint - Parsed provider base URL
 */

#ifndef TOLLGATE_POOL_ENDPOINT_HPP
#define TOLLGATE_POOL_ENDPOINT_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace tollgate::pool {

/**
 * Scheme, host, port and path prefix of a provider's base URL
 */
struct Endpoint {
    std::string scheme{"http"};
    std::string host;
    std::uint16_t port{80};
    std::string base_path;   // No trailing slash, may be empty

    bool tls() const { return scheme == "https"; }

    /**
     * Pool key, "scheme://host:port"
     */
    std::string key() const;

    /**
     * Value for the Host header (port omitted when default for the scheme)
     */
    std::string host_header() const;

    /**
     * base_path joined with a request path
     */
    std::string target(std::string_view path) const;

    bool operator==(const Endpoint&) const = default;

    /**
     * Parse an http:// or https:// URL
     * @throws std::invalid_argument on malformed input
     */
    static Endpoint parse(std::string_view url);
};

} // namespace tollgate::pool

#endif // TOLLGATE_POOL_ENDPOINT_HPP
