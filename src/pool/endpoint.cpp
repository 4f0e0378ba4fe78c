/**
 * TOLLGATE - Resilient LLM Provider Client
 * Endpoint Implementation
 */

#include "pool/endpoint.hpp"

#include <charconv>
#include <stdexcept>

namespace tollgate::pool {

std::string Endpoint::key() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::string Endpoint::host_header() const {
    const bool default_port = (tls() && port == 443) || (!tls() && port == 80);
    return default_port ? host : host + ":" + std::to_string(port);
}

std::string Endpoint::target(std::string_view path) const {
    std::string result = base_path;
    if (path.empty() || path.front() != '/') {
        result.push_back('/');
    }
    result.append(path);
    return result;
}

Endpoint Endpoint::parse(std::string_view url) {
    Endpoint ep;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        throw std::invalid_argument("URL has no scheme: " + std::string(url));
    }
    ep.scheme = std::string(url.substr(0, scheme_end));
    if (ep.scheme != "http" && ep.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + ep.scheme);
    }
    ep.port = ep.tls() ? 443 : 80;

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos) {
        auto path = rest.substr(path_start);
        while (!path.empty() && path.back() == '/') {
            path.remove_suffix(1);
        }
        ep.base_path = std::string(path);
    }

    // Bracketed IPv6 literal: [::1]:8080
    std::string_view host_part = authority;
    std::string_view port_part;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw std::invalid_argument("Malformed IPv6 host in URL: " + std::string(url));
        }
        host_part = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_part = authority.substr(close + 2);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host_part = authority.substr(0, colon);
        port_part = authority.substr(colon + 1);
    }

    if (host_part.empty()) {
        throw std::invalid_argument("URL has no host: " + std::string(url));
    }
    ep.host = std::string(host_part);

    if (!port_part.empty()) {
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), port);
        if (ec != std::errc{} || ptr != port_part.data() + port_part.size() || port == 0 || port > 65535) {
            throw std::invalid_argument("Invalid port in URL: " + std::string(url));
        }
        ep.port = static_cast<std::uint16_t>(port);
    }

    return ep;
}

} // namespace tollgate::pool
