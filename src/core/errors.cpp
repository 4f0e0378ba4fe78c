/**
 * TOLLGATE - Resilient LLM Provider Client
 * Failure Taxonomy Implementation
 */

#include "core/errors.hpp"

#include <fmt/format.h>

namespace tollgate::core {

std::string_view to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::PoolExhausted: return "pool_exhausted";
        case FailureKind::RateLimited:   return "rate_limited";
        case FailureKind::CircuitOpen:   return "circuit_open";
        case FailureKind::UpstreamError: return "upstream_error";
        case FailureKind::ClientError:   return "client_error";
        case FailureKind::Timeout:       return "timeout";
        case FailureKind::ConfigError:   return "config_error";
        default:                         return "unknown";
    }
}

std::string_view to_string(Stage stage) {
    switch (stage) {
        case Stage::Config:         return "config";
        case Stage::Cache:          return "cache";
        case Stage::RateLimiter:    return "rate_limiter";
        case Stage::CircuitBreaker: return "circuit_breaker";
        case Stage::Pool:           return "pool";
        case Stage::Network:        return "network";
        default:                    return "unknown";
    }
}

std::string Failure::to_string() const {
    if (http_status) {
        return fmt::format("{} at {} (HTTP {}): {}",
                           core::to_string(kind), core::to_string(stage), *http_status, message);
    }
    return fmt::format("{} at {}: {}", core::to_string(kind), core::to_string(stage), message);
}

bool is_transient(FailureKind kind) {
    switch (kind) {
        case FailureKind::PoolExhausted:
        case FailureKind::RateLimited:
        case FailureKind::CircuitOpen:
        case FailureKind::UpstreamError:
        case FailureKind::Timeout:
            return true;
        default:
            return false;
    }
}

bool should_failover(FailureKind kind) {
    // Same set as transient: a different provider may well answer
    return is_transient(kind);
}

bool counts_against_breaker(FailureKind kind) {
    return kind == FailureKind::UpstreamError || kind == FailureKind::Timeout;
}

std::optional<FailureKind> classify_http_status(int status) {
    if (status >= 200 && status < 300) {
        return std::nullopt;
    }
    if (status == 429) {
        return FailureKind::RateLimited;
    }
    if (status == 408 || status >= 500) {
        return FailureKind::UpstreamError;
    }
    if (status >= 400) {
        return FailureKind::ClientError;
    }
    // 1xx/3xx are not expected from a completion endpoint
    return FailureKind::UpstreamError;
}

} // namespace tollgate::core
