/**
 * TOLLGATE - Resilient LLM Provider Client
 * Failure Taxonomy - Typed call failures tagged with the stage that produced them
 */

#ifndef TOLLGATE_CORE_ERRORS_HPP
#define TOLLGATE_CORE_ERRORS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tollgate::core {

/**
 * Failure kinds surfaced to callers of the resilient client
 */
enum class FailureKind : std::uint8_t {
    PoolExhausted,   // No connection slot became free before the deadline
    RateLimited,     // Local bucket empty, or upstream answered 429
    CircuitOpen,     // Provider currently considered unhealthy
    UpstreamError,   // Transport failure, 5xx, 408 or malformed response
    ClientError,     // Request rejected by upstream as malformed (4xx)
    Timeout,         // Caller deadline expired
    ConfigError      // Unknown provider key or unusable configuration
};

constexpr std::size_t kFailureKindCount = 7;

/**
 * Pipeline stage that produced a failure
 */
enum class Stage : std::uint8_t {
    Config,
    Cache,
    RateLimiter,
    CircuitBreaker,
    Pool,
    Network
};

std::string_view to_string(FailureKind kind);
std::string_view to_string(Stage stage);

/**
 * A typed failure returned instead of a result
 */
struct Failure {
    FailureKind kind{FailureKind::UpstreamError};
    Stage stage{Stage::Network};
    std::string message;
    std::optional<int> http_status;

    std::string to_string() const;
};

/**
 * Transient failures may succeed if retried later against the same provider
 */
bool is_transient(FailureKind kind);

/**
 * Failures after which trying the next provider is worthwhile
 */
bool should_failover(FailureKind kind);

/**
 * Only genuine upstream failures are counted by the circuit breaker
 */
bool counts_against_breaker(FailureKind kind);

/**
 * Classify an HTTP status returned by a provider.
 * Returns nullopt for 2xx.
 */
std::optional<FailureKind> classify_http_status(int status);

} // namespace tollgate::core

#endif // TOLLGATE_CORE_ERRORS_HPP
