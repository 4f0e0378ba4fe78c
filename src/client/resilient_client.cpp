/**
 * TOLLGATE - Resilient LLM Provider Client
 * Resilient Client Implementation
 */

#include "client/resilient_client.hpp"
#include "util/logger.hpp"

#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/format.h>

#include <algorithm>

namespace tollgate::client {

using util::log_component::Client;
using core::CallResult;
using core::Failure;
using core::FailureKind;
using core::Stage;

namespace {

std::chrono::milliseconds elapsed_since(core::Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(core::Clock::now() - start);
}

CallResult failure(FailureKind kind, Stage stage, std::string message) {
    return CallResult::fail(Failure{
        .kind = kind,
        .stage = stage,
        .message = std::move(message)
    });
}

} // anonymous namespace

ResilientClient::ResilientClient(ProviderRegistry& registry)
    : registry_(registry) {
}

CallResult ResilientClient::complete(const core::CompletionRequest& request) {
    const auto start = Clock::now();
    util::RequestContext context(request.request_id.empty() ? util::RequestContext::current_id()
                                                            : request.request_id);
    bool cache_hit = false;

    auto* entry = registry_.find(request.provider);
    if (!entry) {
        auto outcome = failure(FailureKind::ConfigError, Stage::Config,
                               "Unknown provider: " + request.provider);
        outcome.latency = elapsed_since(start);
        log_call(request, outcome, false);
        return outcome;
    }

    entry->metrics.call_started();

    CallResult outcome;
    try {
        outcome = run_pipeline(*entry, request, start, cache_hit);
    } catch (const std::exception& e) {
        TOLLGATE_LOG_ERROR(Client, "Unexpected error calling {}: {}", request.provider, e.what());
        outcome = failure(FailureKind::UpstreamError, Stage::Network,
                          std::string("Unexpected error: ") + e.what());
    }
    outcome.latency = elapsed_since(start);

    if (outcome.ok()) {
        const auto& r = *outcome.result;
        if (cache_hit) {
            entry->metrics.call_succeeded(outcome.latency, 0, 0, 0, 0.0);
        } else {
            entry->metrics.call_succeeded(outcome.latency, r.prompt_tokens, r.completion_tokens,
                                          r.estimated_prompt_tokens, r.estimated_cost);
        }
    } else {
        entry->metrics.call_failed(outcome.failure->kind, outcome.latency);
    }

    log_call(request, outcome, cache_hit);
    return outcome;
}

CallResult ResilientClient::complete_with_failover(const core::CompletionRequest& request,
                                                   const std::vector<core::ProviderKey>& providers) {
    if (providers.empty()) {
        return failure(FailureKind::ConfigError, Stage::Config, "No providers given for failover");
    }

    // One request id across every attempt
    util::RequestContext context(request.request_id.empty() ? util::RequestContext::current_id()
                                                            : request.request_id);

    core::CompletionRequest attempt = request;
    attempt.request_id = context.id();

    CallResult last;
    for (std::size_t i = 0; i < providers.size(); ++i) {
        attempt.provider = providers[i];
        last = complete(attempt);

        if (last.ok()) {
            return last;
        }

        const auto kind = last.failure->kind;
        if (!core::should_failover(kind)) {
            TOLLGATE_LOG_DEBUG(Client, "{} failed with {}, not failing over",
                               providers[i], core::to_string(kind));
            return last;
        }
        if (i + 1 < providers.size()) {
            TOLLGATE_LOG_INFO(Client, "{} failed with {}, failing over to {}",
                              providers[i], core::to_string(kind), providers[i + 1]);
        }
    }

    TOLLGATE_LOG_WARN(Client, "All {} providers failed", providers.size());
    return last;
}

CallResult ResilientClient::run_pipeline(ProviderEntry& entry,
                                         const core::CompletionRequest& request,
                                         Clock::time_point start,
                                         bool& cache_hit) {
    const auto& key = request.provider;
    const auto deadline = request.deadline.value_or(
        start + std::chrono::milliseconds(entry.settings.request_timeout_ms));

    // 1. Cache
    std::optional<cache::CacheKey> cache_key;
    if (entry.policy.enabled() && entry.policy.is_cacheable(request)) {
        cache_key = cache::generate_cache_key(request);
        if (auto cached = lookup_cache(entry, *cache_key)) {
            entry.metrics.cache_hit();
            cache_hit = true;
            cached->provider = key;
            return CallResult::success(std::move(*cached));
        }
        entry.metrics.cache_miss();
    }

    const auto estimate = entry.tokens.estimate(request.messages, request.model);
    if (estimate.exceeds_context) {
        TOLLGATE_LOG_WARN(Client, "{}: ~{} prompt tokens exceed the {} context window of {}",
                          key, estimate.token_count, estimate.context_window, request.model);
    }

    if (Clock::now() >= deadline) {
        return failure(FailureKind::Timeout, Stage::RateLimiter,
                       "Deadline expired before admission to " + key);
    }

    // 2. Rate limiter
    auto& limiter = registry_.limiter();
    double tokens = 1.0;
    if (entry.settings.limits_tokens()) {
        tokens = std::clamp(static_cast<double>(estimate.token_count), 1.0,
                            std::max(1.0, limiter.capacity(key)));
    }

    const auto wait_deadline = std::min(
        deadline, Clock::now() + std::chrono::milliseconds(entry.settings.rate_limit_wait_ms));
    if (!limiter.try_acquire_until(key, tokens, wait_deadline)) {
        if (Clock::now() >= deadline) {
            return failure(FailureKind::Timeout, Stage::RateLimiter,
                           "Deadline expired waiting for rate limit on " + key);
        }
        return failure(FailureKind::RateLimited, Stage::RateLimiter,
                       fmt::format("Rate limit exceeded for {} ({} {})",
                                   key, tokens, entry.settings.rate_limit_unit));
    }

    // 3. Circuit breaker
    if (Clock::now() >= deadline) {
        limiter.refund(key, tokens);
        return failure(FailureKind::Timeout, Stage::CircuitBreaker,
                       "Deadline expired before breaker admission for " + key);
    }

    auto& breaker = registry_.breakers().get(key);
    if (!breaker.allow_request()) {
        limiter.refund(key, tokens);
        return failure(FailureKind::CircuitOpen, Stage::CircuitBreaker,
                       "Circuit open for " + key);
    }

    // 4. Connection
    auto& connections = registry_.pool();
    const auto acquire_deadline = std::min(deadline, Clock::now() + connections.config().acquire_timeout);

    std::optional<pool::ConnectionGuard> guard;
    try {
        guard = connections.acquire(entry.endpoint, acquire_deadline);
    } catch (const std::exception& e) {
        breaker.release();
        limiter.refund(key, tokens);
        return failure(FailureKind::UpstreamError, Stage::Pool,
                       fmt::format("Could not open session to {}: {}", entry.endpoint.key(), e.what()));
    }

    if (!guard) {
        breaker.release();
        limiter.refund(key, tokens);
        if (Clock::now() >= deadline) {
            return failure(FailureKind::Timeout, Stage::Pool,
                           "Deadline expired waiting for a connection to " + entry.endpoint.key());
        }
        return failure(FailureKind::PoolExhausted, Stage::Pool,
                       "No connection available for " + entry.endpoint.key());
    }

    // Nothing has been sent yet, so an expired caller costs the provider nothing
    auto abandon = [&](Stage stage) {
        guard->release();
        breaker.release();
        limiter.refund(key, tokens);
        return failure(FailureKind::Timeout, stage,
                       "Deadline expired before sending to " + entry.endpoint.key());
    };

    if (Clock::now() >= deadline) {
        return abandon(Stage::Pool);
    }

    // Network call
    CallResult outcome;
    try {
        auto http_request = entry.adapter->encode(request, entry.endpoint, entry.api_key);
        http_request.set("X-Request-ID", util::RequestContext::current_id());

        entry.metrics.network_call();
        auto response = (*guard)->session().send(http_request, deadline);
        outcome = entry.adapter->decode(response);

    } catch (const boost::system::system_error& e) {
        if (e.code() == boost::beast::error::timeout && (*guard)->session().is_open()) {
            return abandon(Stage::Network);
        }
        guard->mark_failed();
        const bool timed_out = e.code() == boost::beast::error::timeout || Clock::now() >= deadline;
        outcome = failure(timed_out ? FailureKind::Timeout : FailureKind::UpstreamError, Stage::Network,
                          fmt::format("{} {}: {}", entry.endpoint.key(),
                                      timed_out ? "timed out" : "transport error", e.code().message()));

    } catch (const std::exception& e) {
        guard->mark_failed();
        outcome = failure(FailureKind::UpstreamError, Stage::Network,
                          fmt::format("{} transport error: {}", entry.endpoint.key(), e.what()));
    }

    // 5. Release, record, store
    guard->release();

    if (outcome.ok()) {
        breaker.record_success();
        finish_result(entry, request, estimate.token_count, *outcome.result);
        if (cache_key) {
            store_cache(entry, *cache_key, request, *outcome.result);
        }
    } else {
        breaker.record_failure(outcome.failure->kind);
    }

    return outcome;
}

std::optional<core::CompletionResult> ResilientClient::lookup_cache(ProviderEntry& entry,
                                                                    const cache::CacheKey& key) const {
    auto cached = entry.cache.get(key);
    if (!cached) {
        return std::nullopt;
    }

    try {
        auto result = nlohmann::json::parse(cached->payload).get<core::CompletionResult>();
        result.from_cache = true;
        return result;
    } catch (const nlohmann::json::exception& e) {
        TOLLGATE_LOG_WARN(util::log_component::Cache, "{}: dropping unreadable entry {}: {}",
                          entry.settings.key, key.to_string(), e.what());
        entry.cache.discard(key, cached->generation);
        return std::nullopt;
    }
}

void ResilientClient::store_cache(ProviderEntry& entry, const cache::CacheKey& key,
                                  const core::CompletionRequest& request,
                                  const core::CompletionResult& result) const {
    auto payload = nlohmann::json(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    entry.cache.put(key, payload, entry.policy.ttl_for(request));
}

void ResilientClient::finish_result(ProviderEntry& entry, const core::CompletionRequest& request,
                                    std::uint32_t estimated_prompt_tokens,
                                    core::CompletionResult& result) const {
    result.provider = request.provider;
    if (result.model.empty()) {
        result.model = request.model;
    }
    result.estimated_prompt_tokens = estimated_prompt_tokens;
    result.from_cache = false;

    // Prefer reported usage for pricing
    const auto input = result.prompt_tokens > 0 ? result.prompt_tokens : estimated_prompt_tokens;
    const auto output = result.completion_tokens > 0
        ? result.completion_tokens
        : entry.tokens.estimate_text(result.content, request.model);
    result.estimated_cost = entry.tokens.estimate_cost(input, output, request.model);
}

void ResilientClient::log_call(const core::CompletionRequest& request, const CallResult& outcome,
                               bool cache_hit) const {
    util::CallLogEntry log_entry;
    log_entry.request_id = util::RequestContext::current_id();
    log_entry.provider = request.provider;
    log_entry.model = request.model;
    log_entry.latency = outcome.latency;
    log_entry.cache_hit = cache_hit;

    if (outcome.ok()) {
        const auto& r = *outcome.result;
        log_entry.outcome = "ok";
        log_entry.stage = "-";
        log_entry.prompt_tokens = r.prompt_tokens > 0 ? r.prompt_tokens : r.estimated_prompt_tokens;
        log_entry.completion_tokens = r.completion_tokens;
        log_entry.estimated_cost = cache_hit ? 0.0 : r.estimated_cost;
    } else {
        const auto& f = *outcome.failure;
        log_entry.outcome = std::string(core::to_string(f.kind));
        log_entry.stage = std::string(core::to_string(f.stage));
        log_entry.http_status = f.http_status.value_or(0);
        TOLLGATE_LOG_DEBUG(Client, "{}", f.to_string());
    }

    util::Logger::instance().call(log_entry);
}

ClientStats ResilientClient::stats() const {
    ClientStats stats;
    const auto& connections = registry_.pool();

    for (const auto& key : registry_.keys()) {
        const auto& entry = registry_.get(key);
        stats.providers.push_back(ProviderStats{
            .key = key,
            .kind = std::string(config::to_string(entry.settings.kind)),
            .endpoint = entry.endpoint.key(),
            .pool = connections.host_stats(entry.endpoint),
            .limiter = registry_.limiter().stats(key),
            .breaker = registry_.breakers().get(key).stats(),
            .cache = entry.cache.get_stats(),
            .usage = entry.metrics.snapshot()
        });
    }

    stats.pool_total = connections.total_stats();
    stats.pool_counters = connections.counters();
    return stats;
}

} // namespace tollgate::client
