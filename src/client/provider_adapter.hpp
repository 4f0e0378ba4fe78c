/**
 * TOLLGATE - Resilient LLM Provider Client
 * Provider Adapters - Map completion requests onto each provider's HTTP API
 */

#ifndef TOLLGATE_CLIENT_PROVIDER_ADAPTER_HPP
#define TOLLGATE_CLIENT_PROVIDER_ADAPTER_HPP

#include "config/config.hpp"
#include "core/types.hpp"
#include "pool/endpoint.hpp"
#include "pool/session.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace tollgate::client {

/**
 * Encodes requests for and decodes responses from one wire protocol
 */
class ProviderAdapter {
public:
    virtual ~ProviderAdapter() = default;

    virtual std::string_view name() const = 0;

    /**
     * Build the HTTP request for a completion call
     */
    pool::HttpRequest encode(const core::CompletionRequest& request,
                             const pool::Endpoint& endpoint,
                             const std::string& api_key) const;

    /**
     * Turn an HTTP response into a result or a classified failure
     *
     * Non-2xx statuses are classified by status code; a 2xx response whose
     * body cannot be parsed is an UpstreamError.
     */
    core::CallResult decode(const pool::HttpResponse& response) const;

protected:
    virtual std::string path() const = 0;
    virtual nlohmann::json request_body(const core::CompletionRequest& request) const = 0;
    virtual void set_auth(pool::HttpRequest& http_request, const std::string& api_key) const;

    /**
     * Extract the result from a 2xx body
     * @throws nlohmann::json::exception when required fields are missing
     */
    virtual core::CompletionResult parse_body(const nlohmann::json& body) const = 0;
};

/**
 * OpenAI chat completions (also Gemini, Perplexity and compatible servers)
 */
class OpenAiAdapter : public ProviderAdapter {
public:
    std::string_view name() const override { return "openai"; }

protected:
    std::string path() const override { return "/chat/completions"; }
    nlohmann::json request_body(const core::CompletionRequest& request) const override;
    core::CompletionResult parse_body(const nlohmann::json& body) const override;
};

/**
 * Anthropic messages API
 */
class AnthropicAdapter : public ProviderAdapter {
public:
    static constexpr std::string_view kApiVersion = "2023-06-01";
    static constexpr std::uint32_t kDefaultMaxTokens = 1024;

    std::string_view name() const override { return "anthropic"; }

protected:
    std::string path() const override { return "/v1/messages"; }
    nlohmann::json request_body(const core::CompletionRequest& request) const override;
    void set_auth(pool::HttpRequest& http_request, const std::string& api_key) const override;
    core::CompletionResult parse_body(const nlohmann::json& body) const override;
};

/**
 * Ollama native chat API
 */
class OllamaAdapter : public ProviderAdapter {
public:
    std::string_view name() const override { return "ollama"; }

protected:
    std::string path() const override { return "/api/chat"; }
    nlohmann::json request_body(const core::CompletionRequest& request) const override;
    core::CompletionResult parse_body(const nlohmann::json& body) const override;
};

/**
 * Adapter for a provider kind
 */
std::unique_ptr<ProviderAdapter> make_adapter(config::ProviderKind kind);

} // namespace tollgate::client

#endif // TOLLGATE_CLIENT_PROVIDER_ADAPTER_HPP
