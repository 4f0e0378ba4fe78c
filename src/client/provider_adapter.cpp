/**
 * TOLLGATE - Resilient LLM Provider Client
 * Provider Adapters Implementation
 */

#include "client/provider_adapter.hpp"

#include <fmt/format.h>

namespace tollgate::client {

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxErrorSnippet = 200;

/**
 * Best-effort error text from a provider error body
 */
std::string error_detail(const std::string& body) {
    auto parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
        const auto& err = parsed["error"];
        if (err.is_string()) {
            return err.get<std::string>();
        }
        if (err.is_object() && err.contains("message") && err["message"].is_string()) {
            return err["message"].get<std::string>();
        }
    }
    if (body.size() > kMaxErrorSnippet) {
        return body.substr(0, kMaxErrorSnippet) + "...";
    }
    return body;
}

json messages_json(const std::vector<core::Message>& messages) {
    json out = json::array();
    for (const auto& m : messages) {
        out.push_back(m);
    }
    return out;
}

std::uint32_t usage_value(const json& usage, const char* field) {
    if (usage.is_object() && usage.contains(field) && usage[field].is_number_unsigned()) {
        return usage[field].get<std::uint32_t>();
    }
    return 0;
}

} // anonymous namespace

// ============================================================================
// ProviderAdapter
// ============================================================================

pool::HttpRequest ProviderAdapter::encode(const core::CompletionRequest& request,
                                          const pool::Endpoint& endpoint,
                                          const std::string& api_key) const {
    pool::HttpRequest http_request{http::verb::post, endpoint.target(path()), 11};

    http_request.set(http::field::host, endpoint.host_header());
    http_request.set(http::field::user_agent, "tollgate/1.0");
    http_request.set(http::field::content_type, "application/json");
    http_request.set(http::field::accept, "application/json");
    http_request.set(http::field::connection, "keep-alive");
    set_auth(http_request, api_key);

    http_request.body() = request_body(request).dump(-1, ' ', false, json::error_handler_t::replace);
    http_request.prepare_payload();
    return http_request;
}

core::CallResult ProviderAdapter::decode(const pool::HttpResponse& response) const {
    const int status = static_cast<int>(response.result_int());

    if (auto kind = core::classify_http_status(status)) {
        return core::CallResult::fail(core::Failure{
            .kind = *kind,
            .stage = core::Stage::Network,
            .message = fmt::format("{} returned HTTP {}: {}", name(), status, error_detail(response.body())),
            .http_status = status
        });
    }

    try {
        auto body = json::parse(response.body());
        return core::CallResult::success(parse_body(body));
    } catch (const json::exception& e) {
        return core::CallResult::fail(core::Failure{
            .kind = core::FailureKind::UpstreamError,
            .stage = core::Stage::Network,
            .message = fmt::format("Malformed {} response: {}", name(), e.what()),
            .http_status = status
        });
    }
}

void ProviderAdapter::set_auth(pool::HttpRequest& http_request, const std::string& api_key) const {
    if (!api_key.empty()) {
        http_request.set(http::field::authorization, "Bearer " + api_key);
    }
}

// ============================================================================
// OpenAiAdapter
// ============================================================================

json OpenAiAdapter::request_body(const core::CompletionRequest& request) const {
    const auto& s = request.sampling;

    json body = {
        {"model", request.model},
        {"messages", messages_json(request.messages)},
        {"stream", false}
    };
    if (s.temperature) body["temperature"] = *s.temperature;
    if (s.top_p) body["top_p"] = *s.top_p;
    if (s.max_tokens) body["max_tokens"] = *s.max_tokens;
    if (s.seed) body["seed"] = *s.seed;
    if (!s.stop.empty()) body["stop"] = s.stop;
    return body;
}

core::CompletionResult OpenAiAdapter::parse_body(const json& body) const {
    const auto& choice = body.at("choices").at(0);
    const auto& message = choice.at("message");

    core::CompletionResult result;
    result.model = body.value("model", "");
    result.content = message.at("content").is_null() ? std::string{}
                                                     : message.at("content").get<std::string>();
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        result.finish_reason = choice["finish_reason"].get<std::string>();
    }
    if (body.contains("usage")) {
        result.prompt_tokens = usage_value(body["usage"], "prompt_tokens");
        result.completion_tokens = usage_value(body["usage"], "completion_tokens");
    }
    return result;
}

// ============================================================================
// AnthropicAdapter
// ============================================================================

json AnthropicAdapter::request_body(const core::CompletionRequest& request) const {
    const auto& s = request.sampling;

    // System prompts travel in a top-level field
    std::string system;
    json messages = json::array();
    for (const auto& m : request.messages) {
        if (m.role == "system") {
            if (!system.empty()) system += "\n\n";
            system += m.content;
        } else {
            messages.push_back(m);
        }
    }

    json body = {
        {"model", request.model},
        {"messages", messages},
        {"max_tokens", s.max_tokens.value_or(kDefaultMaxTokens)}
    };
    if (!system.empty()) body["system"] = system;
    if (s.temperature) body["temperature"] = *s.temperature;
    if (s.top_p) body["top_p"] = *s.top_p;
    if (s.top_k) body["top_k"] = *s.top_k;
    if (!s.stop.empty()) body["stop_sequences"] = s.stop;
    return body;
}

void AnthropicAdapter::set_auth(pool::HttpRequest& http_request, const std::string& api_key) const {
    if (!api_key.empty()) {
        http_request.set("x-api-key", api_key);
    }
    http_request.set("anthropic-version", std::string(kApiVersion));
}

core::CompletionResult AnthropicAdapter::parse_body(const json& body) const {
    core::CompletionResult result;
    result.model = body.value("model", "");

    for (const auto& block : body.at("content")) {
        if (block.value("type", "") == "text") {
            result.content += block.at("text").get<std::string>();
        }
    }
    if (body.contains("stop_reason") && body["stop_reason"].is_string()) {
        result.finish_reason = body["stop_reason"].get<std::string>();
    }
    if (body.contains("usage")) {
        result.prompt_tokens = usage_value(body["usage"], "input_tokens");
        result.completion_tokens = usage_value(body["usage"], "output_tokens");
    }
    return result;
}

// ============================================================================
// OllamaAdapter
// ============================================================================

json OllamaAdapter::request_body(const core::CompletionRequest& request) const {
    const auto& s = request.sampling;

    json options = json::object();
    if (s.temperature) options["temperature"] = *s.temperature;
    if (s.top_p) options["top_p"] = *s.top_p;
    if (s.top_k) options["top_k"] = *s.top_k;
    if (s.seed) options["seed"] = *s.seed;
    if (s.max_tokens) options["num_predict"] = *s.max_tokens;
    if (!s.stop.empty()) options["stop"] = s.stop;

    json body = {
        {"model", request.model},
        {"messages", messages_json(request.messages)},
        {"stream", false}
    };
    if (!options.empty()) body["options"] = options;
    return body;
}

core::CompletionResult OllamaAdapter::parse_body(const json& body) const {
    core::CompletionResult result;
    result.model = body.value("model", "");
    result.content = body.at("message").at("content").get<std::string>();
    if (body.contains("done_reason") && body["done_reason"].is_string()) {
        result.finish_reason = body["done_reason"].get<std::string>();
    } else if (body.value("done", false)) {
        result.finish_reason = "stop";
    }
    result.prompt_tokens = usage_value(body, "prompt_eval_count");
    result.completion_tokens = usage_value(body, "eval_count");
    return result;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<ProviderAdapter> make_adapter(config::ProviderKind kind) {
    switch (kind) {
        case config::ProviderKind::Anthropic:
            return std::make_unique<AnthropicAdapter>();
        case config::ProviderKind::Ollama:
            return std::make_unique<OllamaAdapter>();
        case config::ProviderKind::OpenAi:
        case config::ProviderKind::Gemini:
        case config::ProviderKind::Perplexity:
        case config::ProviderKind::OpenAiCompatible:
        default:
            return std::make_unique<OpenAiAdapter>();
    }
}

} // namespace tollgate::client
