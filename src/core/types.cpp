/**
 * TOLLGATE - Resilient LLM Provider Client
 * Core Types Implementation
 */

#include "core/types.hpp"

namespace tollgate::core {

void to_json(nlohmann::json& j, const Message& m) {
    j = nlohmann::json{
        {"role", m.role},
        {"content", m.content}
    };
}

void from_json(const nlohmann::json& j, Message& m) {
    if (j.contains("role")) j.at("role").get_to(m.role);
    if (j.contains("content") && j.at("content").is_string()) j.at("content").get_to(m.content);
}

// from_cache is never stored; the cache reader sets it
void to_json(nlohmann::json& j, const CompletionResult& r) {
    j = nlohmann::json{
        {"provider", r.provider},
        {"model", r.model},
        {"content", r.content},
        {"finish_reason", r.finish_reason},
        {"prompt_tokens", r.prompt_tokens},
        {"completion_tokens", r.completion_tokens},
        {"estimated_prompt_tokens", r.estimated_prompt_tokens},
        {"estimated_cost", r.estimated_cost}
    };
}

void from_json(const nlohmann::json& j, CompletionResult& r) {
    if (j.contains("provider")) j.at("provider").get_to(r.provider);
    if (j.contains("model")) j.at("model").get_to(r.model);
    if (j.contains("content")) j.at("content").get_to(r.content);
    if (j.contains("finish_reason")) j.at("finish_reason").get_to(r.finish_reason);
    if (j.contains("prompt_tokens")) j.at("prompt_tokens").get_to(r.prompt_tokens);
    if (j.contains("completion_tokens")) j.at("completion_tokens").get_to(r.completion_tokens);
    if (j.contains("estimated_prompt_tokens")) j.at("estimated_prompt_tokens").get_to(r.estimated_prompt_tokens);
    if (j.contains("estimated_cost")) j.at("estimated_cost").get_to(r.estimated_cost);
}

} // namespace tollgate::core
