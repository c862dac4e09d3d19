#include <shellsage/ai/llm.hpp>
#include <shellsage/ai/http.hpp>
#include <shellsage/ai/json_text.hpp>
#include <shellsage/log/logger.hpp>
#include <sstream>

namespace shellsage::ai {

std::optional<LLMCompletion> ClaudeLLMClient::complete(const std::string& prompt, int max_tokens) {
    const ProviderInfo* info = find_provider("anthropic");
    if (m_cfg.api_key.empty()) return gateway_error("anthropic", missing_key_message("anthropic"));
    std::string base = m_cfg.endpoint.empty() ? std::string(info->base_url) : m_cfg.endpoint;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string model = m_cfg.model.empty() ? std::string(info->default_model) : m_cfg.model;
    std::ostringstream body;
    body << "{\"model\":\"" << escape_json(model) << "\",\"max_tokens\":" << max_tokens
         << ",\"temperature\":" << m_cfg.temperature
         << ",\"messages\":[{\"role\":\"user\",\"content\":\"" << escape_json(prompt) << "\"}]}";
    logger()->debug("anthropic POST {}/messages model={} prompt={} bytes", base, model, prompt.size());
    HttpResponse r = http_post_json(base + "/messages",
                                    {"x-api-key: " + m_cfg.api_key, "anthropic-version: 2023-06-01"},
                                    body.str(), m_cfg.timeout_seconds);
    if (!r.success()) return gateway_error("anthropic", "API Error (anthropic): " + describe_http_failure(r));
    // content[0].text
    size_t content = r.body.find("\"content\"");
    std::optional<std::string> text;
    if (content != std::string::npos) text = extract_json_string(r.body, "text", content);
    if (!text || text->empty()) return gateway_error("anthropic", "API Error (anthropic): empty response");
    LLMCompletion c; c.text = *text; c.source = "anthropic";
    c.prompt_tokens = extract_json_int(r.body, "input_tokens");
    c.completion_tokens = extract_json_int(r.body, "output_tokens");
    if (c.prompt_tokens >= 0 && c.completion_tokens >= 0) c.total_tokens = c.prompt_tokens + c.completion_tokens;
    return c;
}

} // namespace shellsage::ai
