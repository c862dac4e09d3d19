#include <shellsage/ai/llm.hpp>
#include <shellsage/ai/http.hpp>
#include <shellsage/ai/json_text.hpp>
#include <shellsage/log/logger.hpp>
#include <sstream>

namespace shellsage::ai {

std::optional<LLMCompletion> OpenAILLMClient::complete(const std::string& prompt, int max_tokens) {
    const ProviderInfo* info = find_provider(m_cfg.provider);
    if (!info) info = find_provider("openai");
    std::string source(info->name);
    if (m_cfg.api_key.empty()) return gateway_error(source, missing_key_message(info->name));
    std::string base = m_cfg.endpoint.empty() ? std::string(info->base_url) : m_cfg.endpoint;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string model = m_cfg.model.empty() ? std::string(info->default_model) : m_cfg.model;
    std::ostringstream body;
    body << "{\"model\":\"" << escape_json(model) << "\","
         << "\"messages\":[{\"role\":\"user\",\"content\":\"" << escape_json(prompt) << "\"}],"
         << "\"temperature\":" << m_cfg.temperature << ",\"max_tokens\":" << max_tokens << "}";
    logger()->debug("{} POST {}/chat/completions model={} prompt={} bytes", source, base, model, prompt.size());
    HttpResponse r = http_post_json(base + "/chat/completions", {"Authorization: Bearer " + m_cfg.api_key},
                                    body.str(), m_cfg.timeout_seconds);
    if (!r.success()) return gateway_error(source, "API Error (" + source + "): " + describe_http_failure(r));
    // choices[0].message.content
    size_t choices = r.body.find("\"choices\"");
    std::optional<std::string> text;
    if (choices != std::string::npos) text = extract_json_string(r.body, "content", choices);
    if (!text || text->empty()) return gateway_error(source, "API Error (" + source + "): empty response");
    LLMCompletion c; c.text = *text; c.source = source;
    c.prompt_tokens = extract_json_int(r.body, "prompt_tokens");
    c.completion_tokens = extract_json_int(r.body, "completion_tokens");
    c.total_tokens = extract_json_int(r.body, "total_tokens");
    return c;
}

} // namespace shellsage::ai
