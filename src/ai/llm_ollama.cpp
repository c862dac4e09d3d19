#include <shellsage/ai/llm.hpp>
#include <shellsage/ai/http.hpp>
#include <shellsage/ai/json_text.hpp>
#include <shellsage/log/logger.hpp>
#include <sstream>

namespace shellsage::ai {

std::optional<LLMCompletion> OllamaLLMClient::complete(const std::string& prompt, int max_tokens) {
    const ProviderInfo* info = find_provider("local");
    std::string base = m_cfg.endpoint.empty() ? std::string(info->base_url) : m_cfg.endpoint;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string model = m_cfg.model.empty() ? std::string(info->default_model) : m_cfg.model;
    // Reasoning models need room for the <think> block: no stop sequences.
    std::ostringstream body;
    body << "{\"model\":\"" << escape_json(model) << "\",\"prompt\":\"" << escape_json(prompt) << "\",\"stream\":false,"
         << "\"options\":{\"temperature\":" << m_cfg.temperature << ",\"num_predict\":" << max_tokens;
    if (!is_reasoning_model(model)) body << ",\"stop\":[\"\\n\\n\\n\",\"USER QUERY:\"]";
    body << "}}";
    logger()->debug("ollama POST {}/api/generate model={} prompt={} bytes", base, model, prompt.size());
    HttpResponse r = http_post_json(base + "/api/generate", {}, body.str(), m_cfg.timeout_seconds);
    if (!r.success()) return gateway_error("ollama", "Ollama error: " + describe_http_failure(r));
    auto text = extract_json_string(r.body, "response");
    if (!text || text->empty()) return gateway_error("ollama", "Ollama error: empty response");
    LLMCompletion c; c.text = *text; c.source = "ollama";
    c.prompt_tokens = extract_json_int(r.body, "prompt_eval_count");
    c.completion_tokens = extract_json_int(r.body, "eval_count");
    if (c.prompt_tokens >= 0 && c.completion_tokens >= 0) c.total_tokens = c.prompt_tokens + c.completion_tokens;
    return c;
}

} // namespace shellsage::ai
