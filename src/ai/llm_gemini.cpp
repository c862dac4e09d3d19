#include <shellsage/ai/llm.hpp>
#include <shellsage/ai/http.hpp>
#include <shellsage/ai/json_text.hpp>
#include <shellsage/log/logger.hpp>
#include <sstream>

namespace shellsage::ai {

std::optional<LLMCompletion> GeminiLLMClient::complete(const std::string& prompt, int max_tokens) {
    const ProviderInfo* info = find_provider("gemini");
    if (m_cfg.api_key.empty()) return gateway_error("gemini", missing_key_message("gemini"));
    std::string base = m_cfg.endpoint.empty() ? std::string(info->base_url) : m_cfg.endpoint;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string model = m_cfg.model.empty() ? std::string(info->default_model) : m_cfg.model;
    std::ostringstream body;
    body << "{\"contents\":[{\"parts\":[{\"text\":\"" << escape_json(prompt) << "\"}]}],"
         << "\"generationConfig\":{\"temperature\":" << m_cfg.temperature << ",\"maxOutputTokens\":" << max_tokens << "}}";
    std::string url = base + "/" + model + ":generateContent";
    logger()->debug("gemini POST {} prompt={} bytes", url, prompt.size());
    HttpResponse r = http_post_json(url, {"x-goog-api-key: " + m_cfg.api_key}, body.str(), m_cfg.timeout_seconds);
    if (!r.success()) return gateway_error("gemini", "API Error (gemini): " + describe_http_failure(r));
    // candidates[0].content.parts[0].text
    size_t candidates = r.body.find("\"candidates\"");
    std::optional<std::string> text;
    if (candidates != std::string::npos) text = extract_json_string(r.body, "text", candidates);
    if (!text || text->empty()) return gateway_error("gemini", "API Error (gemini): empty response");
    LLMCompletion c; c.text = *text; c.source = "gemini";
    c.prompt_tokens = extract_json_int(r.body, "promptTokenCount");
    c.completion_tokens = extract_json_int(r.body, "candidatesTokenCount");
    c.total_tokens = extract_json_int(r.body, "totalTokenCount");
    return c;
}

} // namespace shellsage::ai
