#include <shellsage/ai/llm.hpp>
#include <shellsage/util/strings.hpp>
#include <shellsage/log/logger.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

namespace shellsage::ai {

const std::vector<ProviderInfo>& providers() {
    static const std::vector<ProviderInfo> table{
        {"local",      ProviderApi::Ollama,           "http://localhost:11434",                 "llama3:8b-instruct-q4_1"},
        {"groq",       ProviderApi::OpenAICompatible, "https://api.groq.com/openai/v1",         "llama-3.1-8b-instant"},
        {"openai",     ProviderApi::OpenAICompatible, "https://api.openai.com/v1",              "gpt-4o-mini"},
        {"fireworks",  ProviderApi::OpenAICompatible, "https://api.fireworks.ai/inference/v1",  "accounts/fireworks/models/llama-v3p1-8b-instruct"},
        {"openrouter", ProviderApi::OpenAICompatible, "https://openrouter.ai/api/v1",           "deepseek/deepseek-r1:free"},
        {"deepseek",   ProviderApi::OpenAICompatible, "https://api.deepseek.com/v1",            "deepseek-chat"},
        {"anthropic",  ProviderApi::Anthropic,        "https://api.anthropic.com/v1",           "claude-3-5-sonnet-20241022"},
        {"gemini",     ProviderApi::Gemini,           "https://generativelanguage.googleapis.com/v1beta/models", "gemini-1.5-flash"},
        {"stub",       ProviderApi::Stub,             "",                                       ""},
    };
    return table;
}

const ProviderInfo* find_provider(std::string_view name) {
    std::string lower = to_lower(name);
    for (auto &p : providers()) if (p.name == lower) return &p;
    return nullptr;
}

bool is_reasoning_model(std::string_view model) {
    std::string lower = to_lower(model);
    for (const char* k : {"deepseek", "r1", "think", "expert"}) if (contains(lower, k)) return true;
    return false;
}

std::string missing_key_message(std::string_view provider) {
    std::string env = std::string(provider) + "_API_KEY";
    for (auto &ch : env) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return "API key for " + std::string(provider) + " not set. Set " + env + " in the environment or ~/.shellsagerc";
}

std::optional<LLMCompletion> StubLLMClient::complete(const std::string& prompt, int) {
    if (m_cfg.stub_file.empty()) return gateway_error("stub", "no provider configured");
    std::ifstream in(m_cfg.stub_file);
    if (!in) return gateway_error("stub", "cannot read stub file " + m_cfg.stub_file);
    std::ostringstream oss; oss << in.rdbuf();
    logger()->debug("stub response from {} ({} prompt bytes)", m_cfg.stub_file, prompt.size());
    LLMCompletion c; c.text = oss.str(); c.source = "stub";
    return c;
}

std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg) {
    const ProviderInfo* info = find_provider(cfg.provider);
    ProviderApi api = info ? info->api : ProviderApi::Stub;
    switch (api) {
        case ProviderApi::Ollama: return std::make_unique<OllamaLLMClient>(cfg);
        case ProviderApi::OpenAICompatible: return std::make_unique<OpenAILLMClient>(cfg);
        case ProviderApi::Anthropic: return std::make_unique<ClaudeLLMClient>(cfg);
        case ProviderApi::Gemini: return std::make_unique<GeminiLLMClient>(cfg);
        case ProviderApi::Stub: break;
    }
    return std::make_unique<StubLLMClient>(cfg);
}

} // namespace shellsage::ai
