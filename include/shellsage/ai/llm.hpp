#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <memory>

namespace shellsage::ai {

enum class ProviderApi { Ollama, OpenAICompatible, Anthropic, Gemini, Stub };

struct ProviderInfo {
    std::string_view name;           // value of ACTIVE_API_PROVIDER / "local"
    ProviderApi api;
    std::string_view base_url;       // default endpoint base
    std::string_view default_model;
};

// Known backends. "local" is the Ollama server, "stub" replays a file.
const std::vector<ProviderInfo>& providers();
const ProviderInfo* find_provider(std::string_view name);

struct LLMConfig {
    std::string provider = "local"; // local, groq, openai, anthropic, fireworks, openrouter, deepseek, gemini, stub
    std::string model;               // model id (empty -> provider default)
    std::string endpoint;            // base URL override (OLLAMA_HOST for local)
    std::string api_key;             // resolved key; never logged
    std::string stub_file;           // canned response file for the stub backend
    double temperature = 0.1;
    int timeout_seconds = 60;        // libcurl transfer timeout
};

// Response from a completion call. A non-empty error means the call failed.
struct LLMCompletion {
    std::string text;                // raw model text
    std::string source;              // ollama|openai|anthropic|gemini|stub
    std::string error;               // transport/HTTP/auth failure message
    int prompt_tokens = -1;
    int completion_tokens = -1;
    int total_tokens = -1;

    bool ok() const { return error.empty(); }
};

inline LLMCompletion gateway_error(std::string source, std::string message) {
    LLMCompletion c; c.source = std::move(source); c.error = std::move(message); return c;
}

class LLMClient {
public:
    virtual ~LLMClient() = default;
    // nullopt is treated like a failure by callers.
    virtual std::optional<LLMCompletion> complete(const std::string& prompt, int max_tokens) = 0;
};

// Replays stub_file (whole content) for offline use and tests.
class StubLLMClient : public LLMClient {
public:
    explicit StubLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& prompt, int max_tokens) override;
private:
    LLMConfig m_cfg;
};

// Local Ollama server, POST {endpoint}/api/generate.
class OllamaLLMClient : public LLMClient {
public:
    explicit OllamaLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& prompt, int max_tokens) override;
private:
    LLMConfig m_cfg;
};

// OpenAI chat completions and compatible hosts (groq, fireworks, openrouter, deepseek).
class OpenAILLMClient : public LLMClient {
public:
    explicit OpenAILLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& prompt, int max_tokens) override;
private:
    LLMConfig m_cfg;
};

// Anthropic messages API.
class ClaudeLLMClient : public LLMClient {
public:
    explicit ClaudeLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& prompt, int max_tokens) override;
private:
    LLMConfig m_cfg;
};

// Google generateContent API.
class GeminiLLMClient : public LLMClient {
public:
    explicit GeminiLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& prompt, int max_tokens) override;
private:
    LLMConfig m_cfg;
};

// "API key for groq not set. Set GROQ_API_KEY ..."
std::string missing_key_message(std::string_view provider);

// Model names that emit <think> blocks (deepseek, r1, think, expert).
bool is_reasoning_model(std::string_view model);

// Picks the backend named by cfg.provider; unknown names fall back to the stub.
std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg);

} // namespace shellsage::ai
