#pragma once
#include <shellsage/ai/llm.hpp>
#include <optional>
#include <string>

// Scripted LLMClient: returns `reply` and records the last request.
class FakeLLM : public shellsage::ai::LLMClient {
public:
    std::optional<shellsage::ai::LLMCompletion> reply;
    std::string last_prompt;
    int last_max_tokens = 0;
    int calls = 0;

    static FakeLLM answering(const std::string& text) {
        FakeLLM f; shellsage::ai::LLMCompletion c; c.text = text; c.source = "fake"; f.reply = c; return f;
    }
    static FakeLLM failing(const std::string& error) {
        FakeLLM f; f.reply = shellsage::ai::gateway_error("fake", error); return f;
    }

    std::optional<shellsage::ai::LLMCompletion> complete(const std::string& prompt, int max_tokens) override {
        ++calls; last_prompt = prompt; last_max_tokens = max_tokens;
        return reply;
    }
};
