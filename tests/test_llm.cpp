#include <gtest/gtest.h>
#include <shellsage/ai/llm.hpp>
#include <cstdio>
#include <fstream>

using namespace shellsage::ai;

TEST(Llm, ProviderTable) {
    auto groq = find_provider("GROQ");
    ASSERT_NE(groq, nullptr);
    EXPECT_EQ(groq->api, ProviderApi::OpenAICompatible);
    EXPECT_EQ(groq->base_url, "https://api.groq.com/openai/v1");
    EXPECT_EQ(find_provider("openrouter")->base_url, "https://openrouter.ai/api/v1");
    EXPECT_EQ(find_provider("local")->api, ProviderApi::Ollama);
    EXPECT_EQ(find_provider("anthropic")->api, ProviderApi::Anthropic);
    EXPECT_EQ(find_provider("gemini")->api, ProviderApi::Gemini);
    EXPECT_EQ(find_provider("huggingface"), nullptr);
}

TEST(Llm, ReasoningModelDetection) {
    EXPECT_TRUE(is_reasoning_model("deepseek-r1:8b"));
    EXPECT_TRUE(is_reasoning_model("qwq-Thinker"));
    EXPECT_TRUE(is_reasoning_model("expert-coder"));
    EXPECT_FALSE(is_reasoning_model("llama3:8b-instruct-q4_1"));
}

TEST(Llm, StubWithoutFileFails) {
    LLMConfig cfg; cfg.provider = "stub";
    auto llm = make_llm(cfg);
    auto c = llm->complete("prompt", 512);
    ASSERT_TRUE(c.has_value());
    EXPECT_FALSE(c->ok());
    EXPECT_EQ(c->error, "no provider configured");
}

TEST(Llm, StubReplaysFile) {
    std::string path = ::testing::TempDir() + "shellsage_stub.txt";
    { std::ofstream(path) << "🛠️ Command: ls\n"; }
    LLMConfig cfg; cfg.provider = "stub"; cfg.stub_file = path;
    auto c = make_llm(cfg)->complete("anything", 10);
    ASSERT_TRUE(c.has_value());
    EXPECT_TRUE(c->ok());
    EXPECT_EQ(c->text, "🛠️ Command: ls\n");
    EXPECT_EQ(c->source, "stub");
    std::remove(path.c_str());
}

TEST(Llm, UnknownProviderFallsBackToStub) {
    LLMConfig cfg; cfg.provider = "nonexistent";
    auto c = make_llm(cfg)->complete("p", 1);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->error, "no provider configured");
}

TEST(Llm, MissingApiKeyReportedWithoutNetwork) {
    for (const char* provider : {"groq", "anthropic", "gemini"}) {
        LLMConfig cfg; cfg.provider = provider;
        auto c = make_llm(cfg)->complete("p", 16);
        ASSERT_TRUE(c.has_value());
        EXPECT_FALSE(c->ok());
        EXPECT_NE(c->error.find("API key for " + std::string(provider) + " not set"), std::string::npos);
    }
    EXPECT_NE(missing_key_message("openrouter").find("OPENROUTER_API_KEY"), std::string::npos);
}
