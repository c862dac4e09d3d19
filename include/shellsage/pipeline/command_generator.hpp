/*
 * Command generation pipeline - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <string_view>
#include <shellsage/ai/llm.hpp>
#include <shellsage/context/error_context.hpp>
#include <shellsage/parse/sections.hpp>

namespace shellsage {

// warning = "Error: <message>", every other section absent.
GenerationResult generation_failure(std::string_view message);

// query -> prompt -> one model call -> parse -> safety filter.
class CommandGenerator {
public:
    static constexpr int kMaxTokens = 512;

    explicit CommandGenerator(ai::LLMClient& llm) : m_llm(llm) {}

    GenerationResult generate(const std::string& query, const GenerationContext& ctx);

private:
    ai::LLMClient& m_llm;
};

} // namespace shellsage
