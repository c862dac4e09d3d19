/*
 * Error diagnosis pipeline - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string_view>
#include <shellsage/ai/llm.hpp>
#include <shellsage/context/error_context.hpp>
#include <shellsage/parse/sections.hpp>

namespace shellsage {

// failure = "Error: <message>", no sections.
DiagnosisResult diagnosis_failure(std::string_view message);

class ErrorAnalyzer {
public:
    static constexpr int kMaxTokens = 1024;

    explicit ErrorAnalyzer(ai::LLMClient& llm) : m_llm(llm) {}

    DiagnosisResult analyze(const ErrorContext& ctx);

private:
    ai::LLMClient& m_llm;
};

} // namespace shellsage
