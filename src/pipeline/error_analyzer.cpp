/*
 * Error diagnosis pipeline implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/pipeline/error_analyzer.hpp>
#include <shellsage/pipeline/prompt_builder.hpp>
#include <shellsage/parse/diagnosis_parser.hpp>
#include <shellsage/log/logger.hpp>

namespace shellsage {

DiagnosisResult diagnosis_failure(std::string_view message) {
    DiagnosisResult r;
    r.failure = "Error: " + std::string(message);
    return r;
}

DiagnosisResult ErrorAnalyzer::analyze(const ErrorContext& ctx) {
    std::string prompt = build_diagnosis_prompt(ctx);
    logger()->debug("diagnosis prompt: {} bytes", prompt.size());
    auto completion = m_llm.complete(prompt, kMaxTokens);
    if (!completion) {
        logger()->warn("model call failed: no response");
        return diagnosis_failure("no response");
    }
    if (!completion->ok()) {
        logger()->warn("model call failed: {}", completion->error);
        return diagnosis_failure(completion->error);
    }
    logger()->debug("{} response: {} bytes", completion->source, completion->text.size());
    DiagnosisResult r = parse_diagnosis_response(completion->text);
    logger()->debug("diagnosis: {} reasoning fragment(s), fix {}", r.thoughts.size(), r.fix ? "present" : "absent");
    return r;
}

} // namespace shellsage
