/*
 * Command generation pipeline implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/pipeline/command_generator.hpp>
#include <shellsage/pipeline/prompt_builder.hpp>
#include <shellsage/parse/response_parser.hpp>
#include <shellsage/safety/safety_filter.hpp>
#include <shellsage/log/logger.hpp>

namespace shellsage {

GenerationResult generation_failure(std::string_view message) {
    GenerationResult r;
    r.failed = true;
    r.warning = "Error: " + std::string(message);
    return r;
}

GenerationResult CommandGenerator::generate(const std::string& query, const GenerationContext& ctx) {
    std::string prompt = build_generation_prompt(query, ctx);
    logger()->debug("generation prompt: {} bytes", prompt.size());
    auto completion = m_llm.complete(prompt, kMaxTokens);
    if (!completion) {
        logger()->warn("model call failed: no response");
        return generation_failure("no response");
    }
    if (!completion->ok()) {
        logger()->warn("model call failed: {}", completion->error);
        return generation_failure(completion->error);
    }
    logger()->debug("{} response: {} bytes", completion->source, completion->text.size());
    GenerationResult parsed = parse_generation_response(completion->text);
    logger()->debug("parsed: {} reasoning fragment(s), command {}", parsed.thoughts.size(), parsed.command ? "present" : "absent");
    SafetyVerdict verdict = evaluate_safety(query, ctx.os, parsed);
    if (verdict.kind == SafetyVerdict::Kind::Replaced)
        logger()->debug("safety filter replaced '{}' with '{}': {}", parsed.command.value_or(""), verdict.new_command, verdict.reason);
    return apply_safety_filter(query, ctx.os, std::move(parsed));
}

} // namespace shellsage
