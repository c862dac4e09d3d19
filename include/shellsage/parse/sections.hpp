/*
 * Structured response types - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * A model response is reduced to a fixed-shape record: the reasoning fragments
 * found in the text plus one optional slot per section of the pipeline's
 * vocabulary. An absent slot means the model did not emit that section; an
 * empty string is never stored.
 */
#pragma once
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace shellsage {

enum class GenerationSection { Analysis, Command, Details, Warning };
enum class DiagnosisSection { Cause, Fix, Explanation, Risk, Prevention };

inline constexpr std::array<GenerationSection, 4> kGenerationSections{
    GenerationSection::Analysis, GenerationSection::Command,
    GenerationSection::Details, GenerationSection::Warning};

inline constexpr std::array<DiagnosisSection, 5> kDiagnosisSections{
    DiagnosisSection::Cause, DiagnosisSection::Fix, DiagnosisSection::Explanation,
    DiagnosisSection::Risk, DiagnosisSection::Prevention};

const char* section_name(GenerationSection s);
const char* section_name(DiagnosisSection s);

// Result of the command-generation pipeline.
struct GenerationResult {
    std::vector<std::string> thoughts;       // reasoning fragments, document order
    std::optional<std::string> analysis;
    std::optional<std::string> command;
    std::optional<std::string> details;
    std::optional<std::string> warning;
    bool failed = false;                     // model call failed; warning holds "Error: ..."

    std::optional<std::string>& slot(GenerationSection s);
    const std::optional<std::string>& slot(GenerationSection s) const;
};

// Result of the error-diagnosis pipeline.
struct DiagnosisResult {
    std::vector<std::string> thoughts;
    std::optional<std::string> cause;
    std::optional<std::string> fix;
    std::optional<std::string> explanation;
    std::optional<std::string> risk;
    std::optional<std::string> prevention;
    std::optional<std::string> failure;      // "Error: ..." when the model call failed

    std::optional<std::string>& slot(DiagnosisSection s);
    const std::optional<std::string>& slot(DiagnosisSection s) const;
    bool empty() const;                      // no section present
};

// One entry of the presentation contract. type is a section name or "thinking".
struct SectionRecord {
    std::string type;
    std::optional<std::string> content;
};

// Thinking records first, then sections in vocabulary order. Only present
// sections are emitted, except `command` which is always emitted. A failed
// result is exactly {warning, command(absent)}.
std::vector<SectionRecord> to_records(const GenerationResult& r);
// Thinking records first, then the present sections in vocabulary order.
std::vector<SectionRecord> to_records(const DiagnosisResult& r);

} // namespace shellsage
