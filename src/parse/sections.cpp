/*
 * Structured response types implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/parse/sections.hpp>

namespace shellsage {

const char* section_name(GenerationSection s) {
    switch (s) {
        case GenerationSection::Analysis: return "analysis";
        case GenerationSection::Command: return "command";
        case GenerationSection::Details: return "details";
        case GenerationSection::Warning: return "warning";
    }
    return "unknown";
}

const char* section_name(DiagnosisSection s) {
    switch (s) {
        case DiagnosisSection::Cause: return "cause";
        case DiagnosisSection::Fix: return "fix";
        case DiagnosisSection::Explanation: return "explanation";
        case DiagnosisSection::Risk: return "risk";
        case DiagnosisSection::Prevention: return "prevention";
    }
    return "unknown";
}

std::optional<std::string>& GenerationResult::slot(GenerationSection s) {
    switch (s) {
        case GenerationSection::Analysis: return analysis;
        case GenerationSection::Command: return command;
        case GenerationSection::Details: return details;
        case GenerationSection::Warning: break;
    }
    return warning;
}

const std::optional<std::string>& GenerationResult::slot(GenerationSection s) const {
    return const_cast<GenerationResult*>(this)->slot(s);
}

std::optional<std::string>& DiagnosisResult::slot(DiagnosisSection s) {
    switch (s) {
        case DiagnosisSection::Cause: return cause;
        case DiagnosisSection::Fix: return fix;
        case DiagnosisSection::Explanation: return explanation;
        case DiagnosisSection::Risk: return risk;
        case DiagnosisSection::Prevention: break;
    }
    return prevention;
}

const std::optional<std::string>& DiagnosisResult::slot(DiagnosisSection s) const {
    return const_cast<DiagnosisResult*>(this)->slot(s);
}

bool DiagnosisResult::empty() const {
    for (auto s : kDiagnosisSections) if (slot(s)) return false;
    return true;
}

std::vector<SectionRecord> to_records(const GenerationResult& r) {
    std::vector<SectionRecord> out;
    if (r.failed) return {{"warning", r.warning}, {"command", std::nullopt}};
    for (auto &t : r.thoughts) out.push_back({"thinking", t});
    for (auto s : kGenerationSections) {
        auto &v = r.slot(s);
        if (v || s == GenerationSection::Command) out.push_back({section_name(s), v});
    }
    return out;
}

std::vector<SectionRecord> to_records(const DiagnosisResult& r) {
    std::vector<SectionRecord> out;
    for (auto &t : r.thoughts) out.push_back({"thinking", t});
    for (auto s : kDiagnosisSections) {
        if (auto &v = r.slot(s)) out.push_back({section_name(s), v});
    }
    return out;
}

} // namespace shellsage
