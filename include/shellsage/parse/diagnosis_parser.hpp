/*
 * Diagnosis response parser - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <shellsage/parse/sections.hpp>

namespace shellsage {

struct DiagnosisLabel {
    DiagnosisSection section;
    std::string label;   // lower-case label text, e.g. "root cause"
};

const std::vector<DiagnosisLabel>& diagnosis_labels();

// Drop blank lines, markdown bold markers and leading "1. " list numbering.
std::string normalize_diagnosis_text(std::string_view text);

// Segments start at a known label (optionally glyph-prefixed, optionally
// followed by ':') and run to the next known label or the end of the text.
// Only the first occurrence of each label is kept.
DiagnosisResult parse_diagnosis_response(std::string_view raw);

} // namespace shellsage
