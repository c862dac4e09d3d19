/*
 * ShellSage Response Parser
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Turns free-form model output into a GenerationResult. The text goes through
 *   reasoning extraction, stray tag removal and a single left-to-right pass over
 *   its lines. A cursor remembers the section the last marker line opened;
 *   unmarked lines continue that section. Every section is then cleared of
 *   repeated lines (first occurrence wins) and empty sections become absent.
 *   Malformed input is never an error: the worst case is a result with no
 *   sections at all.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <shellsage/parse/sections.hpp>
#include <shellsage/util/strings.hpp>

namespace shellsage {

template <typename Section>
struct MarkerSet {
    Section section;
    std::vector<std::string> markers; // glyphs and/or textual labels
};

// Marker sets of the generation vocabulary, in matching order.
const std::vector<MarkerSet<GenerationSection>>& generation_markers();

// Delete every <...> tag-like substring.
std::string strip_tags(std::string_view text);

// Drop lines that repeat an earlier line, keeping the first occurrence and
// the relative order of the rest.
std::string dedupe_lines(std::string_view content);

// Trim, dedupe; nullopt when nothing is left.
std::optional<std::string> finalize_section(std::string_view content);

// Remove inline-code backticks (and a fenced block's language tag).
std::string unwrap_code(std::string_view text);

// Line scan over `text` using `vocabulary` (tested in order). Returns the raw
// content of every section a marker opened; content may still be empty.
template <typename Section>
std::map<Section, std::string> scan_sections(std::string_view text,
                                             const std::vector<MarkerSet<Section>>& vocabulary) {
    std::map<Section, std::string> content;
    std::optional<Section> current;
    for (auto &raw : split_lines(text)) {
        std::string line = trim(raw);
        if (line.empty()) continue;
        const MarkerSet<Section>* hit = nullptr;
        for (auto &set : vocabulary) {
            for (auto &m : set.markers) if (contains(line, m)) { hit = &set; break; }
            if (hit) break;
        }
        if (hit) {
            current = hit->section;
            for (auto &m : hit->markers) replace_all(line, m, "");
            content[hit->section] = trim(line); // a repeated marker resets the section
            continue;
        }
        if (!current) continue;
        auto &slot = content[*current];
        if (slot.empty()) slot = line; else slot += "\n" + line;
    }
    return content;
}

GenerationResult parse_generation_response(std::string_view raw);

} // namespace shellsage
