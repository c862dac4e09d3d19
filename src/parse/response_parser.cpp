/*
 * ShellSage Response Parser Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <shellsage/parse/response_parser.hpp>
#include <shellsage/parse/reasoning.hpp>
#include <cctype>
#include <unordered_set>

namespace shellsage {

const std::vector<MarkerSet<GenerationSection>>& generation_markers() {
    // Glyphs with the emoji variation selector come before the bare glyph so
    // that stripping removes the whole sequence.
    static const std::vector<MarkerSet<GenerationSection>> sets = {
        {GenerationSection::Analysis, {"🧠", "Analysis:"}},
        {GenerationSection::Command,  {"🛠️", "🛠", "Command:"}},
        {GenerationSection::Details,  {"📝", "Details:"}},
        {GenerationSection::Warning,  {"⚠️", "⚠", "Warning:"}},
    };
    return sets;
}

std::string strip_tags(std::string_view text) {
    std::string out; out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '<') {
            size_t close = text.find('>', i+1);
            if (close == std::string_view::npos) { out.append(text.substr(i)); break; }
            if (close > i+1) { i = close+1; continue; } // "<x...>" removed
        }
        out.push_back(text[i++]);
    }
    return out;
}

std::string dedupe_lines(std::string_view content) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> kept;
    for (auto &line : split_lines(content)) {
        if (seen.insert(line).second) kept.push_back(line);
    }
    return join_lines(kept);
}

std::optional<std::string> finalize_section(std::string_view content) {
    std::string t = trim(content);
    if (t.empty()) return std::nullopt;
    return dedupe_lines(t);
}

std::string unwrap_code(std::string_view text) {
    std::string s = trim(text);
    size_t lead = 0; while (lead < s.size() && lead < 3 && s[lead] == '`') ++lead;
    size_t trail = 0; while (trail + lead < s.size() && trail < 3 && s[s.size()-1-trail] == '`') ++trail;
    if (lead == 0 || lead != trail) return s;
    std::string inner = s.substr(lead, s.size() - lead - trail);
    if (lead == 3) {
        // ```bash\n<command>\n```
        size_t nl = inner.find('\n');
        if (nl != std::string::npos) {
            std::string tag = trim(std::string_view(inner).substr(0, nl));
            bool is_tag = !tag.empty();
            for (char c : tag) if (!std::isalnum(static_cast<unsigned char>(c)) && c!='-' && c!='+' && c!='_') { is_tag = false; break; }
            if (is_tag) inner.erase(0, nl+1);
        }
    }
    return trim(inner);
}

GenerationResult parse_generation_response(std::string_view raw) {
    GenerationResult r;
    ReasoningSplit split = extract_reasoning(raw);
    r.thoughts = std::move(split.fragments);

    std::string cleaned = strip_tags(split.remainder);
    auto scanned = scan_sections(cleaned, generation_markers());
    for (auto &[section, text] : scanned) r.slot(section) = finalize_section(text);

    if (r.command) {
        std::string cmd = unwrap_code(*r.command);
        if (cmd.empty()) r.command.reset(); else r.command = cmd;
    }

    if (!r.thoughts.empty()) {
        // Reasoning output tends to echo the answer; run the cleanup again.
        for (auto s : kGenerationSections) {
            auto &v = r.slot(s);
            if (v) v = finalize_section(*v);
        }
    }
    return r;
}

} // namespace shellsage
