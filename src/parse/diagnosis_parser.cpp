/*
 * Diagnosis response parser implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/parse/diagnosis_parser.hpp>
#include <shellsage/parse/reasoning.hpp>
#include <shellsage/parse/response_parser.hpp>
#include <shellsage/util/strings.hpp>
#include <algorithm>
#include <cctype>
#include <set>

namespace shellsage {

namespace {

struct LabelHit {
    size_t begin;          // first byte of the marker (glyph included)
    size_t content_begin;  // first byte after label and optional ':'
    DiagnosisSection section;
};

// Glyphs the model may put in front of a label.
const std::vector<std::string>& all_glyphs() {
    static const std::vector<std::string> glyphs = {"🔍", "🛠️", "🛠", "📚", "⚠️", "⚠", "🔒"};
    return glyphs;
}

bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

// Only whitespace, bullets and glyphs between the last newline and pos.
bool at_line_start(const std::string& text, size_t pos) {
    size_t line_begin = text.rfind('\n', pos == 0 ? 0 : pos - 1);
    line_begin = (line_begin == std::string::npos || pos == 0) ? 0 : line_begin + 1;
    std::string prefix = text.substr(line_begin, pos - line_begin);
    for (auto &g : all_glyphs()) replace_all(prefix, g, "");
    for (char c : prefix) {
        if (std::isspace(static_cast<unsigned char>(c)) || c=='-' || c=='*' || c=='#' || c=='>') continue;
        return false;
    }
    return true;
}

// Move begin back over a glyph prefix (and the blanks around it).
size_t absorb_glyph(const std::string& text, size_t begin) {
    bool moved = true;
    while (moved && begin > 0) {
        moved = false;
        while (begin > 0 && (text[begin-1]==' ' || text[begin-1]=='\t')) { --begin; moved = true; }
        for (auto &g : all_glyphs()) {
            if (begin >= g.size() && text.compare(begin - g.size(), g.size(), g) == 0) { begin -= g.size(); moved = true; break; }
        }
    }
    return begin;
}

std::vector<LabelHit> find_labels(const std::string& text) {
    std::string lower = to_lower(text);
    std::vector<LabelHit> hits;
    for (auto &l : diagnosis_labels()) {
        size_t pos = 0;
        while ((pos = lower.find(l.label, pos)) != std::string::npos) {
            size_t after = pos + l.label.size();
            bool word_start = pos == 0 || !is_word_char(lower[pos-1]);
            if (word_start && at_line_start(text, pos)) {
                if (after < lower.size() && lower[after] == ':') {
                    hits.push_back({absorb_glyph(text, pos), after + 1, l.section});
                } else if ((after == lower.size() || std::isspace(static_cast<unsigned char>(lower[after])))) {
                    hits.push_back({absorb_glyph(text, pos), after, l.section});
                }
            }
            pos = after;
        }
    }
    std::sort(hits.begin(), hits.end(), [](const LabelHit& a, const LabelHit& b){
        if (a.begin != b.begin) return a.begin < b.begin;
        return a.content_begin > b.content_begin; // longer label first
    });
    std::vector<LabelHit> out;
    for (auto &h : hits) {
        if (!out.empty() && h.begin < out.back().content_begin) continue; // inside previous label
        out.push_back(h);
    }
    return out;
}

// "`cmd` trailing words" -> "cmd"; otherwise the whole text unwrapped.
std::string take_fix_command(std::string_view content) {
    std::string s = trim(content);
    size_t n = 0; while (n < s.size() && n < 3 && s[n] == '`') ++n;
    if (n == 0) return s;
    size_t close = s.find(std::string(n, '`'), n);
    if (close == std::string::npos) return unwrap_code(s);
    return unwrap_code(std::string_view(s).substr(0, close + n));
}

} // namespace

const std::vector<DiagnosisLabel>& diagnosis_labels() {
    static const std::vector<DiagnosisLabel> labels = {
        {DiagnosisSection::Cause,       "root cause"},
        {DiagnosisSection::Fix,         "fix"},
        {DiagnosisSection::Explanation, "technical explanation"},
        {DiagnosisSection::Risk,        "potential risks"},
        {DiagnosisSection::Risk,        "potential risk"},
        {DiagnosisSection::Prevention,  "prevention tip"},
    };
    return labels;
}

std::string normalize_diagnosis_text(std::string_view text) {
    std::vector<std::string> kept;
    for (auto &raw : split_lines(text)) {
        std::string line = raw;
        replace_all(line, "**", "");
        size_t i = 0; while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        size_t d = i; while (d < line.size() && std::isdigit(static_cast<unsigned char>(line[d]))) ++d;
        if (d > i && d + 1 < line.size() && line[d] == '.' && std::isspace(static_cast<unsigned char>(line[d+1]))) line.erase(i, d + 2 - i);
        if (trim(line).empty()) continue;
        kept.push_back(line);
    }
    return join_lines(kept);
}

DiagnosisResult parse_diagnosis_response(std::string_view raw) {
    DiagnosisResult r;
    ReasoningSplit split = extract_reasoning(raw);
    r.thoughts = std::move(split.fragments);

    std::string text = normalize_diagnosis_text(strip_tags(split.remainder));
    auto hits = find_labels(text);
    std::set<DiagnosisSection> seen;
    for (size_t i = 0; i < hits.size(); ++i) {
        auto &h = hits[i];
        if (!seen.insert(h.section).second) continue;
        size_t end = (i + 1 < hits.size()) ? hits[i+1].begin : text.size();
        std::string_view body = std::string_view(text).substr(h.content_begin, end - h.content_begin);
        if (h.section == DiagnosisSection::Fix) r.fix = finalize_section(take_fix_command(body));
        else r.slot(h.section) = finalize_section(body);
    }

    if (!r.thoughts.empty()) {
        for (auto s : kDiagnosisSections) {
            auto &v = r.slot(s);
            if (v) v = finalize_section(*v);
        }
    }
    return r;
}

} // namespace shellsage
