/*
 * String helpers implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/util/strings.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace shellsage {

std::string trim(std::string_view s) {
    size_t a=0; while (a<s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b=s.size(); while (b>a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return std::string(s.substr(a, b-a));
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split_lines(std::string_view s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t nl = s.find('\n', start);
        if (nl == std::string_view::npos) { out.emplace_back(s.substr(start)); break; }
        out.emplace_back(s.substr(start, nl-start));
        start = nl+1;
    }
    return out;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i=0;i<lines.size();++i) {
        if (i>0) out += '\n';
        out += lines[i];
    }
    return out;
}

void replace_all(std::string& s, std::string_view from, std::string_view to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::vector<std::string> split_words(std::string_view s) {
    std::vector<std::string> out;
    std::istringstream iss{std::string(s)};
    std::string w;
    while (iss >> w) out.push_back(w);
    return out;
}

} // namespace shellsage
