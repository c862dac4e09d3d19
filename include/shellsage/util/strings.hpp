/*
 * String helpers - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace shellsage {

std::string trim(std::string_view s);
std::string to_lower(std::string_view s);
bool contains(std::string_view haystack, std::string_view needle);
bool starts_with(std::string_view s, std::string_view prefix);

// Split on '\n'. A trailing '\r' is kept (callers trim).
std::vector<std::string> split_lines(std::string_view s);
std::string join_lines(const std::vector<std::string>& lines);

// Replace every occurrence of `from` (non-empty) with `to`.
void replace_all(std::string& s, std::string_view from, std::string_view to);

// Whitespace-separated words.
std::vector<std::string> split_words(std::string_view s);

} // namespace shellsage
