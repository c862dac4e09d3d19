#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace shellsage::ai {

// Minimal JSON text helpers for request bodies and provider replies.
// Not a general parser: values are located by key, first match after `from`.

std::string escape_json(std::string_view in);

// Value of the first "key": "<string>" at or after `from`, unescaped
// (\n, \t, \", \\, \/, \uXXXX incl. surrogate pairs). nullopt when the key is
// missing or its value is not a string.
std::optional<std::string> extract_json_string(std::string_view body, std::string_view key, size_t from = 0);

// Value of the first "key": <integer>; -1 when missing.
int extract_json_int(std::string_view body, std::string_view key);

} // namespace shellsage::ai
