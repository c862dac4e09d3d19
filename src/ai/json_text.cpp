#include <shellsage/ai/json_text.hpp>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace shellsage::ai {

static void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) out.push_back(static_cast<char>(cp));
    else if (cp < 0x800) { out.push_back(static_cast<char>(0xC0 | (cp>>6))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    else if (cp < 0x10000) { out.push_back(static_cast<char>(0xE0 | (cp>>12))); out.push_back(static_cast<char>(0x80 | ((cp>>6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    else { out.push_back(static_cast<char>(0xF0 | (cp>>18))); out.push_back(static_cast<char>(0x80 | ((cp>>12) & 0x3F))); out.push_back(static_cast<char>(0x80 | ((cp>>6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
}

static bool read_hex4(std::string_view s, size_t pos, unsigned long& out) {
    if (pos + 4 > s.size()) return false;
    out = 0;
    for (size_t i=pos;i<pos+4;++i) {
        char c = s[i]; out <<= 4;
        if (c>='0'&&c<='9') out |= static_cast<unsigned long>(c-'0');
        else if (c>='a'&&c<='f') out |= static_cast<unsigned long>(c-'a'+10);
        else if (c>='A'&&c<='F') out |= static_cast<unsigned long>(c-'A'+10);
        else return false;
    }
    return true;
}

std::string escape_json(std::string_view in) {
    std::string out; out.reserve(in.size()+32);
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c)); out += buf;
                } else out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> extract_json_string(std::string_view body, std::string_view key, size_t from) {
    std::string quoted = "\"" + std::string(key) + "\"";
    size_t pos = body.find(quoted, from);
    if (pos == std::string_view::npos) return std::nullopt;
    pos = body.find(':', pos + quoted.size());
    if (pos == std::string_view::npos) return std::nullopt;
    ++pos; while (pos < body.size() && std::isspace(static_cast<unsigned char>(body[pos]))) ++pos;
    if (pos >= body.size() || body[pos] != '"') return std::nullopt;
    std::string out;
    for (size_t i = pos+1; i < body.size(); ++i) {
        char c = body[i];
        if (c == '"') return out;
        if (c != '\\') { out.push_back(c); continue; }
        if (++i >= body.size()) break;
        switch (body[i]) {
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'u': {
                unsigned long cp = 0;
                if (!read_hex4(body, i+1, cp)) return std::nullopt;
                i += 4;
                if (cp >= 0xD800 && cp <= 0xDBFF && i+6 < body.size() && body[i+1]=='\\' && body[i+2]=='u') {
                    unsigned long lo = 0;
                    if (read_hex4(body, i+3, lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, cp);
                break;
            }
            default: out.push_back(body[i]); // \" \\ \/
        }
    }
    return std::nullopt; // unterminated
}

int extract_json_int(std::string_view body, std::string_view key) {
    std::string quoted = "\"" + std::string(key) + "\"";
    size_t pos = body.find(quoted);
    if (pos == std::string_view::npos) return -1;
    pos = body.find(':', pos + quoted.size());
    if (pos == std::string_view::npos) return -1;
    ++pos; while (pos < body.size() && std::isspace(static_cast<unsigned char>(body[pos]))) ++pos;
    size_t end = pos; while (end < body.size() && std::isdigit(static_cast<unsigned char>(body[end]))) ++end;
    if (end == pos) return -1;
    return std::atoi(std::string(body.substr(pos, end-pos)).c_str());
}

} // namespace shellsage::ai
