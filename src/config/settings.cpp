/*
 * Runtime settings implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/config/settings.hpp>
#include <shellsage/log/logger.hpp>
#include <shellsage/util/strings.hpp>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace shellsage {

static const char* kKnownKeys[] = {
    "MODE", "LOCAL_MODEL", "OLLAMA_HOST", "ACTIVE_API_PROVIDER", "API_MODEL",
    "SHELLSAGE_DEBUG", "SHELLSAGE_TIMEOUT", "SHELLSAGE_STUB_FILE",
};

static std::string upper(std::string s) {
    for (auto &c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

static bool truthy(const std::string& v) {
    std::string l = to_lower(trim(v));
    return !l.empty() && l != "0" && l != "false" && l != "off" && l != "no";
}

static std::string lookup(const SettingsMap& m, const std::string& key, const std::string& def) {
    auto it = m.find(key);
    if (it == m.end() || it->second.empty()) return def;
    return it->second;
}

bool parse_env_line(std::string_view line, std::string& key, std::string& value) {
    std::string l = trim(line);
    if (l.empty() || l[0] == '#') return false;
    if (starts_with(l, "export ")) l = trim(std::string_view(l).substr(7));
    auto eq = l.find('=');
    if (eq == std::string::npos || eq == 0) return false;
    key = trim(std::string_view(l).substr(0, eq));
    for (char c : key) if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    value = trim(std::string_view(l).substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
        value = value.substr(1, value.size() - 2);
    return true;
}

bool read_settings_file(const std::string& path, SettingsMap& into) {
    std::ifstream in(path);
    if (!in) return false;
    std::string line, key, value;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (parse_env_line(line, key, value)) { into[key] = value; continue; }
        std::string t = trim(line);
        if (!t.empty() && t[0] != '#') logger()->debug("{}:{}: ignoring malformed line", path, lineno);
    }
    logger()->debug("settings read from {}", path);
    return true;
}

Settings resolve_settings(const SettingsMap& values) {
    Settings s;
    s.mode = to_lower(lookup(values, "MODE", s.mode));
    if (s.mode != "local" && s.mode != "api") {
        logger()->warn("unknown MODE '{}', using local", s.mode);
        s.mode = "local";
    }
    s.local_model = lookup(values, "LOCAL_MODEL", s.local_model);
    s.ollama_host = lookup(values, "OLLAMA_HOST", s.ollama_host);
    s.api_provider = to_lower(lookup(values, "ACTIVE_API_PROVIDER", s.api_provider));
    s.api_model = lookup(values, "API_MODEL", "");
    s.api_key = lookup(values, upper(s.api_provider) + "_API_KEY", "");
    s.stub_file = lookup(values, "SHELLSAGE_STUB_FILE", "");
    s.debug = truthy(lookup(values, "SHELLSAGE_DEBUG", ""));
    std::string timeout = lookup(values, "SHELLSAGE_TIMEOUT", "");
    if (!timeout.empty()) {
        int t = 0;
        auto [p, ec] = std::from_chars(timeout.data(), timeout.data() + timeout.size(), t);
        if (ec == std::errc() && p == timeout.data() + timeout.size() && t > 0) s.timeout_seconds = t;
        else logger()->warn("invalid SHELLSAGE_TIMEOUT '{}', using {}s", timeout, s.timeout_seconds);
    }
    return s;
}

Settings load_settings() {
    SettingsMap values;
    read_settings_file(".env", values);
    if (const char* home = std::getenv("HOME"); home && *home) read_settings_file(std::string(home) + "/.shellsagerc", values);
    for (const char* k : kKnownKeys) {
        if (const char* v = std::getenv(k)) values[k] = v;
    }
    // API keys for every known provider
    for (auto &p : ai::providers()) {
        std::string k = upper(std::string(p.name)) + "_API_KEY";
        if (const char* v = std::getenv(k.c_str())) values[k] = v;
    }
    return resolve_settings(values);
}

ai::LLMConfig to_llm_config(const Settings& s) {
    ai::LLMConfig cfg;
    cfg.timeout_seconds = s.timeout_seconds;
    if (!s.stub_file.empty()) {
        cfg.provider = "stub";
        cfg.stub_file = s.stub_file;
    } else if (s.mode == "api") {
        if (!ai::find_provider(s.api_provider)) logger()->warn("unknown ACTIVE_API_PROVIDER '{}'", s.api_provider);
        cfg.provider = s.api_provider;
        cfg.model = s.api_model;
        cfg.api_key = s.api_key;
    } else {
        cfg.provider = "local";
        cfg.model = s.local_model;
        cfg.endpoint = s.ollama_host;
    }
    logger()->debug("provider={} model={} key={}", cfg.provider, cfg.model.empty() ? "(default)" : cfg.model,
                    cfg.api_key.empty() ? "unset" : "set");
    return cfg;
}

} // namespace shellsage
