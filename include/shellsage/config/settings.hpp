/*
 * Runtime settings - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <map>
#include <string>
#include <string_view>
#include <shellsage/ai/llm.hpp>

namespace shellsage {

using SettingsMap = std::map<std::string, std::string>;

struct Settings {
    std::string mode = "local";                          // local|api
    std::string local_model = "llama3:8b-instruct-q4_1";
    std::string ollama_host = "http://localhost:11434";
    std::string api_provider = "groq";
    std::string api_model;
    std::string api_key;                                 // <PROVIDER>_API_KEY of api_provider
    std::string stub_file;
    bool debug = false;
    int timeout_seconds = 60;
};

// KEY=value, optional leading "export ", quotes stripped. false for blanks/comments/garbage.
bool parse_env_line(std::string_view line, std::string& key, std::string& value);

// Merges a key=value file into `into` (later files win). false when unreadable.
bool read_settings_file(const std::string& path, SettingsMap& into);

// Applies defaults and validation to a merged key/value map.
Settings resolve_settings(const SettingsMap& values);

// ./.env, then ~/.shellsagerc, then the process environment.
Settings load_settings();

ai::LLMConfig to_llm_config(const Settings& s);

} // namespace shellsage
