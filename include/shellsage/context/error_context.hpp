/*
 * Context collection - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Gathers the environment facts the prompt builders interpolate: OS name,
 * working directory, recent history, a cleaned error output with hints, man
 * page excerpt, and per-tool state (git, docker, systemd). Collection never
 * fails: a probe that cannot run leaves its field empty.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shellsage {

class CommandHistory;

struct FileSnippet {
    std::string path;
    std::string content;     // first lines of the file
};

// Read-only record consumed by the diagnosis prompt.
struct ErrorContext {
    std::string command;
    std::string error_output;            // ANSI-free, trimmed, hints appended
    std::string cwd;
    int exit_code = 0;
    std::vector<std::string> history;    // oldest first
    std::vector<std::string> relevant_files;
    std::string man_excerpt;
    std::string os;
    std::string shell;
    // Tool-specific extras, filled only for the matching base command.
    std::optional<std::string> git_status;
    std::vector<std::string> docker_containers;
    std::vector<std::string> failed_services;
    std::vector<FileSnippet> file_contents;
};

struct GenerationContext {
    std::string os = "Linux";
    std::string cwd;
    bool in_git_repo = false;
    std::vector<std::string> history;
};

std::string strip_ansi(std::string_view text);

// Cleans raw command output and appends hints for common failure patterns.
std::string enhance_error_output(std::string_view raw, std::string_view command,
                                 const CommandHistory& history, std::string_view user);

// PRETTY_NAME from os-release content; empty when absent.
std::string parse_os_release(std::string_view content);
// /etc/os-release PRETTY_NAME, else "<sysname> <release>" from uname.
std::string detect_os_name();

// NAME/SYNOPSIS/DESCRIPTION headings with their indented lines, at most 11 lines.
std::string extract_man_sections(std::string_view man_text);
std::string man_excerpt(const std::string& base_command);

// Up to max_files command arguments that are readable regular files.
std::vector<FileSnippet> file_snippets(std::string_view command, size_t max_files = 2, size_t max_lines = 20);

// Paths quoted or file-like in an error message that exist on disk.
std::vector<std::string> referenced_files(std::string_view error_output);

// git / docker / systemctl probes keyed on the command's first word.
void add_specialized_context(ErrorContext& ctx);

ErrorContext collect_error_context(const std::string& command, std::string_view raw_output,
                                   int exit_code, const CommandHistory& history);
GenerationContext collect_generation_context(const CommandHistory& history);

} // namespace shellsage
