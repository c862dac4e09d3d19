/*
 * Context collection implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/context/error_context.hpp>
#include <shellsage/context/history.hpp>
#include <shellsage/exec/process.hpp>
#include <shellsage/log/logger.hpp>
#include <shellsage/util/strings.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace shellsage {

constexpr size_t kMaxPathLength = 4096;

static bool is_regular_file(const std::string& p) {
    struct stat st{};
    return stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

static std::string env_or(const char* name, const char* fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string(fallback);
}

static std::string shell_quote(std::string_view s) {
    std::string out = "'";
    for (char c : s) { if (c == '\'') out += "'\\''"; else out.push_back(c); }
    out += "'";
    return out;
}

static std::string current_dir() {
    char buf[4096];
    if (getcwd(buf, sizeof(buf))) return buf;
    return env_or("PWD", "Unknown");
}

std::string strip_ansi(std::string_view text) {
    // ESC [ params intermediates final
    std::string out; out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\x1b' && i + 1 < text.size() && text[i+1] == '[') {
            size_t j = i + 2;
            while (j < text.size() && text[j] >= 0x30 && text[j] <= 0x3f) ++j;
            while (j < text.size() && text[j] >= 0x20 && text[j] <= 0x2f) ++j;
            if (j < text.size() && text[j] >= 0x40 && text[j] <= 0x7e) { i = j + 1; continue; }
        }
        out.push_back(text[i++]);
    }
    return out;
}

std::string enhance_error_output(std::string_view raw, std::string_view command,
                                 const CommandHistory& history, std::string_view user) {
    std::string clean = trim(strip_ansi(raw));
    std::string lower = to_lower(clean);
    std::string out = clean;
    if (contains(lower, "permission denied"))
        out += "\nHint: This may be a permissions issue. Current user: " + std::string(user.empty() ? "unknown" : user);
    else if (contains(lower, "command not found"))
        out += "\nHint: Command may not be installed or not in PATH";
    else if (contains(lower, "no such file"))
        out += "\nHint: File or directory does not exist in the current context";
    if (contains(to_lower(command), "git commit") && !history.any_contains("git add")
        && contains(lower, "no changes added to commit"))
        out += "\nHint: No files staged for commit. Did you forget 'git add'?";
    return out;
}

std::string parse_os_release(std::string_view content) {
    for (auto &line : split_lines(content)) {
        std::string l = trim(line);
        if (!starts_with(l, "PRETTY_NAME=")) continue;
        std::string v = l.substr(12);
        if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) v = v.substr(1, v.size()-2);
        return v;
    }
    return {};
}

std::string detect_os_name() {
    std::ifstream in("/etc/os-release");
    if (in) {
        std::ostringstream oss; oss << in.rdbuf();
        std::string pretty = parse_os_release(oss.str());
        if (!pretty.empty()) return pretty;
    }
    struct utsname u{};
    if (uname(&u) == 0) return std::string(u.sysname) + " " + u.release;
    return "Linux";
}

std::string extract_man_sections(std::string_view man_text) {
    std::vector<std::string> picked;
    bool in_section = false;
    for (auto &line : split_lines(man_text)) {
        std::string upper = line;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
        if (upper == "NAME" || upper == "SYNOPSIS" || upper == "DESCRIPTION") {
            in_section = true;
            picked.push_back(line);
        } else if (!line.empty() && line[0] != ' ') {
            in_section = false;      // some other heading
        } else if (in_section && !line.empty()) {
            picked.push_back(trim(line));
        }
        if (picked.size() > 10) break;
    }
    return join_lines(picked);
}

std::string man_excerpt(const std::string& base_command) {
    static const std::string kNone = "No manual entry available";
    if (base_command.empty()) return kNone;
    if (base_command == "git" && find_in_path("git")) {
        auto st = run_shell_capture("git status --porcelain");
        if (st.exit_code == 0 && trim(st.out).empty())
            return "Git status: No changes to commit (working directory clean)";
    }
    if (!find_in_path("man")) return kNone;
    auto r = run_shell_capture("man " + shell_quote(base_command) + " 2>/dev/null | col -b");
    if (r.exit_code != 0) return kNone;
    std::string excerpt = extract_man_sections(r.out);
    return excerpt.empty() ? kNone : excerpt;
}

std::vector<FileSnippet> file_snippets(std::string_view command, size_t max_files, size_t max_lines) {
    std::vector<FileSnippet> out;
    for (auto &word : split_words(command)) {
        if (out.size() >= max_files) break;
        if (!is_regular_file(word)) continue;
        if (std::any_of(out.begin(), out.end(), [&](const FileSnippet& f){ return f.path == word; })) continue;
        std::ifstream in(word);
        if (!in) { out.push_back({word, "Unable to read file content"}); continue; }
        std::string content, line;
        for (size_t n = 0; n < max_lines && std::getline(in, line); ++n) content += line + "\n";
        out.push_back({word, content});
    }
    return out;
}

static bool is_path_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '/' || c == '.' || c == '-';
}

// name.ext token: a dot followed by at least one word character.
static bool has_extension(std::string_view token) {
    size_t dot = token.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= token.size()) return false;
    for (size_t i = dot + 1; i < token.size(); ++i)
        if (!std::isalnum(static_cast<unsigned char>(token[i])) && token[i] != '_') return false;
    return true;
}

std::vector<std::string> referenced_files(std::string_view error_output) {
    std::vector<std::string> files;
    auto consider = [&](std::string_view candidate) {
        if (candidate.empty() || candidate.size() > kMaxPathLength) return;
        std::string path(candidate);
        if (!is_regular_file(path)) return;
        if (std::find(files.begin(), files.end(), path) == files.end()) files.push_back(path);
    };
    // 'quoted', "quoted" or a bare name.ext token
    size_t i = 0;
    while (i < error_output.size()) {
        char c = error_output[i];
        if (c == '\'' || c == '"') {
            size_t close = error_output.find(c, i + 1);
            if (close != std::string_view::npos) {
                consider(error_output.substr(i + 1, close - i - 1));
                i = close + 1;
                continue;
            }
            ++i;
            continue;
        }
        if (is_path_char(c)) {
            size_t j = i;
            while (j < error_output.size() && is_path_char(error_output[j])) ++j;
            std::string_view token = error_output.substr(i, j - i);
            while (!token.empty() && (token.back() == '.' || token.back() == '-' || token.back() == '/')) token.remove_suffix(1);
            if (has_extension(token)) consider(token);
            i = j;
            continue;
        }
        ++i;
    }
    return files;
}

static std::vector<std::string> first_lines(const std::string& text, size_t n) {
    std::vector<std::string> out;
    for (auto &l : split_lines(trim(text))) {
        if (out.size() >= n) break;
        std::string t = trim(l);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

void add_specialized_context(ErrorContext& ctx) {
    auto words = split_words(ctx.command);
    if (words.empty()) return;
    const std::string& base = words[0];
    if (base == "git") {
        if (!find_in_path("git")) return;
        auto r = run_shell_capture("git status --porcelain");
        if (r.exit_code == 0) ctx.git_status = r.out;
    } else if (base == "docker" || base == "docker-compose") {
        if (!find_in_path("docker")) return;
        auto r = run_shell_capture("docker ps --format \"{{.Names}} ({{.Status}})\"");
        if (r.exit_code == 0) ctx.docker_containers = first_lines(r.out, 50);
    } else if (base == "systemctl" || base == "service") {
        if (!find_in_path("systemctl")) return;
        auto r = run_shell_capture("systemctl list-units --state=failed --no-legend");
        if (r.exit_code == 0) ctx.failed_services = first_lines(r.out, 3);
    }
}

ErrorContext collect_error_context(const std::string& command, std::string_view raw_output,
                                   int exit_code, const CommandHistory& history) {
    ErrorContext ctx;
    ctx.command = command;
    ctx.exit_code = exit_code;
    ctx.cwd = current_dir();
    ctx.os = detect_os_name();
    ctx.shell = env_or("SHELL", "Unknown");
    ctx.history.assign(history.entries().begin(), history.entries().end());
    ctx.relevant_files = relevant_files(history);
    ctx.error_output = enhance_error_output(raw_output, command, history, env_or("USER", "unknown"));
    auto words = split_words(command);
    ctx.man_excerpt = words.empty() ? "No manual entry available" : man_excerpt(words[0]);
    ctx.file_contents = file_snippets(command);
    add_specialized_context(ctx);
    logger()->debug("error context: cwd={} os='{}' history={} relevant_files={} snippets={} git={} docker={} services={}",
                    ctx.cwd, ctx.os, ctx.history.size(), ctx.relevant_files.size(), ctx.file_contents.size(),
                    ctx.git_status.has_value(), ctx.docker_containers.size(), ctx.failed_services.size());
    return ctx;
}

GenerationContext collect_generation_context(const CommandHistory& history) {
    GenerationContext ctx;
    ctx.os = detect_os_name();
    ctx.cwd = current_dir();
    struct stat st{};
    ctx.in_git_repo = stat(".git", &st) == 0;
    ctx.history.assign(history.entries().begin(), history.entries().end());
    logger()->debug("generation context: os='{}' cwd={} git={}", ctx.os, ctx.cwd, ctx.in_git_repo);
    return ctx;
}

} // namespace shellsage
