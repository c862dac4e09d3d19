#include <shellsage/pipeline/prompt_builder.hpp>
#include <shellsage/safety/safety_filter.hpp>
#include <algorithm>
#include <sstream>

namespace shellsage {

static std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) { if (i) out += sep; out += items[i]; }
    return out;
}

std::string build_generation_prompt(const std::string& query, const GenerationContext& ctx) {
    bool windows = is_windows_os(ctx.os);
    std::ostringstream p;
    if (windows) {
        p << "SYSTEM: You are a Windows PowerShell and Command Prompt expert. Produce exactly ONE command or command sequence.\n"
          << "Prefer Windows file system and system operations. Use Git only when the query asks for repository work.\n";
    } else {
        p << "SYSTEM: You are a Linux terminal expert. Produce exactly ONE command or command sequence.\n"
          << "Prefer system-level operations (packages, services, files). Use Git only when the query asks for repository work.\n";
    }
    p << "\nUSER QUERY: " << query << "\n\n"
      << "RESPONSE FORMAT:\n"
      << "🧠 Analysis: [one-line explanation]\n"
      << "🛠️ Command: ```[" << (windows ? "executable Windows command(s)" : "executable command(s)") << "]```\n"
      << "📝 Details: [technical specifics]\n"
      << "⚠️ Warning: [only if the command is dangerous]\n\n"
      << "CURRENT CONTEXT:\n"
      << "- OS: " << ctx.os << "\n"
      << "- Directory: " << (ctx.cwd.empty() ? "Unknown" : ctx.cwd) << "\n";
    if (ctx.in_git_repo) p << "- Git repo: Yes (only relevant for Git-specific queries)\n";
    if (!ctx.history.empty()) {
        std::vector<std::string> recent(ctx.history.end() - static_cast<std::ptrdiff_t>(std::min<size_t>(3, ctx.history.size())), ctx.history.end());
        p << "- Recent commands: " << join(recent, ", ") << "\n";
    }
    p << "\nEXAMPLE:\n"
      << "Query: \"list all files in current directory\"\n"
      << "🧠 Analysis: List every file and directory here, hidden ones included\n"
      << "🛠️ Command: ```" << listing_command_for(ctx.os) << "```\n"
      << "📝 Details: Shows names with size, date and permissions\n"
      << "⚠️ Warning: None\n";
    return p.str();
}

std::string build_diagnosis_prompt(const ErrorContext& ctx) {
    auto files = referenced_files(ctx.error_output);
    std::vector<std::string> recent(ctx.history.end() - static_cast<std::ptrdiff_t>(std::min<size_t>(3, ctx.history.size())), ctx.history.end());
    std::ostringstream p;
    p << "**[Terminal Context Analysis]**\n"
      << "**System Environment**: " << (ctx.shell.empty() ? "Unknown" : ctx.shell) << " on " << (ctx.os.empty() ? "Linux" : ctx.os) << "\n"
      << "**Working Directory**: " << ctx.cwd << "\n"
      << "**Recent Commands**: " << join(recent, ", ") << "\n"
      << "**Failed Command**: `" << ctx.command << "`\n"
      << "**Error Message**: " << ctx.error_output << "\n"
      << "**Exit Code**: " << ctx.exit_code << "\n"
      << "**Referenced Files**: " << (files.empty() ? "None detected" : join(files, ", ")) << "\n";
    if (!ctx.relevant_files.empty()) p << "**Recently Touched Files**: " << join(ctx.relevant_files, ", ") << "\n";
    p << "**Man Page Excerpt**: " << (ctx.man_excerpt.empty() ? "N/A" : ctx.man_excerpt) << "\n";
    if (ctx.git_status && !ctx.git_status->empty()) p << "**Git Status**: " << ctx.git_status->substr(0, 200) << "\n";
    if (!ctx.docker_containers.empty()) {
        std::vector<std::string> first(ctx.docker_containers.begin(), ctx.docker_containers.begin() + static_cast<std::ptrdiff_t>(std::min<size_t>(3, ctx.docker_containers.size())));
        p << "**Docker Containers**: " << join(first, ", ") << "\n";
    }
    if (!ctx.failed_services.empty()) p << "**Failed Services**: " << join(ctx.failed_services, ", ") << "\n";
    for (auto &f : ctx.file_contents) {
        std::string content = f.content.size() > 300 ? f.content.substr(0, 300) + "..." : f.content;
        p << "**File " << f.path << "**: ```\n" << content << "\n```\n";
    }
    p << "\n**Required Analysis Format:**\n"
      << "<think>\n"
      << "Step 1: Identify the exact error message and the command that failed\n"
      << "Step 2: Work out why it failed (syntax, missing files, permissions, ...)\n"
      << "Step 3: Find the correct command or fix from the context\n"
      << "Step 4: Consider any risks of the fix\n"
      << "</think>\n\n"
      << "Root Cause: <one-line diagnosis>\n"
      << "Fix: `[executable command]`\n"
      << "Technical Explanation: <system-level reason>\n"
      << "Potential Risks: <if any>\n"
      << "Prevention Tip: <actionable advice>\n";
    return p.str();
}

} // namespace shellsage
