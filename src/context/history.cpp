/*
 * Command history buffer implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/context/history.hpp>
#include <shellsage/util/strings.hpp>
#include <algorithm>
#include <fstream>

namespace shellsage {

void CommandHistory::push(std::string_view command) {
    std::string cmd = trim(command);
    if (cmd.empty()) return;
    if (!m_entries.empty() && m_entries.back() == cmd) return;
    m_entries.push_back(std::move(cmd));
    while (m_entries.size() > m_capacity) m_entries.pop_front();
}

size_t CommandHistory::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return 0;
    std::deque<std::string> tail;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#') continue; // HISTTIMEFORMAT stamps
        tail.push_back(line);
        if (tail.size() > m_capacity) tail.pop_front();
    }
    for (auto &l : tail) push(l);
    return tail.size();
}

bool CommandHistory::any_contains(std::string_view needle) const {
    std::string lower = to_lower(needle);
    return std::any_of(m_entries.begin(), m_entries.end(),
                       [&](const std::string& e){ return contains(to_lower(e), lower); });
}

std::vector<std::string> relevant_files(const CommandHistory& history) {
    static const char* git_ops[] = {"add", "commit", "push", "pull"};
    static const char* file_cmds[] = {"touch", "mkdir", "cp", "mv", "vim", "nano"};
    std::vector<std::string> files;
    auto &entries = history.entries();
    if (entries.empty()) return files;
    for (auto it = std::next(entries.rbegin()); it != entries.rend(); ++it) {
        auto parts = split_words(*it);
        if (parts.empty()) continue;
        if (parts[0] == "git" && parts.size() > 2) {
            if (std::find(std::begin(git_ops), std::end(git_ops), parts[1]) != std::end(git_ops)) files.push_back(parts.back());
        } else if (std::find(std::begin(file_cmds), std::end(file_cmds), parts[0]) != std::end(file_cmds)) {
            files.push_back(parts.back());
        }
        if (files.size() >= 3) break;
    }
    return files;
}

} // namespace shellsage
