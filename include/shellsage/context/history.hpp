/*
 * Command history buffer - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace shellsage {

// Bounded append-only history; oldest entries are evicted first.
class CommandHistory {
public:
    static constexpr size_t kDefaultCapacity = 20;

    explicit CommandHistory(size_t capacity = kDefaultCapacity) : m_capacity(capacity ? capacity : 1) {}

    // Ignores blank commands and a repeat of the newest entry.
    void push(std::string_view command);

    // Seeds from a bash-style history file (newest lines last). Returns the number of lines read.
    size_t load_file(const std::string& path);

    const std::deque<std::string>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    size_t capacity() const { return m_capacity; }
    bool empty() const { return m_entries.empty(); }

    // Case-insensitive substring test over every entry.
    bool any_contains(std::string_view needle) const;

private:
    size_t m_capacity;
    std::deque<std::string> m_entries;
};

// Files touched by recent commands, newest first, at most three. The newest
// entry (the failing command itself) is skipped.
std::vector<std::string> relevant_files(const CommandHistory& history);

} // namespace shellsage
