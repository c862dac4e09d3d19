/*
 * Command safety filter implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/safety/safety_filter.hpp>
#include <shellsage/util/strings.hpp>

namespace shellsage {

namespace {

constexpr std::string_view kListingAnalysis = "List all files and directories in the current directory.";
constexpr std::string_view kWindowsDetails = "The 'dir' command lists directory contents on Windows.";
constexpr std::string_view kPosixDetails = "The 'ls -la' command lists all files (including hidden) with details on Linux.";
constexpr std::string_view kReplacedWarning =
    "Original suggestion looked destructive for a list intent; replaced with a safe listing command.";

} // namespace

const std::vector<KeywordRule>& safety_rules() {
    using K = KeywordCategory;
    static const std::vector<KeywordRule> rules = {
        {"list", K::ListIntent}, {"show", K::ListIntent}, {"display", K::ListIntent},
        {"view", K::ListIntent}, {"enumerate", K::ListIntent}, {"see files", K::ListIntent},
        {"see all files", K::ListIntent}, {"ls", K::ListIntent}, {"dir", K::ListIntent},

        {"delete", K::DestructiveIntent}, {"remove", K::DestructiveIntent}, {"clean", K::DestructiveIntent},
        {"cleanup", K::DestructiveIntent}, {"erase", K::DestructiveIntent}, {"wipe", K::DestructiveIntent},
        {"trash", K::DestructiveIntent}, {"empty", K::DestructiveIntent}, {"purge", K::DestructiveIntent},

        {"del", K::DestructiveCommand}, {"erase", K::DestructiveCommand}, {"rd", K::DestructiveCommand},
        {"rmdir", K::DestructiveCommand}, {"rm", K::DestructiveCommand}, {"mv", K::DestructiveCommand},
        {"move", K::DestructiveCommand}, {"ren", K::DestructiveCommand}, {"rename", K::DestructiveCommand},
        {"format", K::DestructiveCommand}, {"mkfs", K::DestructiveCommand}, {"shred", K::DestructiveCommand},
        {"sdelete", K::DestructiveCommand}, {"rm -rf", K::DestructiveCommand},
        {"Remove-Item", K::DestructiveCommand}, {"New-Item -Force", K::DestructiveCommand},

        {"dir", K::SafeListing}, {"ls", K::SafeListing}, {"ls -la", K::SafeListing}, {"ls -l", K::SafeListing},
        {"get-childitem", K::SafeListing}, {"powershell get-childitem", K::SafeListing},
    };
    return rules;
}

bool matches_category(std::string_view text, KeywordCategory category) {
    std::string lower = to_lower(text);
    for (auto &r : safety_rules()) {
        if (r.category == category && contains(lower, to_lower(r.keyword))) return true;
    }
    return false;
}

Intent classify_intent(std::string_view query) {
    if (matches_category(query, KeywordCategory::ListIntent) &&
        !matches_category(query, KeywordCategory::DestructiveIntent)) return Intent::List;
    return Intent::Unclassified;
}

bool looks_destructive(std::string_view command) { return matches_category(command, KeywordCategory::DestructiveCommand); }
bool is_listing_command(std::string_view command) { return matches_category(command, KeywordCategory::SafeListing); }

bool is_windows_os(std::string_view os_name) {
    std::string lower = to_lower(trim(os_name));
    return contains(lower, "windows") || starts_with(lower, "win");
}

std::string listing_command_for(std::string_view os_name) {
    return is_windows_os(os_name) ? "dir" : "ls -la";
}

SafetyVerdict evaluate_safety(std::string_view query, std::string_view os_name, const GenerationResult& result) {
    SafetyVerdict v;
    if (classify_intent(query) != Intent::List) return v;
    std::string cmd = result.command.value_or("");
    bool destructive = looks_destructive(cmd);
    if (!destructive && is_listing_command(cmd)) return v;
    v.kind = SafetyVerdict::Kind::Replaced;
    v.new_command = listing_command_for(os_name);
    v.destructive = destructive;
    v.reason = destructive ? std::string(kReplacedWarning)
                           : "Suggestion did not match a list intent; replaced with a listing command.";
    return v;
}

GenerationResult apply_safety_filter(std::string_view query, std::string_view os_name, GenerationResult result) {
    SafetyVerdict v = evaluate_safety(query, os_name, result);
    if (v.kind == SafetyVerdict::Kind::Unmodified) return result;
    result.command = v.new_command;
    result.analysis = std::string(kListingAnalysis);
    result.details = std::string(is_windows_os(os_name) ? kWindowsDetails : kPosixDetails);
    if (v.destructive) {
        if (result.warning && !result.warning->empty()) *result.warning += "\n" + std::string(kReplacedWarning);
        else result.warning = std::string(kReplacedWarning);
    }
    return result;
}

bool requires_confirmation(std::string_view command) {
    std::string lower = to_lower(command);
    for (auto &w : split_words(lower)) {
        if (w == "sudo" || w == "rm" || w == "dd" || w == "shred") return true;
        if (w == "chown" || w == "chgrp") return true;
        if (starts_with(w, "mkfs") || w == "fdisk" || w == "wipefs") return true;
    }
    if (contains(lower, "chmod 777") || contains(lower, "chmod -r 777")) return true;
    if ((contains(lower, "curl ") || contains(lower, "wget ")) && (contains(lower, "| sh") || contains(lower, "| bash"))) return true;
    if (contains(lower, "> /dev/sd") || contains(lower, "> /dev/nvme") || contains(lower, "> /dev/disk")) return true;
    return false;
}

} // namespace shellsage
