/*
 * Command safety filter - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Reconciles a generated command with the intent of the request that produced
 * it. A request that only wants to look at files ("list", "show", ...) never
 * gets a destructive or unrelated command back: the command is swapped for the
 * platform's listing command and the result is annotated. Requests that mention
 * deleting or cleaning are never treated as listing requests.
 */
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <shellsage/parse/sections.hpp>

namespace shellsage {

enum class KeywordCategory {
    ListIntent,          // query wants to view/enumerate
    DestructiveIntent,   // query wants to delete/clean; overrides ListIntent
    DestructiveCommand,  // command text that modifies or removes data
    SafeListing,         // command text already a listing command
};

struct KeywordRule {
    std::string_view keyword;
    KeywordCategory category;
};

const std::vector<KeywordRule>& safety_rules();

// Case-folded substring match of any keyword of `category` in `text`.
bool matches_category(std::string_view text, KeywordCategory category);

enum class Intent { List, Unclassified };

Intent classify_intent(std::string_view query);
bool looks_destructive(std::string_view command);
bool is_listing_command(std::string_view command);

bool is_windows_os(std::string_view os_name);
std::string listing_command_for(std::string_view os_name);

struct SafetyVerdict {
    enum class Kind { Unmodified, Replaced };
    Kind kind = Kind::Unmodified;
    std::string new_command;   // set when Replaced
    std::string reason;        // human-readable, set when Replaced
    bool destructive = false;  // original command looked destructive
};

SafetyVerdict evaluate_safety(std::string_view query, std::string_view os_name, const GenerationResult& result);

// Applies evaluate_safety() and returns the possibly rewritten result.
GenerationResult apply_safety_filter(std::string_view query, std::string_view os_name, GenerationResult result);

// Commands that need an explicit "yes" before execution (sudo, rm, dd, ...).
bool requires_confirmation(std::string_view command);

} // namespace shellsage
