/*
 * Reasoning extraction - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Reasoning models wrap their chain of thought in <think>...</think>. Pairs are
 * matched leftmost-first and without nesting: the first open delimiter is paired
 * with the first close delimiter that follows it, the pair is cut out of the
 * text and the scan restarts. An unpaired delimiter stops the scan and is left
 * in the remaining text.
 */
#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace shellsage {

inline constexpr std::string_view kThinkOpen = "<think>";
inline constexpr std::string_view kThinkClose = "</think>";

struct ReasoningSplit {
    std::vector<std::string> fragments; // trimmed, in document order
    std::string remainder;              // text left after all pairs were removed (trimmed)
};

ReasoningSplit extract_reasoning(std::string_view raw,
                                 std::string_view open = kThinkOpen,
                                 std::string_view close = kThinkClose);

} // namespace shellsage
