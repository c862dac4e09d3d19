/*
 * Reasoning extraction implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/parse/reasoning.hpp>
#include <shellsage/util/strings.hpp>

namespace shellsage {

ReasoningSplit extract_reasoning(std::string_view raw, std::string_view open, std::string_view close) {
    ReasoningSplit out;
    std::string work(raw);
    while (true) {
        size_t a = work.find(open);
        if (a == std::string::npos) break;
        size_t body = a + open.size();
        size_t b = work.find(close, body);
        if (b == std::string::npos) break;
        out.fragments.push_back(trim(std::string_view(work).substr(body, b - body)));
        work.erase(a, b + close.size() - a);
    }
    out.remainder = trim(work);
    return out;
}

} // namespace shellsage
