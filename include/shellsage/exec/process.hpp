/*
 * Process execution utilities - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>

namespace shellsage {

struct CaptureResult {
    int exit_code = 0;       // 128+signal on signal death, 127 when /bin/sh cannot be spawned
    std::string out;
    std::string err;
};

// Run `/bin/sh -c command` with stdout and stderr captured separately. stdin
// is /dev/null unless inherit_stdin is set.
CaptureResult run_shell_capture(const std::string& command, bool inherit_stdin = false);

// Run `/bin/sh -c command` on the caller's terminal and return its exit status.
int run_shell_interactive(const std::string& command);

// Resolve command name to absolute path using PATH env if necessary.
// A name containing '/' is checked as-is.
std::optional<std::string> find_in_path(const std::string& cmd);

} // namespace shellsage
