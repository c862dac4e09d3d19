/*
 * Process execution implementation - ShellSage
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellsage/exec/process.hpp>
#include <shellsage/log/logger.hpp>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace shellsage {

static int wait_status(pid_t pid) {
    int st = 0;
    while (waitpid(pid, &st, 0) < 0) {
        if (errno != EINTR) return 127;
    }
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return 0;
}

CaptureResult run_shell_capture(const std::string& command, bool inherit_stdin) {
    CaptureResult res;
    int out_pipe[2], err_pipe[2];
    if (pipe(out_pipe) != 0) { res.exit_code = 127; res.err = std::strerror(errno); return res; }
    if (pipe(err_pipe) != 0) {
        res.exit_code = 127; res.err = std::strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        return res;
    }
    pid_t pid = fork();
    if (pid < 0) {
        res.exit_code = 127; res.err = std::strerror(errno);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        return res;
    }
    if (pid == 0) {
        std::signal(SIGINT, SIG_DFL);
        if (!inherit_stdin) {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) { dup2(devnull, STDIN_FILENO); close(devnull); }
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    close(out_pipe[1]); close(err_pipe[1]);
    // Drain both pipes together so a chatty stderr cannot block the child.
    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&res.out, &res.err};
    int open_fds = 2;
    char buf[4096];
    while (open_fds > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            logger()->warn("poll failed: {}", std::strerror(errno));
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) { sinks[i]->append(buf, static_cast<size_t>(n)); continue; }
            if (n < 0 && errno == EINTR) continue;
            close(fds[i].fd); fds[i].fd = -1; --open_fds;
        }
    }
    for (auto &p : fds) if (p.fd >= 0) close(p.fd);
    res.exit_code = wait_status(pid);
    logger()->debug("'{}' exited with {} ({} bytes stdout, {} bytes stderr)", command, res.exit_code, res.out.size(), res.err.size());
    return res;
}

int run_shell_interactive(const std::string& command) {
    pid_t pid = fork();
    if (pid < 0) { logger()->error("fork failed: {}", std::strerror(errno)); return 127; }
    if (pid == 0) {
        std::signal(SIGINT, SIG_DFL);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    // The child owns the terminal; ignore ^C here until it returns.
    auto prev = std::signal(SIGINT, SIG_IGN);
    int rc = wait_status(pid);
    std::signal(SIGINT, prev);
    return rc;
}

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

std::optional<std::string> find_in_path(const std::string& cmd) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd;
        return std::nullopt;
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;
    std::string paths = path_env;
    size_t start = 0;
    while (start <= paths.size()) {
        size_t colon = paths.find(':', start);
        std::string dir = paths.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        if (!dir.empty()) {
            std::string full = dir + '/' + cmd;
            if (is_executable(full)) return full;
        }
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return std::nullopt;
}

} // namespace shellsage
