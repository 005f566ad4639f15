/**
 * @file command_runner.cpp
 * @brief fork/execvp subprocess runner with deadline enforcement
 *
 * **Execution Model**:
 * ```
 * parent                         child
 *   pipe(stdout), pipe(stderr)
 *   fork() ───────────────────▶  dup2 pipes onto fds 1/2
 *                                execvp(argv[0], argv)
 *   loop:
 *     drain pipes (non-blocking)
 *     waitpid(WNOHANG)
 *     deadline exceeded? ──────▶ SIGKILL
 *     poll(50ms)
 * ```
 *
 * Arguments are passed verbatim to execvp, never through /bin/sh, so quoting
 * and shell metacharacters inside untrusted values are inert.
 *
 * @date 2025
 */

#include "repoprobe/utils/command_runner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace repoprobe {
namespace utils {

namespace {

void SetNonBlocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief Drain everything currently readable from fd
 *
 * Bytes beyond max_bytes are read and discarded so the child never blocks
 * on a full pipe.
 */
void DrainInto(int fd, std::string& buffer, std::size_t max_bytes) {
    if (fd < 0) {
        return;
    }

    std::array<char, 4096> chunk{};
    while (true) {
        const ssize_t bytes = read(fd, chunk.data(), chunk.size());
        if (bytes > 0) {
            const auto n = static_cast<std::size_t>(bytes);
            if (buffer.size() < max_bytes) {
                buffer.append(chunk.data(), std::min(n, max_bytes - buffer.size()));
            }
            continue;
        }
        if (bytes < 0 && errno == EINTR) {
            continue;
        }
        // EOF, EAGAIN or a read error: nothing more for now
        return;
    }
}

} // anonymous namespace

std::string FormatCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += arg;
    }
    return out;
}

CommandResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const CommandOptions& options) {
    CommandResult result;
    result.exit_code = -1;

    if (argv.empty()) {
        result.stderr_output = "empty command";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if (pipe(out_pipe) != 0 || (!options.merge_output && pipe(err_pipe) != 0)) {
        CloseFd(out_pipe[0]);
        CloseFd(out_pipe[1]);
        CloseFd(err_pipe[0]);
        CloseFd(err_pipe[1]);
        result.stderr_output = std::string("failed to create pipes: ") + std::strerror(errno);
        return result;
    }

    // No allocation between fork and exec
    std::vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();

    if (pid < 0) {
        CloseFd(out_pipe[0]);
        CloseFd(out_pipe[1]);
        CloseFd(err_pipe[0]);
        CloseFd(err_pipe[1]);
        result.stderr_output = std::string("failed to fork: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            (void)dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(options.merge_output ? out_pipe[1] : err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        if (!options.merge_output) {
            close(err_pipe[0]);
            close(err_pipe[1]);
        }

        execvp(child_argv[0], child_argv.data());
        _exit(127);
    }

    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    SetNonBlocking(out_pipe[0]);
    if (err_pipe[0] >= 0) {
        SetNonBlocking(err_pipe[0]);
    }

    std::string& out_text = result.stdout_output;
    std::string& err_text = result.stderr_output;
    int status = 0;
    bool exited = false;

    while (true) {
        DrainInto(out_pipe[0], out_text, options.max_output_bytes);
        DrainInto(err_pipe[0], err_text, options.max_output_bytes);

        const pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            exited = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            break;
        }

        if (std::chrono::steady_clock::now() - started > options.timeout) {
            result.timed_out = true;
            (void)kill(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            break;
        }

        struct pollfd poll_fds[2] = {
            {out_pipe[0], POLLIN, 0},
            {err_pipe[0], POLLIN, 0},
        };
        (void)poll(poll_fds, err_pipe[0] >= 0 ? 2 : 1, 50);
    }

    DrainInto(out_pipe[0], out_text, options.max_output_bytes);
    DrainInto(err_pipe[0], err_text, options.max_output_bytes);
    CloseFd(out_pipe[0]);
    CloseFd(err_pipe[0]);

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (exited && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }

    if (result.timed_out) {
        spdlog::warn("Command timed out after {} ms: {}",
                     options.timeout.count(), argv.front());
    } else if (result.exit_code == 127 && out_text.empty() && err_text.empty()) {
        err_text = "failed to execute " + argv.front();
    }

    result.success = !result.timed_out && result.exit_code == 0;
    return result;
}

} // namespace utils
} // namespace repoprobe
