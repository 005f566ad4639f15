/**
 * @file command_runner.hpp
 * @brief Subprocess execution with argument vectors and deadlines
 *
 * Every container-runtime interaction goes through ICommandRunner. The
 * production implementation forks and execs the program directly (no shell),
 * so untrusted strings passed as arguments are never interpreted. Tests
 * substitute a scripted runner.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace repoprobe {
namespace utils {

/**
 * @struct CommandOptions
 * @brief Per-invocation execution options
 */
struct CommandOptions {
    std::chrono::milliseconds timeout{60000};  ///< Hard deadline; child is SIGKILLed after it
    bool merge_output{false};                  ///< Send stderr into the stdout pipe
    std::size_t max_output_bytes{8 * 1024 * 1024};  ///< Per-stream capture cap
};

/**
 * @struct CommandResult
 * @brief Outcome of one subprocess execution
 */
struct CommandResult {
    int exit_code{0};                       ///< Exit status (-1 if killed or not started)
    std::string stdout_output;              ///< Captured stdout (or merged output)
    std::string stderr_output;              ///< Captured stderr (empty when merged)
    std::chrono::milliseconds duration{0};  ///< Wall-clock duration
    bool timed_out{false};                  ///< Deadline expired
    bool success{false};                    ///< exit_code == 0 and not timed out
};

/**
 * @class ICommandRunner
 * @brief Abstract subprocess runner
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /**
     * @brief Run argv[0] with the remaining arguments
     *
     * Never throws for process-level failures; they are reported through
     * CommandResult (exit_code -1, message in stderr_output).
     */
    virtual CommandResult Run(const std::vector<std::string>& argv,
                              const CommandOptions& options) = 0;
};

/**
 * @class ProcessRunner
 * @brief fork/execvp based runner with non-blocking pipe draining
 *
 * **Thread Safety**: Stateless; safe to share between concurrent runs.
 */
class ProcessRunner : public ICommandRunner {
public:
    CommandResult Run(const std::vector<std::string>& argv,
                      const CommandOptions& options) override;
};

/// Join arguments with spaces for log output
std::string FormatCommand(const std::vector<std::string>& argv);

} // namespace utils
} // namespace repoprobe
