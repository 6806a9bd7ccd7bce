/**
 * @file process_utils.hpp
 * @brief Child process execution with captured output and forced termination
 *
 * Every interaction with the container runtime CLI goes through this runner.
 * Commands are passed as argument vectors and executed with fork/execvp, so
 * no shell ever interprets user-supplied text. The runner feeds stdin,
 * captures stdout and stderr separately as they are produced, and kills the
 * child's whole process group on deadline expiry or external cancellation.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <atomic>
#include <chrono>
#include <optional>
#include <functional>

namespace faasbox {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief What to run and how to bound it
 */
struct ProcessOptions {
    std::vector<std::string> argv;                          ///< argv[0] is looked up in PATH
    std::string stdin_data;                                 ///< Written to the child's stdin, then closed
    std::optional<std::chrono::milliseconds> timeout;      ///< Deadline, none if unset
    std::size_t max_output_bytes{1024 * 1024};             ///< Per-stream capture cap
    const std::atomic<bool>* cancel_flag{nullptr};         ///< Kill the child once this reads true
    std::function<void(const std::string&)> on_stdout;     ///< Called with each stdout chunk
    std::function<void(const std::string&)> on_stderr;     ///< Called with each stderr chunk
};

/**
 * @struct ProcessResult
 * @brief Outcome of one child process
 */
struct ProcessResult {
    bool started{false};          ///< fork and exec succeeded
    int exit_code{-1};            ///< Exit status, or 128 + signal number
    int term_signal{0};           ///< Signal that terminated the child, 0 if none
    bool timed_out{false};        ///< Killed at the deadline
    bool cancelled{false};        ///< Killed through cancel_flag
    bool output_truncated{false}; ///< A stream exceeded max_output_bytes
    std::string stdout_output;
    std::string stderr_output;
    std::string error_message;    ///< Runner failure, not child stderr
    std::chrono::milliseconds duration{0};

    bool Succeeded() const { return started && !timed_out && !cancelled && exit_code == 0; }
};

/**
 * @class ProcessRunner
 * @brief fork/exec runner with poll-driven I/O
 *
 * **Usage Example**:
 * @code
 * ProcessOptions options;
 * options.argv = {"docker", "exec", "-i", container_id, "python3", "-u", "-"};
 * options.stdin_data = "print(1+1)\n";
 * options.timeout = std::chrono::seconds(5);
 *
 * auto result = ProcessRunner::Run(options);
 * if (result.timed_out) { ... }
 * @endcode
 *
 * **Thread Safety**: Run() is reentrant; concurrent calls are independent.
 */
class ProcessRunner {
public:
    /**
     * @brief Run a child process to completion or termination
     *
     * Blocks until the child has exited and been reaped. On deadline expiry
     * or cancellation, SIGKILL is sent to the child's process group.
     *
     * @param options Command, input and limits
     * @return ProcessResult; started is false when fork or exec failed
     */
    static ProcessResult Run(const ProcessOptions& options);
};

} // namespace utils
} // namespace faasbox
