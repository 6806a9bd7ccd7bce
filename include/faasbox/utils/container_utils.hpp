/**
 * @file container_utils.hpp
 * @brief Container runtime access: image, lifecycle, exec and stats
 *
 * The engine never talks to the container runtime directly. It goes through
 * the ContainerDriver interface, whose production implementation drives the
 * docker CLI. The interface is the seam that lets the pool, orchestrator and
 * sampler be exercised without a daemon.
 *
 * @date 2025
 */

#pragma once

#include "faasbox/utils/process_utils.hpp"

#include <string>
#include <vector>
#include <map>
#include <atomic>
#include <optional>
#include <chrono>
#include <functional>
#include <cstdint>

namespace faasbox {
namespace utils {

/**
 * @struct ContainerSpec
 * @brief Everything needed to start one long-lived sandbox container
 */
struct ContainerSpec {
    std::string name;                            ///< Container name
    std::string image;                           ///< Image tag
    std::vector<std::string> runtime_args;       ///< Isolation-backend specific run arguments
    std::vector<std::string> command;            ///< Keep-alive command
    std::size_t memory_limit_mb{256};            ///< Memory limit
    double cpu_limit{1.0};                       ///< CPU limit (cores)
    int pids_limit{64};                          ///< Process limit
    std::size_t tmpfs_size_mb{64};               ///< Size of the writable /tmp
    std::string user{"sandbox"};                 ///< Run as user
    std::map<std::string, std::string> labels;   ///< Container labels
};

/**
 * @struct ContainerStats
 * @brief Point-in-time resource usage of one container
 */
struct ContainerStats {
    double cpu_usage_percent{0.0};               ///< CPU utilization
    std::uint64_t memory_usage_bytes{0};         ///< Memory usage
    std::uint64_t memory_limit_bytes{0};         ///< Memory limit
    std::chrono::steady_clock::time_point timestamp;  ///< When the sample was taken
};

/**
 * @struct DriverResult
 * @brief Outcome of a runtime management command
 */
struct DriverResult {
    bool success{false};
    std::string output;          ///< Trimmed stdout (the container id for starts)
    std::string error_message;   ///< Runtime stderr or runner error
};

/**
 * @struct ContainerExecResult
 * @brief Result of command execution in container
 */
struct ContainerExecResult {
    bool started{false};                    ///< The exec client ran at all
    int exit_code{-1};                      ///< Exit code of the command
    std::string stdout_output;              ///< Standard output
    std::string stderr_output;              ///< Standard error
    bool cancelled{false};                  ///< Terminated through ExecControl
    bool output_truncated{false};           ///< Output exceeded the capture cap
    std::string error_message;              ///< Transport failure, not program stderr
    std::chrono::milliseconds duration{0};  ///< Execution duration
};

/**
 * @class ExecControl
 * @brief Cancellation token and output observers for one exec
 *
 * Cancel() may be called from any thread; the exec returns promptly after.
 */
class ExecControl {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }
    const std::atomic<bool>& CancelFlag() const { return cancelled_; }

    std::function<void(const std::string&)> on_stdout;  ///< Streamed stdout chunks
    std::function<void(const std::string&)> on_stderr;  ///< Streamed stderr chunks
    std::size_t max_output_bytes{1024 * 1024};          ///< Per-stream capture cap

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @class ContainerDriver
 * @brief Abstract container runtime
 *
 * Implementations must be safe to call concurrently from many threads.
 */
class ContainerDriver {
public:
    virtual ~ContainerDriver() = default;

    /// Runtime daemon reachable
    virtual bool IsAvailable() = 0;

    virtual bool ImageExists(const std::string& image_tag) = 0;

    /**
     * @brief Build an image from a context-free recipe
     * @param image_tag Tag to assign
     * @param dockerfile Recipe text
     */
    virtual DriverResult BuildImage(const std::string& image_tag, const std::string& dockerfile) = 0;

    /// Create and start a detached container; output holds its id
    virtual DriverResult StartContainer(const ContainerSpec& spec) = 0;

    /// Forcibly terminate every process of the container
    virtual bool KillContainer(const std::string& container_id) = 0;

    /// Remove the container, killing it first if still running
    virtual bool RemoveContainer(const std::string& container_id) = 0;

    /**
     * @brief Run a command inside a running container
     *
     * Blocks until the command finishes or control is cancelled.
     *
     * @param container_id Target container
     * @param command Command and arguments
     * @param stdin_data Fed to the command's stdin
     * @param control Cancellation and streaming
     */
    virtual ContainerExecResult Exec(const std::string& container_id,
                                     const std::vector<std::string>& command,
                                     const std::string& stdin_data,
                                     ExecControl& control) = 0;

    /**
     * @brief Point-in-time usage
     * @param container_id Container to sample
     * @param cancel_flag Abandons the sample once this reads true
     * @return Stats, nullopt if the container cannot be sampled or the sample was abandoned
     */
    virtual std::optional<ContainerStats> GetStats(const std::string& container_id,
                                                   const std::atomic<bool>* cancel_flag = nullptr) = 0;
};

/**
 * @class DockerCli
 * @brief ContainerDriver backed by the docker command-line client
 *
 * **Usage Example**:
 * @code
 * DockerCli docker;
 *
 * ContainerSpec spec;
 * spec.name = "faasbox-python-runc-1";
 * spec.image = "faasbox-python-runc:0123456789ab";
 * spec.runtime_args = {"--runtime=runc"};
 * spec.command = {"tail", "-f", "/dev/null"};
 *
 * auto started = docker.StartContainer(spec);
 * ExecControl control;
 * auto result = docker.Exec(started.output, {"python3", "-u", "-"}, "print(1+1)\n", control);
 * docker.RemoveContainer(started.output);
 * @endcode
 */
class DockerCli final : public ContainerDriver {
public:
    /**
     * @param docker_binary Client executable (looked up in PATH)
     * @param command_timeout Bound for management commands
     * @param build_timeout Bound for image builds
     */
    explicit DockerCli(std::string docker_binary = "docker",
                       std::chrono::seconds command_timeout = std::chrono::seconds(60),
                       std::chrono::seconds build_timeout = std::chrono::seconds(900));

    bool IsAvailable() override;
    bool ImageExists(const std::string& image_tag) override;
    DriverResult BuildImage(const std::string& image_tag, const std::string& dockerfile) override;
    DriverResult StartContainer(const ContainerSpec& spec) override;
    bool KillContainer(const std::string& container_id) override;
    bool RemoveContainer(const std::string& container_id) override;
    ContainerExecResult Exec(const std::string& container_id,
                             const std::vector<std::string>& command,
                             const std::string& stdin_data,
                             ExecControl& control) override;
    std::optional<ContainerStats> GetStats(const std::string& container_id,
                                           const std::atomic<bool>* cancel_flag = nullptr) override;

    /**
     * @brief Translate a container spec into `docker run` arguments
     *
     * Hardening applied to every sandbox: no network, all capabilities
     * dropped, no-new-privileges, read-only rootfs with a tmpfs /tmp.
     */
    static std::vector<std::string> BuildRunCommand(const ContainerSpec& spec);

    /**
     * @brief Parse one line of `docker stats --format '{{json .}}'`
     * @return Stats, or nullopt if the line is not a usable stats object
     */
    static std::optional<ContainerStats> ParseStatsOutput(const std::string& json_line);

private:
    std::string docker_binary_;
    std::chrono::seconds command_timeout_;
    std::chrono::seconds build_timeout_;

    ProcessResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                       const std::string& stdin_data = "",
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                       const std::atomic<bool>* cancel_flag = nullptr) const;
};

} // namespace utils
} // namespace faasbox
