/**
 * @file container_utils.cpp
 * @brief docker CLI implementation of the container driver
 *
 * **Container Lifecycle**:
 * ```
 * run -d (keep-alive) -> exec -i (per request) -> ... -> kill -> rm -f
 * ```
 *
 * **Security Hardening** (every sandbox container):
 * - Network Isolation: --network none
 * - Capability Dropping: --cap-drop ALL
 * - No New Privileges: --security-opt no-new-privileges
 * - Read-only Rootfs with a size-bounded tmpfs /tmp
 * - Resource Limits: memory (swap disabled), CPU, pids
 * - Non-root user
 *
 * **Resource Monitoring**:
 * `docker stats --no-stream --format '{{json .}}'` gives one JSON object per
 * container with "CPUPerc" ("0.07%") and "MemUsage" ("12.5MiB / 256MiB").
 *
 * @date 2025
 */

#include "faasbox/utils/container_utils.hpp"
#include "faasbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <iomanip>

using json = nlohmann::json;

namespace faasbox {
namespace utils {

namespace {

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << cpus;
    return oss.str();
}

std::string FirstLine(const std::string& text) {
    auto newline = text.find('\n');
    return StringUtils::Trim(newline == std::string::npos ? text : text.substr(0, newline));
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerCli::DockerCli(std::string docker_binary,
                     std::chrono::seconds command_timeout,
                     std::chrono::seconds build_timeout)
    : docker_binary_(std::move(docker_binary))
    , command_timeout_(command_timeout)
    , build_timeout_(build_timeout) {
    spdlog::debug("Docker driver using client: {}", docker_binary_);
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool DockerCli::IsAvailable() {
    auto result = ExecuteDockerCommand({"info", "--format", "{{.ServerVersion}}"});
    if (!result.Succeeded()) {
        spdlog::error("Docker daemon not reachable: {}",
                      result.error_message.empty() ? FirstLine(result.stderr_output)
                                                   : result.error_message);
        return false;
    }
    spdlog::info("Docker daemon version: {}", StringUtils::Trim(result.stdout_output));
    return true;
}

// ============================================================================
// IMAGES
// ============================================================================

bool DockerCli::ImageExists(const std::string& image_tag) {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image_tag});
    return result.Succeeded();
}

DriverResult DockerCli::BuildImage(const std::string& image_tag, const std::string& dockerfile) {
    spdlog::info("Building image {}", image_tag);

    // "-" reads the Dockerfile from stdin with an empty build context
    auto result = ExecuteDockerCommand({"build", "--quiet", "-t", image_tag, "-"},
                                       dockerfile, build_timeout_);

    DriverResult out;
    out.success = result.Succeeded();
    out.output = StringUtils::Trim(result.stdout_output);
    if (!out.success) {
        out.error_message = result.timed_out ? "image build timed out"
                          : !result.error_message.empty() ? result.error_message
                          : StringUtils::Trim(result.stderr_output);
        spdlog::error("Failed to build image {}: {}", image_tag, out.error_message);
    }
    return out;
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

DriverResult DockerCli::StartContainer(const ContainerSpec& spec) {
    auto result = ExecuteDockerCommand(BuildRunCommand(spec));

    DriverResult out;
    out.success = result.Succeeded();
    if (out.success) {
        // Extract container ID from output
        out.output = FirstLine(result.stdout_output);
        if (out.output.empty()) {
            out.success = false;
            out.error_message = "docker run printed no container id";
        }
    } else {
        out.error_message = result.timed_out ? "docker run timed out"
                          : !result.error_message.empty() ? result.error_message
                          : StringUtils::Trim(result.stderr_output);
    }

    if (!out.success) {
        spdlog::warn("Failed to start container {}: {}", spec.name, out.error_message);
    }
    return out;
}

bool DockerCli::KillContainer(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"kill", "--signal", "KILL", container_id});
    if (!result.Succeeded()) {
        spdlog::warn("Failed to kill container {}: {}", StringUtils::ShortId(container_id),
                     FirstLine(result.stderr_output));
        return false;
    }
    return true;
}

bool DockerCli::RemoveContainer(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"rm", "--force", container_id});
    if (!result.Succeeded()) {
        spdlog::warn("Failed to remove container {}: {}", StringUtils::ShortId(container_id),
                     FirstLine(result.stderr_output));
        return false;
    }
    return true;
}

// ============================================================================
// CONTAINER COMMAND EXECUTION
// ============================================================================

ContainerExecResult DockerCli::Exec(const std::string& container_id,
                                    const std::vector<std::string>& command,
                                    const std::string& stdin_data,
                                    ExecControl& control) {
    std::vector<std::string> args = {docker_binary_, "exec", "-i", container_id};
    args.insert(args.end(), command.begin(), command.end());

    ProcessOptions options;
    options.argv = std::move(args);
    options.stdin_data = stdin_data;
    options.cancel_flag = &control.CancelFlag();
    options.max_output_bytes = control.max_output_bytes;
    options.on_stdout = control.on_stdout;
    options.on_stderr = control.on_stderr;

    auto process = ProcessRunner::Run(options);

    ContainerExecResult exec_result;
    exec_result.started = process.started;
    exec_result.exit_code = process.exit_code;
    exec_result.stdout_output = std::move(process.stdout_output);
    exec_result.stderr_output = std::move(process.stderr_output);
    exec_result.cancelled = process.cancelled;
    exec_result.output_truncated = process.output_truncated;
    exec_result.error_message = std::move(process.error_message);
    exec_result.duration = process.duration;
    return exec_result;
}

// ============================================================================
// RESOURCE MONITORING
// ============================================================================

std::optional<ContainerStats> DockerCli::GetStats(const std::string& container_id,
                                                  const std::atomic<bool>* cancel_flag) {
    auto result = ExecuteDockerCommand({
        "stats",
        "--no-stream",  // Single snapshot
        "--format", "{{json .}}",
        container_id
    }, "", std::chrono::milliseconds(5000), cancel_flag);

    if (result.cancelled) {
        return std::nullopt;
    }
    if (!result.Succeeded()) {
        spdlog::debug("docker stats failed for {}: {}", StringUtils::ShortId(container_id),
                      FirstLine(result.stderr_output));
        return std::nullopt;
    }
    return ParseStatsOutput(FirstLine(result.stdout_output));
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ProcessResult DockerCli::ExecuteDockerCommand(const std::vector<std::string>& args,
                                              const std::string& stdin_data,
                                              std::optional<std::chrono::milliseconds> timeout,
                                              const std::atomic<bool>* cancel_flag) const {
    ProcessOptions options;
    options.argv.reserve(args.size() + 1);
    options.argv.push_back(docker_binary_);
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.stdin_data = stdin_data;
    options.timeout = timeout ? *timeout
                              : std::chrono::duration_cast<std::chrono::milliseconds>(command_timeout_);
    options.cancel_flag = cancel_flag;

    spdlog::debug("Executing: {} {}", docker_binary_, args.empty() ? "" : args.front());
    return ProcessRunner::Run(options);
}

std::vector<std::string> DockerCli::BuildRunCommand(const ContainerSpec& spec) {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("--detach");

    if (!spec.name.empty()) {
        args.push_back("--name");
        args.push_back(spec.name);
    }

    // Isolation backend selection comes first so it is easy to spot in ps output
    args.insert(args.end(), spec.runtime_args.begin(), spec.runtime_args.end());

    args.push_back("--network");
    args.push_back("none");

    if (spec.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(spec.memory_limit_mb) + "m");
        args.push_back("--memory-swap");
        args.push_back(std::to_string(spec.memory_limit_mb) + "m");
    }

    if (spec.cpu_limit > 0) {
        args.push_back("--cpus");
        args.push_back(FormatCpus(spec.cpu_limit));
    }

    if (spec.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(spec.pids_limit));
    }

    args.push_back("--cap-drop");
    args.push_back("ALL");
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");

    args.push_back("--read-only");
    args.push_back("--tmpfs");
    args.push_back("/tmp:rw,noexec,nosuid,size=" + std::to_string(spec.tmpfs_size_mb) + "m");

    if (!spec.user.empty()) {
        args.push_back("--user");
        args.push_back(spec.user);
    }

    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Image (must be last before command)
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    return args;
}

std::optional<ContainerStats> DockerCli::ParseStatsOutput(const std::string& json_line) {
    try {
        json j = json::parse(json_line);
        if (!j.is_object()) {
            return std::nullopt;
        }

        auto cpu = StringUtils::ParsePercent(j.value("CPUPerc", ""));
        if (!cpu) {
            return std::nullopt;
        }

        // Format: "123MiB / 2GiB"
        std::string mem_str = j.value("MemUsage", "");
        auto parts = StringUtils::Split(mem_str, '/');
        if (parts.empty()) {
            return std::nullopt;
        }
        auto usage = StringUtils::ParseSizeToBytes(parts[0]);
        if (!usage) {
            return std::nullopt;
        }

        ContainerStats stats;
        stats.timestamp = std::chrono::steady_clock::now();
        stats.cpu_usage_percent = *cpu;
        stats.memory_usage_bytes = *usage;
        if (parts.size() > 1) {
            stats.memory_limit_bytes = StringUtils::ParseSizeToBytes(parts[1]).value_or(0);
        }
        return stats;
    }
    catch (const json::exception& e) {
        spdlog::warn("Failed to parse stats: {}", e.what());
        return std::nullopt;
    }
}

} // namespace utils
} // namespace faasbox
