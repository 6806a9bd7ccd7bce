#pragma once

#include "faasbox/utils/container_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace faasbox {
namespace test {

/**
 * In-process container runtime for tests.
 *
 * Programs are matched by substring against a script table:
 *  - "print(1+1)"      -> stdout "2\n", exit 0
 *  - "throw new Error" -> stderr with a stack trace, exit 1
 *  - "raise SystemExit(3)" -> exit 3
 *  - "os.kill"         -> exit 139 (killed by SIGSEGV)
 *  - "sys.exit(126)"   -> exit 126 with empty stderr
 *  - "while True" / "while (true)" -> runs until cancelled or the container is killed
 * Anything else exits 0 with no output.
 */
class FakeContainerDriver : public utils::ContainerDriver {
public:
    struct ScriptedRun {
        std::string stdout_output;
        std::string stderr_output;
        int exit_code{0};
        std::chrono::milliseconds duration{0};
    };

    FakeContainerDriver() {
        Script("print(1+1)", {"2\n", "", 0, std::chrono::milliseconds(5)});
        Script("throw new Error", {"", "[stdin]:1\nthrow new Error('x')\n^\n\nError: x\n    at [stdin]:1:7\n", 1,
                                   std::chrono::milliseconds(5)});
        Script("raise SystemExit(3)", {"", "", 3, std::chrono::milliseconds(1)});
        Script("os.kill", {"", "", 139, std::chrono::milliseconds(1)});
        Script("sys.exit(126)", {"", "", 126, std::chrono::milliseconds(1)});
    }

    // ------------------------------------------------------------------
    // Knobs
    // ------------------------------------------------------------------

    void Script(const std::string& match, ScriptedRun run) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_.emplace_back(match, run);
    }

    void SetAvailable(bool available) { available_ = available; }
    void SetStatsAvailable(bool available) { stats_available_ = available; }
    void SetStatsMemoryBytes(std::uint64_t bytes) { stats_memory_bytes_ = bytes; }
    void SetStatsCpuPercent(double percent) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_cpu_percent_ = percent;
    }
    /// Each stats call takes this long unless abandoned through its cancel flag
    void SetStatsDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_delay_ = delay;
    }
    void SetRemoveFails(bool fails) { remove_fails_ = fails; }
    void FailNextStarts(int count) { fail_next_starts_ = count; }
    void SetStartDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        start_delay_ = delay;
    }
    void SetBuildDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        build_delay_ = delay;
    }

    /// Starts whose run arguments contain this text fail
    void FailStartsMatching(const std::string& runtime_arg) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_start_args_.insert(runtime_arg);
    }

    /// Builds of tags containing this text fail
    void FailBuildsMatching(const std::string& tag_part) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_build_tags_.insert(tag_part);
    }

    void ClearBuildFailures() {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_build_tags_.clear();
    }

    void AddImage(const std::string& tag) {
        std::lock_guard<std::mutex> lock(mutex_);
        images_.insert(tag);
    }

    // ------------------------------------------------------------------
    // Observations
    // ------------------------------------------------------------------

    int BuildCalls() const { return build_calls_.load(); }
    int StartCalls() const { return start_calls_.load(); }
    int ExecCalls() const { return exec_calls_.load(); }
    int StatsCalls() const { return stats_calls_.load(); }
    bool OverlapDetected() const { return overlap_.load(); }

    std::vector<std::string> Removed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed_;
    }

    std::vector<std::string> Killed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return killed_;
    }

    std::vector<utils::ContainerSpec> StartedSpecs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_specs_;
    }

    std::string LastRecipe() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_recipe_;
    }

    std::size_t LiveContainers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return existing_.size();
    }

    bool WasRemoved(const std::string& id) const {
        auto removed = Removed();
        return std::find(removed.begin(), removed.end(), id) != removed.end();
    }

    // ------------------------------------------------------------------
    // ContainerDriver
    // ------------------------------------------------------------------

    bool IsAvailable() override { return available_.load(); }

    bool ImageExists(const std::string& image_tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return images_.count(image_tag) > 0;
    }

    utils::DriverResult BuildImage(const std::string& image_tag, const std::string& dockerfile) override {
        ++build_calls_;
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delay = build_delay_;
            last_recipe_ = dockerfile;
        }
        std::this_thread::sleep_for(delay);

        utils::DriverResult result;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& part : failing_build_tags_) {
            if (image_tag.find(part) != std::string::npos) {
                result.error_message = "failed to solve: base image not found";
                return result;
            }
        }
        images_.insert(image_tag);
        result.success = true;
        result.output = "sha256:" + image_tag;
        return result;
    }

    utils::DriverResult StartContainer(const utils::ContainerSpec& spec) override {
        ++start_calls_;
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delay = start_delay_;
        }
        std::this_thread::sleep_for(delay);

        utils::DriverResult result;
        if (fail_next_starts_.load() > 0) {
            --fail_next_starts_;
            result.error_message = "OCI runtime create failed";
            return result;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& arg : spec.runtime_args) {
            if (failing_start_args_.count(arg) > 0) {
                result.error_message = "unknown or invalid runtime name: " + arg;
                return result;
            }
        }
        if (images_.count(spec.image) == 0) {
            result.error_message = "Unable to find image '" + spec.image + "' locally";
            return result;
        }

        std::ostringstream id;
        id << std::hex << std::setw(64) << std::setfill('0') << ++next_id_;
        existing_.insert(id.str());
        running_.insert(id.str());
        started_specs_.push_back(spec);

        result.success = true;
        result.output = id.str();
        return result;
    }

    bool KillContainer(const std::string& container_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        killed_.push_back(container_id);
        return running_.erase(container_id) > 0;
    }

    bool RemoveContainer(const std::string& container_id) override {
        if (remove_fails_.load()) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (existing_.erase(container_id) == 0) {
            return false;
        }
        running_.erase(container_id);
        removed_.push_back(container_id);
        return true;
    }

    utils::ContainerExecResult Exec(const std::string& container_id,
                                    const std::vector<std::string>& command,
                                    const std::string& stdin_data,
                                    utils::ExecControl& control) override {
        ++exec_calls_;
        utils::ContainerExecResult result;
        result.started = !command.empty();
        auto start = std::chrono::steady_clock::now();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (running_.count(container_id) == 0) {
                result.exit_code = 125;
                result.stderr_output = "Error response from daemon: container is not running\n";
                return result;
            }
            if (!executing_.insert(container_id).second) {
                overlap_ = true;
            }
        }

        if (stdin_data.find("while True") != std::string::npos ||
            stdin_data.find("while (true)") != std::string::npos) {
            while (!control.IsCancelled() && IsRunning(container_id)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            result.cancelled = control.IsCancelled();
            result.exit_code = 137;
        } else {
            ScriptedRun run;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto& [match, scripted] : scripts_) {
                    if (stdin_data.find(match) != std::string::npos) {
                        run = scripted;
                        break;
                    }
                }
            }
            std::this_thread::sleep_for(run.duration);
            if (!run.stdout_output.empty() && control.on_stdout) {
                control.on_stdout(run.stdout_output);
            }
            if (!run.stderr_output.empty() && control.on_stderr) {
                control.on_stderr(run.stderr_output);
            }
            result.stdout_output = run.stdout_output;
            result.stderr_output = run.stderr_output;
            result.exit_code = run.exit_code;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            executing_.erase(container_id);
        }
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    }

    std::optional<utils::ContainerStats> GetStats(const std::string& container_id,
                                                  const std::atomic<bool>* cancel_flag = nullptr) override {
        ++stats_calls_;
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delay = stats_delay_;
        }
        auto deadline = std::chrono::steady_clock::now() + delay;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel_flag && cancel_flag->load()) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (!stats_available_.load()) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_.count(container_id) == 0) {
            return std::nullopt;
        }
        utils::ContainerStats stats;
        stats.cpu_usage_percent = stats_cpu_percent_;
        stats.memory_usage_bytes = stats_memory_bytes_.load();
        stats.memory_limit_bytes = 256ULL * 1024 * 1024;
        stats.timestamp = std::chrono::steady_clock::now();
        return stats;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, ScriptedRun>> scripts_;
    std::set<std::string> images_;
    std::set<std::string> existing_;
    std::set<std::string> running_;
    std::set<std::string> executing_;
    std::set<std::string> failing_start_args_;
    std::set<std::string> failing_build_tags_;
    std::vector<std::string> removed_;
    std::vector<std::string> killed_;
    std::vector<utils::ContainerSpec> started_specs_;
    std::string last_recipe_;
    std::chrono::milliseconds start_delay_{0};
    std::chrono::milliseconds build_delay_{0};
    std::chrono::milliseconds stats_delay_{0};
    double stats_cpu_percent_{12.5};
    std::uint64_t next_id_{0};

    std::atomic<bool> available_{true};
    std::atomic<bool> stats_available_{true};
    std::atomic<bool> remove_fails_{false};
    std::atomic<std::uint64_t> stats_memory_bytes_{8ULL * 1024 * 1024};
    std::atomic<int> fail_next_starts_{0};
    std::atomic<int> build_calls_{0};
    std::atomic<int> start_calls_{0};
    std::atomic<int> exec_calls_{0};
    std::atomic<int> stats_calls_{0};
    std::atomic<bool> overlap_{false};

    bool IsRunning(const std::string& container_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_.count(container_id) > 0;
    }
};

} // namespace test
} // namespace faasbox
