/**
 * @file execution_orchestrator.cpp
 * @brief Timeout-raced execution of user code in pooled containers
 *
 * **Timeout Race**:
 * The exec runs on its own task. The calling thread waits on the task's
 * future for at most the request timeout. When the wait expires first, the
 * container's processes are killed and the exec is cancelled; the task then
 * returns promptly with whatever output was captured.
 *
 * **Code Injection**:
 * The program text is written to the interpreter's stdin (`python3 -u -`,
 * `node -`). It is never placed on a command line or in a file.
 *
 * @date 2025
 */

#include "faasbox/core/execution_orchestrator.hpp"
#include "faasbox/monitors/metrics_sampler.hpp"
#include "faasbox/runtime/language_spec.hpp"
#include "faasbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <future>

namespace faasbox {
namespace core {

namespace {

/**
 * @class SlotLease
 * @brief Checks a slot back in exactly once
 *
 * A lease that goes out of scope without Release() checks the slot in as
 * unhealthy, so an unexpected exit path destroys the container.
 */
class SlotLease {
public:
    SlotLease(PoolManager& pool, ContainerSlot slot)
        : pool_(pool), slot_(std::move(slot)) {}

    ~SlotLease() {
        if (!released_) {
            pool_.Checkin(std::move(slot_), false);
        }
    }

    SlotLease(const SlotLease&) = delete;
    SlotLease& operator=(const SlotLease&) = delete;

    ContainerSlot& Slot() { return slot_; }

    void Release(bool healthy) {
        if (released_) {
            return;
        }
        released_ = true;
        pool_.Checkin(std::move(slot_), healthy);
    }

private:
    PoolManager& pool_;
    ContainerSlot slot_;
    bool released_{false};
};

double ElapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

void Fail(ExecutionOutcome& outcome, ErrorKind kind, const std::string& message) {
    outcome.result.success = false;
    outcome.result.error_kind = kind;
    outcome.result.error_message = message;
}

/// docker exec exits 125..127 for its own failures and says so on stderr
bool IsRuntimeFailure(const utils::ContainerExecResult& exec) {
    if (exec.exit_code < 125 || exec.exit_code > 127) {
        return false;
    }
    return utils::StringUtils::Contains(exec.stderr_output, "OCI runtime exec failed") ||
           utils::StringUtils::Contains(exec.stderr_output, "Error response from daemon");
}

/// Copy the result side into the metrics record
void FinalizeMetrics(ExecutionOutcome& outcome) {
    const auto& result = outcome.result;
    auto& metrics = outcome.metrics;

    metrics.error = !result.success;
    metrics.stdout_output = result.stdout_output;
    metrics.stderr_output = result.stderr_output;
    if (!result.success && metrics.stderr_output.empty()) {
        metrics.stderr_output = result.error_message;
    }
}

} // anonymous namespace

ExecutionOrchestrator::ExecutionOrchestrator(utils::ContainerDriver& driver,
                                             PoolManager& pool,
                                             const runtime::BackendRegistry& backends,
                                             const EngineConfig& config)
    : driver_(driver)
    , pool_(pool)
    , backends_(backends)
    , config_(config) {
}

ExecutionOutcome ExecutionOrchestrator::Execute(const ExecutionRequest& request, const OutputStreams* streams) {
    ExecutionOutcome outcome;
    auto& result = outcome.result;
    auto& metrics = outcome.metrics;

    const auto entered = std::chrono::steady_clock::now();
    metrics.function_name = request.function_name;
    metrics.language = request.language;
    metrics.backend = request.backend;
    metrics.timestamp = std::chrono::system_clock::now();

    // ========================================================================
    // Request validation
    // ========================================================================

    auto language = ParseLanguage(request.language);
    const runtime::SandboxBackend* backend = backends_.Find(request.backend);
    if (language) {
        metrics.language = LanguageName(*language);
    }
    if (backend) {
        metrics.backend = backend->Tag();
    }

    std::string invalid;
    if (!language) {
        invalid = "unsupported language: " + request.language;
    } else if (!backend) {
        invalid = "unknown sandbox backend: " + request.backend;
    } else if (request.timeout_seconds <= 0) {
        invalid = "timeout must be a positive number of seconds";
    }

    if (!invalid.empty()) {
        spdlog::warn("Rejected request for {}: {}", request.function_name, invalid);
        Fail(outcome, ErrorKind::INVALID_REQUEST, invalid);
        metrics.response_time_ms = ElapsedMs(entered);
        FinalizeMetrics(outcome);
        return outcome;
    }

    const PoolKey key{*language, backend->Kind()};

    // ========================================================================
    // Checkout
    // ========================================================================

    auto checkout = pool_.Checkout(key);
    if (!checkout.Ok()) {
        Fail(outcome, checkout.error_kind, checkout.error_message);
        metrics.response_time_ms = ElapsedMs(entered);
        FinalizeMetrics(outcome);
        return outcome;
    }

    SlotLease lease(pool_, std::move(*checkout.slot));
    const std::string container_id = lease.Slot().container_id;
    const auto& spec = runtime::GetLanguageSpec(*language);
    const auto timeout = std::chrono::seconds(request.timeout_seconds);

    std::string code = request.code;
    if (!code.empty() && code.back() != '\n') {
        code += '\n';
    }

    utils::ExecControl control;
    control.max_output_bytes = config_.max_output_bytes;
    if (streams) {
        control.on_stdout = streams->on_stdout;
        control.on_stderr = streams->on_stderr;
    }

    spdlog::info("Executing {} ({}) in container {}{} with {}s timeout",
                 request.function_name, key.ToString(), lease.Slot().ShortId(),
                 checkout.cold_start ? " [cold]" : "", request.timeout_seconds);

    // ========================================================================
    // Run, raced against the deadline
    // ========================================================================

    monitors::MetricsSampler sampler(driver_, container_id, config_.sampling_interval);
    sampler.Start();

    auto run = std::async(std::launch::async, [this, &container_id, &spec, &code, &control]() {
        return driver_.Exec(container_id, spec.run_command, code, control);
    });

    bool timed_out = false;
    if (run.wait_for(timeout) == std::future_status::timeout) {
        timed_out = true;
        spdlog::warn("Execution of {} exceeded {}s, killing container {}",
                     request.function_name, request.timeout_seconds, lease.Slot().ShortId());
        if (!driver_.KillContainer(container_id)) {
            spdlog::error("Failed to kill container {}", lease.Slot().ShortId());
        }
        control.Cancel();
    }

    utils::ContainerExecResult exec;
    std::string exec_error;
    try {
        exec = run.get();
    }
    catch (const std::exception& e) {
        exec_error = e.what();
    }

    auto summary = sampler.Stop();

    // ========================================================================
    // Classification
    // ========================================================================

    auto& slot = lease.Slot();
    ++slot.executions;

    result.exit_code = exec.exit_code;
    result.stdout_output = exec.stdout_output;
    result.stderr_output = exec.stderr_output;
    result.output = utils::StringUtils::TrimRight(exec.stdout_output);
    result.output_truncated = exec.output_truncated;

    bool healthy = false;
    if (timed_out) {
        Fail(outcome, ErrorKind::TIMEOUT,
             "execution exceeded the " + std::to_string(request.timeout_seconds) + "s timeout");
    } else if (!exec_error.empty()) {
        Fail(outcome, ErrorKind::INTERNAL, "exec failed: " + exec_error);
    } else if (!exec.started) {
        Fail(outcome, ErrorKind::INTERNAL, "exec failed: " + exec.error_message);
    } else if (exec.exit_code == 0) {
        result.success = true;
        result.error_kind = ErrorKind::NONE;
        healthy = true;
    } else if (IsRuntimeFailure(exec)) {
        Fail(outcome, ErrorKind::INTERNAL,
             "container runtime could not run the interpreter (exit " + std::to_string(exec.exit_code) + ")");
    } else if (exec.exit_code > 128) {
        // Retired either way: a voluntary exit here is indistinguishable from a signal
        ++slot.failures;
        Fail(outcome, ErrorKind::RUNTIME_EXECUTION,
             "exited with status " + std::to_string(exec.exit_code) +
             " (possibly signal " + std::to_string(exec.exit_code - 128) + ")");
    } else {
        ++slot.failures;
        Fail(outcome, ErrorKind::RUNTIME_EXECUTION,
             "exited with status " + std::to_string(exec.exit_code));
        healthy = true;
    }

    lease.Release(healthy);

    // ========================================================================
    // Metrics
    // ========================================================================

    metrics.response_time_ms = summary.elapsed_ms;
    metrics.memory_usage_mb = summary.peak_memory_mb;
    metrics.cpu_usage_percent = summary.avg_cpu_percent;
    metrics.peak_cpu_percent = summary.peak_cpu_percent;
    metrics.sample_count = summary.sample_count;
    metrics.partial_metrics = summary.partial;
    FinalizeMetrics(outcome);

    if (result.success) {
        spdlog::info("Execution of {} succeeded in {:.1f} ms", request.function_name, metrics.response_time_ms);
    } else {
        spdlog::info("Execution of {} failed ({}) in {:.1f} ms: {}", request.function_name,
                     ErrorKindName(result.error_kind), metrics.response_time_ms, result.error_message);
    }

    return outcome;
}

} // namespace core
} // namespace faasbox
