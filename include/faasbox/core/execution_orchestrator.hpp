/**
 * @file execution_orchestrator.hpp
 * @brief Runs one function invocation inside a pooled sandbox container
 *
 * **Execution Workflow**:
 * ```
 * validate request
 *   -> Checkout(language, backend)
 *   -> start sampler
 *   -> exec interpreter with code on stdin   } raced against
 *   -> stream stdout / stderr                }   the timeout
 *   -> [deadline] kill container processes, cancel exec
 *   -> stop sampler
 *   -> classify, Checkin(slot, healthy) exactly once
 * ```
 *
 * **Reuse Decision**:
 * | Outcome                                | Result kind        | Container      |
 * |----------------------------------------|--------------------|----------------|
 * | exit 0                                 | NONE               | reused         |
 * | exit 1..124                            | RUNTIME_EXECUTION  | reused         |
 * | killed by signal (exit > 128)          | RUNTIME_EXECUTION  | destroyed      |
 * | deadline expired                       | TIMEOUT            | destroyed      |
 * | exec client failure (125..127, no run) | INTERNAL           | destroyed      |
 *
 * A reused container is still retired by the pool once it exceeds its
 * execution or failure budget.
 *
 * @date 2025
 */

#pragma once

#include "faasbox/core/types.hpp"
#include "faasbox/core/engine_config.hpp"
#include "faasbox/core/pool_manager.hpp"
#include "faasbox/runtime/sandbox_backend.hpp"
#include "faasbox/utils/container_utils.hpp"

#include <string>
#include <functional>

namespace faasbox {
namespace core {

/**
 * @struct OutputStreams
 * @brief Observers of a running execution's output
 *
 * Called from the exec thread with each chunk as it is produced.
 */
struct OutputStreams {
    std::function<void(const std::string&)> on_stdout;
    std::function<void(const std::string&)> on_stderr;
};

/**
 * @class ExecutionOrchestrator
 * @brief Checkout, run, observe and release
 *
 * **Thread Safety**: Execute() may be called concurrently; every call runs
 * on its own slot. There is no per-function serialization.
 */
class ExecutionOrchestrator {
public:
    ExecutionOrchestrator(utils::ContainerDriver& driver,
                          PoolManager& pool,
                          const runtime::BackendRegistry& backends,
                          const EngineConfig& config);

    /**
     * @brief Run one request to completion, failure or timeout
     *
     * Never throws for per-execution failures; every outcome, including
     * invalid requests, carries a filled metrics record.
     *
     * @param request Code, language, timeout, backend, function name
     * @param streams Optional live output observers
     */
    ExecutionOutcome Execute(const ExecutionRequest& request, const OutputStreams* streams = nullptr);

private:
    utils::ContainerDriver& driver_;
    PoolManager& pool_;
    const runtime::BackendRegistry& backends_;
    const EngineConfig& config_;
};

} // namespace core
} // namespace faasbox
