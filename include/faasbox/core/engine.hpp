/**
 * @file engine.hpp
 * @brief Sandboxed execution engine facade
 *
 * Wires the container driver, image provisioner, pool manager, execution
 * orchestrator, comparator and metrics sink together, and runs the
 * initialization phase.
 *
 * **Component Graph**:
 * ```
 * Engine
 *  ├─ ContainerDriver (DockerCli)
 *  ├─ BackendRegistry (runc, runsc)
 *  ├─ ImageProvisioner ──> driver
 *  ├─ PoolManager ───────> driver, provisioner
 *  ├─ ExecutionOrchestrator ──> pool, driver (+ MetricsSampler per run)
 *  ├─ Comparator ────────> orchestrator
 *  └─ MetricsSink (JSON lines)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "faasbox/core/types.hpp"
#include "faasbox/core/engine_config.hpp"
#include "faasbox/core/image_provisioner.hpp"
#include "faasbox/core/pool_manager.hpp"
#include "faasbox/core/execution_orchestrator.hpp"
#include "faasbox/core/comparator.hpp"
#include "faasbox/reporters/metrics_sink.hpp"
#include "faasbox/runtime/sandbox_backend.hpp"
#include "faasbox/utils/container_utils.hpp"

#include <string>
#include <vector>
#include <memory>
#include <atomic>

namespace faasbox {
namespace core {

/**
 * @struct StepResult
 * @brief Outcome of one initialization step
 */
struct StepResult {
    std::string name;     ///< "runtime-check", "metrics-sink", "images", "prewarm"
    bool ok{false};
    std::string message;
};

/**
 * @struct InitReport
 * @brief Outcome of the initialization phase
 */
struct InitReport {
    bool ok{false};                   ///< Engine is able to serve at least one pair
    std::vector<StepResult> steps;    ///< In execution order; stops at the first fatal step
    std::vector<PoolKey> disabled;    ///< Pairs whose image could not be provisioned
};

/**
 * @class Engine
 * @brief Entry point for callers of the execution engine
 *
 * **Usage Example**:
 * @code
 * Engine engine(EngineConfigBuilder().WithMinIdle(1).Build());
 *
 * auto report = engine.Initialize();
 * if (!report.ok) {
 *     return 1;
 * }
 *
 * ExecutionRequest request;
 * request.code = "print(1+1)";
 * request.language = "python";
 * request.backend = "runc";
 * request.timeout_seconds = 5;
 * request.function_name = "add";
 *
 * auto outcome = engine.Execute(request);   // outcome.result.output == "2"
 * @endcode
 *
 * **Thread Safety**: Execute(), Compare() and Prewarm() may be called
 * concurrently once Initialize() has returned.
 */
class Engine {
public:
    /// Engine on the docker CLI, writing metrics to config.metrics_log
    explicit Engine(const EngineConfig& config);

    /**
     * @brief Engine on an explicit driver and sink
     * @param config Engine configuration
     * @param driver Container runtime
     * @param sink Metrics destination
     */
    Engine(const EngineConfig& config,
           std::unique_ptr<utils::ContainerDriver> driver,
           std::unique_ptr<reporters::MetricsSink> sink);

    /// Runs Shutdown()
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Run the initialization phase
     *
     * Steps, in order:
     * 1. runtime-check: container runtime reachable (fatal)
     * 2. metrics-sink: metrics sink opened (fatal)
     * 3. images: every pair provisioned; failed pairs are disabled
     * 4. prewarm: idle containers started for every enabled pair
     *    (skipped if prewarm_on_start is off)
     *
     * Never throws; every failure is reported in the returned InitReport.
     */
    InitReport Initialize();

    /**
     * @brief Execute one request and append its metrics record
     *
     * Requests for a disabled pair fail with IMAGE_BUILD.
     */
    ExecutionOutcome Execute(const ExecutionRequest& request, const OutputStreams* streams = nullptr);

    /// Execute on runc and runsc; appends both metrics records
    ComparisonResult Compare(const ComparisonRequest& request);

    /**
     * @brief Start idle containers for a pair in the background
     * @return false if the language or backend tag is unknown or not enabled
     */
    bool Prewarm(const std::string& language, const std::string& backend, std::size_t count);

    /// Provision every pair; retries pairs that failed before
    std::vector<ProvisionResult> EnsureImages();

    PoolStats GetPoolStats(const PoolKey& key) const;

    /// Block until background prewarm and container removals have finished
    void WaitForBackgroundTasks();

    std::vector<PoolKey> Keys() const { return config_.Keys(); }
    const EngineConfig& GetConfig() const { return config_; }

    /**
     * @brief Stop replenishment and remove every idle container
     *
     * Idempotent.
     */
    void Shutdown();

private:
    EngineConfig config_;
    std::unique_ptr<utils::ContainerDriver> driver_;
    std::unique_ptr<reporters::MetricsSink> sink_;
    runtime::BackendRegistry backends_;
    std::unique_ptr<ImageProvisioner> provisioner_;
    std::unique_ptr<PoolManager> pool_;
    std::unique_ptr<ExecutionOrchestrator> orchestrator_;
    std::unique_ptr<Comparator> comparator_;
    std::atomic<bool> shut_down_{false};

    void Record(const MetricsRecord& record);
};

} // namespace core
} // namespace faasbox
