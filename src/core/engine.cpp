/**
 * @file engine.cpp
 * @brief Engine wiring and initialization phase
 *
 * @date 2025
 */

#include "faasbox/core/engine.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace faasbox {
namespace core {

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

Engine::Engine(const EngineConfig& config)
    : Engine(config,
             std::make_unique<utils::DockerCli>(config.docker_binary),
             std::make_unique<reporters::JsonlMetricsSink>(config.metrics_log)) {
}

Engine::Engine(const EngineConfig& config,
               std::unique_ptr<utils::ContainerDriver> driver,
               std::unique_ptr<reporters::MetricsSink> sink)
    : config_(config)
    , driver_(std::move(driver))
    , sink_(std::move(sink)) {
    if (!driver_ || !sink_) {
        throw std::invalid_argument("engine requires a container driver and a metrics sink");
    }

    std::string error;
    if (!ValidateConfig(config_, error)) {
        throw std::invalid_argument("invalid engine configuration: " + error);
    }

    provisioner_ = std::make_unique<ImageProvisioner>(*driver_, backends_, config_.Keys());
    pool_ = std::make_unique<PoolManager>(*driver_, backends_, *provisioner_, config_);
    orchestrator_ = std::make_unique<ExecutionOrchestrator>(*driver_, *pool_, backends_, config_);
    comparator_ = std::make_unique<Comparator>(*orchestrator_);

    spdlog::debug("Engine created with {} pool(s)", config_.Keys().size());
}

Engine::~Engine() {
    Shutdown();
}

// ============================================================================
// INITIALIZATION PHASE
// ============================================================================

InitReport Engine::Initialize() {
    InitReport report;
    spdlog::info("Initializing execution engine");

    // 1. Container runtime
    {
        StepResult step{"runtime-check", false, ""};
        step.ok = driver_->IsAvailable();
        step.message = step.ok ? "container runtime reachable" : "container runtime not reachable";
        report.steps.push_back(step);
        if (!step.ok) {
            spdlog::error("Initialization aborted: {}", step.message);
            return report;
        }
    }

    // 2. Metrics sink
    {
        StepResult step{"metrics-sink", false, ""};
        std::string error;
        step.ok = sink_->Open(error);
        step.message = step.ok ? "metrics sink ready" : error;
        report.steps.push_back(step);
        if (!step.ok) {
            spdlog::error("Initialization aborted: {}", step.message);
            return report;
        }
    }

    // 3. Images
    std::vector<PoolKey> enabled;
    {
        StepResult step{"images", true, ""};
        std::size_t built = 0;
        std::vector<std::string> failures;

        for (const auto& result : provisioner_->EnsureImages()) {
            if (result.success) {
                enabled.push_back(result.key);
                if (result.built) {
                    ++built;
                }
            } else {
                report.disabled.push_back(result.key);
                failures.push_back(result.key.ToString() + ": " + result.error_message);
            }
        }

        step.ok = failures.empty();
        step.message = std::to_string(enabled.size()) + " pair(s) ready, " +
                       std::to_string(built) + " built";
        for (const auto& failure : failures) {
            step.message += "; disabled " + failure;
        }
        report.steps.push_back(step);

        for (const auto& key : report.disabled) {
            spdlog::error("Pair {} disabled: runtime image unavailable", key.ToString());
        }
    }

    // 4. Prewarm
    {
        StepResult step{"prewarm", true, ""};
        if (!config_.prewarm_on_start) {
            step.message = "skipped";
        } else {
            std::size_t requested = 0;
            for (const auto& key : enabled) {
                std::size_t count = config_.PoolConfigFor(key).min_idle;
                pool_->Prewarm(key, count);
                requested += count;
            }
            step.message = std::to_string(requested) + " container(s) requested across " +
                           std::to_string(enabled.size()) + " pair(s)";
        }
        report.steps.push_back(step);
    }

    report.ok = !enabled.empty();
    if (report.ok) {
        spdlog::info("Engine ready ({} of {} pairs enabled)", enabled.size(), config_.Keys().size());
    } else {
        spdlog::error("Engine has no usable language/backend pair");
    }
    return report;
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionOutcome Engine::Execute(const ExecutionRequest& request, const OutputStreams* streams) {
    auto outcome = orchestrator_->Execute(request, streams);
    Record(outcome.metrics);
    return outcome;
}

ComparisonResult Engine::Compare(const ComparisonRequest& request) {
    auto comparison = comparator_->Compare(request);
    Record(comparison.runc.metrics);
    Record(comparison.runsc.metrics);
    return comparison;
}

bool Engine::Prewarm(const std::string& language, const std::string& backend, std::size_t count) {
    auto parsed_language = ParseLanguage(language);
    auto parsed_backend = ParseBackend(backend);
    if (!parsed_language || !parsed_backend) {
        spdlog::warn("Cannot prewarm {}/{}: unknown language or backend", language, backend);
        return false;
    }

    PoolKey key{*parsed_language, *parsed_backend};
    if (!pool_->HasKey(key)) {
        spdlog::warn("Cannot prewarm {}: pair not enabled", key.ToString());
        return false;
    }

    pool_->Prewarm(key, count);
    return true;
}

std::vector<ProvisionResult> Engine::EnsureImages() {
    return provisioner_->EnsureImages();
}

PoolStats Engine::GetPoolStats(const PoolKey& key) const {
    return pool_->GetStats(key);
}

void Engine::WaitForBackgroundTasks() {
    pool_->WaitForBackgroundTasks();
}

void Engine::Shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    pool_->Shutdown();
    pool_->WaitForBackgroundTasks();
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

void Engine::Record(const MetricsRecord& record) {
    if (!sink_->Append(record)) {
        spdlog::warn("Metrics record for {} on {} was not persisted", record.function_name, record.backend);
    }
}

} // namespace core
} // namespace faasbox
