/**
 * @file comparator.cpp
 * @brief Dual-backend comparison runs
 *
 * @date 2025
 */

#include "faasbox/core/comparator.hpp"

#include <spdlog/spdlog.h>

namespace faasbox {
namespace core {

Comparator::Comparator(ExecutionOrchestrator& orchestrator)
    : orchestrator_(orchestrator) {
}

ComparisonResult Comparator::Compare(const ComparisonRequest& request) {
    spdlog::info("Comparing {} on runc and runsc", request.function_name);

    ComparisonResult comparison;
    comparison.runc = RunOn(request, BackendKind::RUNC);
    comparison.runsc = RunOn(request, BackendKind::RUNSC);

    spdlog::info("Comparison of {}: runc {} in {:.1f} ms, runsc {} in {:.1f} ms",
                 request.function_name,
                 comparison.runc.result.success ? "ok" : ErrorKindName(comparison.runc.result.error_kind),
                 comparison.runc.metrics.response_time_ms,
                 comparison.runsc.result.success ? "ok" : ErrorKindName(comparison.runsc.result.error_kind),
                 comparison.runsc.metrics.response_time_ms);

    return comparison;
}

ExecutionOutcome Comparator::RunOn(const ComparisonRequest& request, BackendKind backend) {
    ExecutionRequest exec;
    exec.code = request.code;
    exec.language = request.language;
    exec.timeout_seconds = request.timeout_seconds;
    exec.backend = BackendTag(backend);
    exec.function_name = request.function_name;
    return orchestrator_.Execute(exec);
}

} // namespace core
} // namespace faasbox
