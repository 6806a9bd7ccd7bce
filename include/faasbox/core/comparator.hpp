/**
 * @file comparator.hpp
 * @brief Side-by-side execution of one request on both sandbox backends
 *
 * @date 2025
 */

#pragma once

#include "faasbox/core/types.hpp"
#include "faasbox/core/execution_orchestrator.hpp"

#include <string>

namespace faasbox {
namespace core {

/**
 * @struct ComparisonRequest
 * @brief An execution request without a backend
 */
struct ComparisonRequest {
    std::string code;
    std::string language;
    int timeout_seconds{5};
    std::string function_name;
};

/**
 * @struct ComparisonResult
 * @brief One independent outcome per backend
 */
struct ComparisonResult {
    ExecutionOutcome runc;    ///< Namespace isolation
    ExecutionOutcome runsc;   ///< gVisor
};

/**
 * @class Comparator
 * @brief Runs identical input under runc, then runsc
 *
 * The runs are sequential so one does not perturb the other's timing and
 * resource figures. Each side's failure is reported as-is next to the other
 * side's outcome; nothing is retried or averaged.
 */
class Comparator {
public:
    explicit Comparator(ExecutionOrchestrator& orchestrator);

    ComparisonResult Compare(const ComparisonRequest& request);

private:
    ExecutionOrchestrator& orchestrator_;

    ExecutionOutcome RunOn(const ComparisonRequest& request, BackendKind backend);
};

} // namespace core
} // namespace faasbox
