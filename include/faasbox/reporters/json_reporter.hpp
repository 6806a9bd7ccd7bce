/**
 * @file json_reporter.hpp
 * @brief JSON renderings of execution results, comparisons and reports
 *
 * Field names follow the metrics log of the service this engine backs:
 * `runtime` for the backend tag, `response_time` in milliseconds,
 * `memory_usage` in MB, `cpu_usage` in percent.
 *
 * @date 2025
 */

#pragma once

#include "faasbox/core/types.hpp"
#include "faasbox/core/comparator.hpp"
#include "faasbox/core/pool_manager.hpp"
#include "faasbox/core/image_provisioner.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <chrono>

namespace faasbox {
namespace core {
struct InitReport;
} // namespace core

namespace reporters {

using json = nlohmann::json;

/**
 * @class JsonReporter
 * @brief Stateless JSON serialization
 */
class JsonReporter {
public:
    /// Metrics log line
    static json ToJson(const core::MetricsRecord& record);

    /// Result and metrics of one execution
    static json ToJson(const core::ExecutionOutcome& outcome);

    /**
     * @brief Comparison keyed by backend
     *
     * Each side carries response_time, memory_usage, cpu_usage and output,
     * plus error, error_kind and stderr.
     */
    static json ToJson(const core::ComparisonResult& comparison);

    static json ToJson(const core::InitReport& report);
    static json ToJson(const core::PoolStats& stats);
    static json ToJson(const core::ProvisionResult& result);

    /// ISO 8601 UTC with milliseconds
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

private:
    static json ComparisonSide(const core::ExecutionOutcome& outcome);
};

} // namespace reporters
} // namespace faasbox
