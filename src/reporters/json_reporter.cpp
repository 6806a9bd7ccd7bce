/**
 * @file json_reporter.cpp
 * @brief JSON serialization of engine results
 *
 * **Comparison Shape**:
 * ```json
 * {
 *   "function_name": "add",
 *   "runc":  {"response_time": 41.2, "memory_usage": 7.9, "cpu_usage": 1.4,
 *             "output": "2", "error": false, "error_kind": "none", "stderr": ""},
 *   "runsc": {...}
 * }
 * ```
 *
 * @date 2025
 */

#include "faasbox/reporters/json_reporter.hpp"
#include "faasbox/core/engine.hpp"

#include <sstream>
#include <iomanip>
#include <ctime>

namespace faasbox {
namespace reporters {

json JsonReporter::ToJson(const core::MetricsRecord& record) {
    return json{
        {"function_name", record.function_name},
        {"runtime", record.backend},
        {"timestamp", FormatTimestamp(record.timestamp)},
        {"response_time", record.response_time_ms},
        {"error", record.error},
        {"stdout", record.stdout_output},
        {"stderr", record.stderr_output},
        {"memory_usage", record.memory_usage_mb},
        {"cpu_usage", record.cpu_usage_percent},
        {"language", record.language},
        {"peak_cpu_usage", record.peak_cpu_percent},
        {"partial_metrics", record.partial_metrics},
        {"samples", record.sample_count}
    };
}

json JsonReporter::ToJson(const core::ExecutionOutcome& outcome) {
    const auto& result = outcome.result;

    json j;
    j["output"] = result.output;
    j["stdout"] = result.stdout_output;
    j["stderr"] = result.stderr_output;
    j["success"] = result.success;
    j["exit_code"] = result.exit_code;
    if (!result.success) {
        j["error_kind"] = core::ErrorKindName(result.error_kind);
        j["error"] = result.error_message;
    }
    if (result.output_truncated) {
        j["output_truncated"] = true;
    }
    j["metrics"] = ToJson(outcome.metrics);
    return j;
}

json JsonReporter::ToJson(const core::ComparisonResult& comparison) {
    return json{
        {"function_name", comparison.runc.metrics.function_name},
        {"runc", ComparisonSide(comparison.runc)},
        {"runsc", ComparisonSide(comparison.runsc)}
    };
}

json JsonReporter::ToJson(const core::InitReport& report) {
    json steps = json::array();
    for (const auto& step : report.steps) {
        steps.push_back({
            {"name", step.name},
            {"ok", step.ok},
            {"message", step.message}
        });
    }

    json disabled = json::array();
    for (const auto& key : report.disabled) {
        disabled.push_back(key.ToString());
    }

    return json{
        {"ok", report.ok},
        {"steps", steps},
        {"disabled_pairs", disabled}
    };
}

json JsonReporter::ToJson(const core::PoolStats& stats) {
    return json{
        {"pool", stats.key.ToString()},
        {"idle", stats.idle},
        {"busy", stats.busy},
        {"starting", stats.starting},
        {"total", stats.total},
        {"pending_destroy", stats.pending_destroy},
        {"started_total", stats.started_total},
        {"destroyed_total", stats.destroyed_total},
        {"start_failures", stats.start_failures}
    };
}

json JsonReporter::ToJson(const core::ProvisionResult& result) {
    json j{
        {"pool", result.key.ToString()},
        {"success", result.success},
        {"built", result.built},
        {"image", result.image_tag}
    };
    if (!result.success) {
        j["error"] = result.error_message;
    }
    return j;
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

json JsonReporter::ComparisonSide(const core::ExecutionOutcome& outcome) {
    return json{
        {"response_time", outcome.metrics.response_time_ms},
        {"memory_usage", outcome.metrics.memory_usage_mb},
        {"cpu_usage", outcome.metrics.cpu_usage_percent},
        {"output", outcome.result.output},
        {"error", !outcome.result.success},
        {"error_kind", core::ErrorKindName(outcome.result.error_kind)},
        {"stderr", outcome.metrics.stderr_output},
        {"partial_metrics", outcome.metrics.partial_metrics}
    };
}

} // namespace reporters
} // namespace faasbox
