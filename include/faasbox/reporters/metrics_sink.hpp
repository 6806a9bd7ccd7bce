/**
 * @file metrics_sink.hpp
 * @brief Destinations for per-execution metrics records
 *
 * The engine writes exactly one record per execution and never reads them
 * back.
 *
 * @date 2025
 */

#pragma once

#include "faasbox/core/types.hpp"

#include <string>
#include <vector>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace faasbox {
namespace reporters {

/**
 * @class MetricsSink
 * @brief Append-only metrics destination
 *
 * **Thread Safety**: Append() may be called concurrently.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    /**
     * @brief Prepare the sink for writing
     * @param error Receives the reason on failure
     */
    virtual bool Open(std::string& error) = 0;

    /// Append one record; false if it could not be written
    virtual bool Append(const core::MetricsRecord& record) = 0;
};

/**
 * @class JsonlMetricsSink
 * @brief One JSON object per line, flushed per record
 *
 * **Line Format**:
 * @code
 * {"function_name":"add","runtime":"runc","timestamp":"2025-01-01T00:00:00.000Z",
 *  "response_time":41.2,"error":false,"stdout":"2\n","stderr":"",
 *  "memory_usage":7.9,"cpu_usage":1.4,"language":"python",
 *  "peak_cpu_usage":2.0,"partial_metrics":false,"samples":1}
 * @endcode
 */
class JsonlMetricsSink final : public MetricsSink {
public:
    explicit JsonlMetricsSink(std::filesystem::path path);

    bool Open(std::string& error) override;
    bool Append(const core::MetricsRecord& record) override;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    std::ofstream file_;

    bool OpenLocked(std::string& error);
};

/**
 * @class MemoryMetricsSink
 * @brief Keeps records in memory
 */
class MemoryMetricsSink final : public MetricsSink {
public:
    bool Open(std::string& error) override;
    bool Append(const core::MetricsRecord& record) override;

    std::vector<core::MetricsRecord> Records() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::vector<core::MetricsRecord> records_;
};

} // namespace reporters
} // namespace faasbox
