/**
 * @file metrics_sink.cpp
 * @brief JSON-lines and in-memory metrics sinks
 *
 * @date 2025
 */

#include "faasbox/reporters/metrics_sink.hpp"
#include "faasbox/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace faasbox {
namespace reporters {

// ============================================================================
// JSONL SINK
// ============================================================================

JsonlMetricsSink::JsonlMetricsSink(std::filesystem::path path)
    : path_(std::move(path)) {
}

bool JsonlMetricsSink::Open(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    return OpenLocked(error);
}

bool JsonlMetricsSink::Append(const core::MetricsRecord& record) {
    std::string line = JsonReporter::ToJson(record).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    std::string error;
    if (!OpenLocked(error)) {
        spdlog::error("Dropping metrics record for {}: {}", record.function_name, error);
        return false;
    }

    file_ << line << '\n';
    file_.flush();
    if (!file_) {
        spdlog::error("Failed to write metrics record to {}", path_.string());
        file_.close();
        file_.clear();
        return false;
    }
    return true;
}

bool JsonlMetricsSink::OpenLocked(std::string& error) {
    if (file_.is_open()) {
        return true;
    }

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            error = "cannot create " + path_.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    file_.open(path_, std::ios::out | std::ios::app);
    if (!file_) {
        error = "cannot open metrics log " + path_.string();
        file_.clear();
        return false;
    }

    spdlog::debug("Metrics log: {}", path_.string());
    return true;
}

// ============================================================================
// MEMORY SINK
// ============================================================================

bool MemoryMetricsSink::Open(std::string& /*error*/) {
    return true;
}

bool MemoryMetricsSink::Append(const core::MetricsRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    return true;
}

std::vector<core::MetricsRecord> MemoryMetricsSink::Records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t MemoryMetricsSink::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace reporters
} // namespace faasbox
