/**
 * @file metrics_sampler.cpp
 * @brief Interval resource sampling of one container
 *
 * @date 2025
 */

#include "faasbox/monitors/metrics_sampler.hpp"
#include "faasbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace faasbox {
namespace monitors {

namespace {

constexpr double kBytesPerMiB = 1024.0 * 1024.0;

} // anonymous namespace

MetricsSampler::MetricsSampler(utils::ContainerDriver& driver,
                               std::string container_id,
                               std::chrono::milliseconds interval)
    : driver_(driver)
    , container_id_(std::move(container_id))
    , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1)) {
}

MetricsSampler::~MetricsSampler() {
    if (running_) {
        Stop();
    }
}

void MetricsSampler::Start() {
    if (running_) {
        spdlog::warn("Sampler for {} already running", utils::StringUtils::ShortId(container_id_));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        peak_memory_mb_ = 0.0;
        cpu_sum_ = 0.0;
        peak_cpu_ = 0.0;
        sample_count_ = 0;
        failed_samples_ = 0;
        sample_cut_off_ = false;
    }

    cancel_sample_ = false;
    running_ = true;
    start_time_ = std::chrono::steady_clock::now();
    thread_ = std::thread(&MetricsSampler::SampleLoop, this);
}

SampleSummary MetricsSampler::Stop() {
    SampleSummary summary;
    if (!running_) {
        return summary;
    }

    auto end_time = std::chrono::steady_clock::now();
    summary.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time_).count();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cancel_sample_ = true;
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;

    bool attempt_final = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attempt_final = sample_count_ == 0 && !sample_cut_off_;
    }
    if (attempt_final) {
        // The run finished before the loop got to its first sample
        TakeSample(nullptr);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    summary.peak_memory_mb = peak_memory_mb_;
    summary.peak_cpu_percent = peak_cpu_;
    summary.avg_cpu_percent = sample_count_ > 0 ? cpu_sum_ / static_cast<double>(sample_count_) : 0.0;
    summary.sample_count = sample_count_;
    summary.failed_samples = failed_samples_;
    summary.partial = sample_count_ == 0 || failed_samples_ > 0;

    spdlog::debug("Sampled {} for {:.1f} ms: {} samples ({} failed), peak {:.1f} MB, avg cpu {:.1f}%",
                  utils::StringUtils::ShortId(container_id_), summary.elapsed_ms,
                  summary.sample_count, summary.failed_samples,
                  summary.peak_memory_mb, summary.avg_cpu_percent);
    return summary;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

void MetricsSampler::SampleLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        lock.unlock();
        TakeSample(&cancel_sample_);
        lock.lock();

        wake_.wait_for(lock, interval_, [this]() { return stop_requested_; });
    }
}

bool MetricsSampler::TakeSample(const std::atomic<bool>* cancel_flag) {
    auto stats = driver_.GetStats(container_id_, cancel_flag);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!stats && cancel_flag && cancel_flag->load()) {
        // Abandoned by Stop(), not a runtime failure
        sample_cut_off_ = true;
        return false;
    }
    if (!stats) {
        ++failed_samples_;
        return false;
    }

    double memory_mb = static_cast<double>(stats->memory_usage_bytes) / kBytesPerMiB;
    peak_memory_mb_ = std::max(peak_memory_mb_, memory_mb);
    peak_cpu_ = std::max(peak_cpu_, stats->cpu_usage_percent);
    cpu_sum_ += stats->cpu_usage_percent;
    ++sample_count_;
    return true;
}

} // namespace monitors
} // namespace faasbox
