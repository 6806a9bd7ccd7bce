/**
 * @file metrics_sampler.hpp
 * @brief Resource sampling over the lifetime of one execution
 *
 * Polls the container runtime for the memory and CPU usage of one container
 * at a fixed interval on a background thread, and measures the wall-clock
 * window between Start() and Stop().
 *
 * @date 2025
 */

#pragma once

#include "faasbox/utils/container_utils.hpp"

#include <string>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <cstddef>

namespace faasbox {
namespace monitors {

/**
 * @struct SampleSummary
 * @brief Aggregated observations of one sampling window
 */
struct SampleSummary {
    double elapsed_ms{0.0};         ///< Start() to Stop() wall-clock time
    double peak_memory_mb{0.0};     ///< Highest memory sample
    double avg_cpu_percent{0.0};    ///< Mean of the CPU samples
    double peak_cpu_percent{0.0};   ///< Highest CPU sample
    std::size_t sample_count{0};    ///< Successful samples
    std::size_t failed_samples{0};  ///< Samples the runtime could not answer
    bool partial{false};            ///< Some or all of the window is unobserved
};

/**
 * @class MetricsSampler
 * @brief Interval sampler bound to one container
 *
 * **Usage Example**:
 * @code
 * MetricsSampler sampler(driver, container_id, std::chrono::milliseconds(250));
 * sampler.Start();
 * auto exec = driver.Exec(container_id, command, code, control);
 * auto summary = sampler.Stop();
 * @endcode
 *
 * Stop() abandons a sample still in flight instead of waiting for the
 * runtime to answer it. A window in which no sample was attempted gets
 * one attempt at Stop(). A window left without a successful sample is
 * marked partial; a failing sample never fails the execution.
 *
 * **Thread Safety**: Start() and Stop() must be called from one thread.
 */
class MetricsSampler {
public:
    MetricsSampler(utils::ContainerDriver& driver,
                   std::string container_id,
                   std::chrono::milliseconds interval);

    /// Stops sampling if still running
    ~MetricsSampler();

    MetricsSampler(const MetricsSampler&) = delete;
    MetricsSampler& operator=(const MetricsSampler&) = delete;

    /// Begin the window and the sampling thread
    void Start();

    /**
     * @brief End the window
     *
     * The window closes when Stop() is called. An in-flight sample is
     * cancelled, so Stop() returns without waiting on the runtime.
     */
    SampleSummary Stop();

    bool IsRunning() const { return running_; }

private:
    utils::ContainerDriver& driver_;
    std::string container_id_;
    std::chrono::milliseconds interval_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_{false};
    bool running_{false};
    std::atomic<bool> cancel_sample_{false};

    std::chrono::steady_clock::time_point start_time_;

    // Accumulators, guarded by mutex_
    double peak_memory_mb_{0.0};
    double cpu_sum_{0.0};
    double peak_cpu_{0.0};
    std::size_t sample_count_{0};
    std::size_t failed_samples_{0};
    bool sample_cut_off_{false};

    void SampleLoop();
    bool TakeSample(const std::atomic<bool>* cancel_flag);
};

} // namespace monitors
} // namespace faasbox
