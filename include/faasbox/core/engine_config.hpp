/**
 * @file engine_config.hpp
 * @brief Engine configuration, JSON loading and validation
 *
 * **JSON Layout**:
 * @code
 * {
 *   "languages": ["python", "node"],
 *   "backends": ["runc", "runsc"],
 *   "pool": { "min_idle": 1, "max_total": 4, "max_executions": 50,
 *             "max_failures": 5, "max_idle_age_s": 300,
 *             "exhaustion_policy": "fail_fast", "checkout_wait_ms": 2000,
 *             "start_retries": 1 },
 *   "pools": { "python/runsc": { "max_total": 2 } },
 *   "container": { "memory_limit_mb": 256, "cpu_limit": 1.0, "pids_limit": 64 },
 *   "sampling_interval_ms": 250,
 *   "metrics_log": "metrics.jsonl",
 *   "prewarm_on_start": true,
 *   "docker_binary": "docker"
 * }
 * @endcode
 *
 * Every field is optional; missing fields keep their defaults.
 *
 * @date 2025
 */

#pragma once

#include "faasbox/core/types.hpp"

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <filesystem>

namespace faasbox {
namespace core {

/**
 * @struct ContainerLimits
 * @brief Resource constraints applied to every sandbox container
 */
struct ContainerLimits {
    std::size_t memory_limit_mb{256};   ///< Hard memory limit, swap disabled
    double cpu_limit{1.0};              ///< CPU cores
    int pids_limit{64};                 ///< Fork-bomb guard
    std::size_t tmpfs_size_mb{64};      ///< Writable /tmp
};

/**
 * @struct EngineConfig
 * @brief Complete engine configuration
 *
 * Defaults reproduce the service this engine backs: python and node on both
 * runc and runsc, prewarmed at startup.
 */
struct EngineConfig {
    std::vector<Language> languages{Language::PYTHON, Language::NODE};
    std::vector<BackendKind> backends{BackendKind::RUNC, BackendKind::RUNSC};

    PoolConfig default_pool;                          ///< Applies to every key
    std::map<PoolKey, PoolConfig> pool_overrides;     ///< Per-key replacement

    ContainerLimits container;
    std::chrono::milliseconds sampling_interval{250};
    std::filesystem::path metrics_log{"metrics.jsonl"};
    bool prewarm_on_start{true};
    std::string docker_binary{"docker"};
    std::size_t max_output_bytes{1024 * 1024};       ///< Per-stream capture cap

    /// Pool configuration effective for a key
    const PoolConfig& PoolConfigFor(const PoolKey& key) const;

    /// Every configured (language, backend) pair
    std::vector<PoolKey> Keys() const;
};

/**
 * @brief Check a configuration for consistency
 * @param config Configuration to check
 * @param error Receives the first problem found
 * @return true if the configuration is usable
 */
bool ValidateConfig(const EngineConfig& config, std::string& error);

/**
 * @brief Parse a JSON configuration document
 * @return Configuration, or nullopt with error set
 */
std::optional<EngineConfig> ParseConfig(const std::string& json_text, std::string& error);

/// Read and parse a configuration file
std::optional<EngineConfig> LoadConfig(const std::filesystem::path& path, std::string& error);

/**
 * @class EngineConfigBuilder
 * @brief Fluent API for constructing engine configurations
 *
 * **Usage Example**:
 * @code
 * auto config = EngineConfigBuilder()
 *     .WithLanguages({Language::PYTHON})
 *     .WithMinIdle(2)
 *     .WithMaxTotal(8)
 *     .WithExhaustionPolicy(ExhaustionPolicy::WAIT)
 *     .WithMetricsLog("/var/log/faasbox/metrics.jsonl")
 *     .Build();
 * @endcode
 */
class EngineConfigBuilder {
public:
    EngineConfigBuilder& WithLanguages(std::vector<Language> languages) {
        config_.languages = std::move(languages);
        return *this;
    }

    EngineConfigBuilder& WithBackends(std::vector<BackendKind> backends) {
        config_.backends = std::move(backends);
        return *this;
    }

    EngineConfigBuilder& WithMinIdle(std::size_t n) {
        config_.default_pool.min_idle = n;
        return *this;
    }

    EngineConfigBuilder& WithMaxTotal(std::size_t n) {
        config_.default_pool.max_total = n;
        return *this;
    }

    /**
     * @brief Set the reuse budget of every container
     * @param max_executions Executions before retirement
     * @param max_idle_age Idle duration before retirement
     */
    EngineConfigBuilder& WithReuseBudget(std::size_t max_executions, std::chrono::seconds max_idle_age) {
        config_.default_pool.max_executions_per_container = max_executions;
        config_.default_pool.max_idle_age = max_idle_age;
        return *this;
    }

    EngineConfigBuilder& WithExhaustionPolicy(ExhaustionPolicy policy,
                                              std::chrono::milliseconds wait = std::chrono::milliseconds(2000)) {
        config_.default_pool.exhaustion_policy = policy;
        config_.default_pool.checkout_wait = wait;
        return *this;
    }

    EngineConfigBuilder& WithPoolOverride(const PoolKey& key, const PoolConfig& pool) {
        config_.pool_overrides[key] = pool;
        return *this;
    }

    EngineConfigBuilder& WithMemoryLimit(std::size_t mb) {
        config_.container.memory_limit_mb = mb;
        return *this;
    }

    EngineConfigBuilder& WithCPULimit(double cores) {
        config_.container.cpu_limit = cores;
        return *this;
    }

    EngineConfigBuilder& WithSamplingInterval(std::chrono::milliseconds interval) {
        config_.sampling_interval = interval;
        return *this;
    }

    EngineConfigBuilder& WithMetricsLog(const std::filesystem::path& path) {
        config_.metrics_log = path;
        return *this;
    }

    EngineConfigBuilder& EnablePrewarm(bool enable = true) {
        config_.prewarm_on_start = enable;
        return *this;
    }

    EngineConfigBuilder& WithDockerBinary(const std::string& binary) {
        config_.docker_binary = binary;
        return *this;
    }

    EngineConfig Build() const { return config_; }

private:
    EngineConfig config_;
};

} // namespace core
} // namespace faasbox
