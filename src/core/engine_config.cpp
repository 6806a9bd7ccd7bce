/**
 * @file engine_config.cpp
 * @brief JSON configuration loading and validation
 *
 * @date 2025
 */

#include "faasbox/core/engine_config.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <algorithm>

using json = nlohmann::json;

namespace faasbox {
namespace core {

namespace {

void ReadPoolConfig(const json& j, PoolConfig& pool) {
    if (!j.is_object()) {
        throw std::invalid_argument("pool configuration must be an object");
    }

    pool.min_idle = j.value("min_idle", pool.min_idle);
    pool.max_total = j.value("max_total", pool.max_total);
    pool.max_executions_per_container = j.value("max_executions", pool.max_executions_per_container);
    pool.max_failures_per_container = j.value("max_failures", pool.max_failures_per_container);
    pool.start_retries = j.value("start_retries", pool.start_retries);

    if (j.contains("max_idle_age_s")) {
        pool.max_idle_age = std::chrono::seconds(j.at("max_idle_age_s").get<long long>());
    }
    if (j.contains("checkout_wait_ms")) {
        pool.checkout_wait = std::chrono::milliseconds(j.at("checkout_wait_ms").get<long long>());
    }
    if (j.contains("exhaustion_policy")) {
        auto name = j.at("exhaustion_policy").get<std::string>();
        auto policy = ParseExhaustionPolicy(name);
        if (!policy) {
            throw std::invalid_argument("unknown exhaustion_policy: " + name);
        }
        pool.exhaustion_policy = *policy;
    }
}

bool ValidatePool(const std::string& label, const PoolConfig& pool, std::string& error) {
    if (pool.max_total == 0) {
        error = label + ": max_total must be at least 1";
        return false;
    }
    if (pool.min_idle > pool.max_total) {
        error = label + ": min_idle (" + std::to_string(pool.min_idle) +
                ") exceeds max_total (" + std::to_string(pool.max_total) + ")";
        return false;
    }
    if (pool.max_executions_per_container == 0) {
        error = label + ": max_executions must be at least 1";
        return false;
    }
    if (pool.max_failures_per_container == 0) {
        error = label + ": max_failures must be at least 1";
        return false;
    }
    if (pool.start_retries < 0) {
        error = label + ": start_retries must not be negative";
        return false;
    }
    if (pool.checkout_wait.count() < 0) {
        error = label + ": checkout_wait_ms must not be negative";
        return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// ENGINE CONFIG
// ============================================================================

const PoolConfig& EngineConfig::PoolConfigFor(const PoolKey& key) const {
    auto it = pool_overrides.find(key);
    return it != pool_overrides.end() ? it->second : default_pool;
}

std::vector<PoolKey> EngineConfig::Keys() const {
    std::vector<PoolKey> keys;
    for (auto language : languages) {
        for (auto backend : backends) {
            keys.push_back(PoolKey{language, backend});
        }
    }
    return keys;
}

// ============================================================================
// VALIDATION
// ============================================================================

bool ValidateConfig(const EngineConfig& config, std::string& error) {
    if (config.languages.empty()) {
        error = "at least one language must be configured";
        return false;
    }
    if (config.backends.empty()) {
        error = "at least one backend must be configured";
        return false;
    }

    if (!ValidatePool("pool", config.default_pool, error)) {
        return false;
    }
    for (const auto& [key, pool] : config.pool_overrides) {
        if (!ValidatePool("pools." + key.ToString(), pool, error)) {
            return false;
        }
    }

    if (config.container.memory_limit_mb < 16) {
        error = "container.memory_limit_mb must be at least 16";
        return false;
    }
    if (config.container.cpu_limit <= 0.0) {
        error = "container.cpu_limit must be positive";
        return false;
    }
    if (config.sampling_interval.count() <= 0) {
        error = "sampling_interval_ms must be positive";
        return false;
    }
    if (config.docker_binary.empty()) {
        error = "docker_binary must not be empty";
        return false;
    }
    if (config.max_output_bytes == 0) {
        error = "max_output_bytes must be positive";
        return false;
    }

    return true;
}

// ============================================================================
// JSON LOADING
// ============================================================================

std::optional<EngineConfig> ParseConfig(const std::string& json_text, std::string& error) {
    EngineConfig config;

    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            error = "configuration root must be an object";
            return std::nullopt;
        }

        if (j.contains("languages")) {
            config.languages.clear();
            for (const auto& item : j.at("languages")) {
                auto name = item.get<std::string>();
                auto language = ParseLanguage(name);
                if (!language) {
                    error = "unknown language: " + name;
                    return std::nullopt;
                }
                if (std::find(config.languages.begin(), config.languages.end(), *language) ==
                    config.languages.end()) {
                    config.languages.push_back(*language);
                }
            }
        }

        if (j.contains("backends")) {
            config.backends.clear();
            for (const auto& item : j.at("backends")) {
                auto tag = item.get<std::string>();
                auto backend = ParseBackend(tag);
                if (!backend) {
                    error = "unknown backend: " + tag;
                    return std::nullopt;
                }
                if (std::find(config.backends.begin(), config.backends.end(), *backend) ==
                    config.backends.end()) {
                    config.backends.push_back(*backend);
                }
            }
        }

        if (j.contains("pool")) {
            ReadPoolConfig(j.at("pool"), config.default_pool);
        }

        if (j.contains("pools")) {
            for (const auto& [name, value] : j.at("pools").items()) {
                auto key = PoolKey::Parse(name);
                if (!key) {
                    error = "invalid pool key: " + name;
                    return std::nullopt;
                }
                // Overrides start from the defaults and replace what they name
                PoolConfig pool = config.default_pool;
                ReadPoolConfig(value, pool);
                config.pool_overrides[*key] = pool;
            }
        }

        if (j.contains("container")) {
            const auto& c = j.at("container");
            config.container.memory_limit_mb = c.value("memory_limit_mb", config.container.memory_limit_mb);
            config.container.cpu_limit = c.value("cpu_limit", config.container.cpu_limit);
            config.container.pids_limit = c.value("pids_limit", config.container.pids_limit);
            config.container.tmpfs_size_mb = c.value("tmpfs_size_mb", config.container.tmpfs_size_mb);
        }

        if (j.contains("sampling_interval_ms")) {
            config.sampling_interval = std::chrono::milliseconds(j.at("sampling_interval_ms").get<long long>());
        }
        if (j.contains("metrics_log")) {
            config.metrics_log = j.at("metrics_log").get<std::string>();
        }
        config.prewarm_on_start = j.value("prewarm_on_start", config.prewarm_on_start);
        config.docker_binary = j.value("docker_binary", config.docker_binary);
        config.max_output_bytes = j.value("max_output_bytes", config.max_output_bytes);
    }
    catch (const json::exception& e) {
        error = std::string("invalid configuration: ") + e.what();
        return std::nullopt;
    }
    catch (const std::invalid_argument& e) {
        error = e.what();
        return std::nullopt;
    }

    if (!ValidateConfig(config, error)) {
        return std::nullopt;
    }
    return config;
}

std::optional<EngineConfig> LoadConfig(const std::filesystem::path& path, std::string& error) {
    std::ifstream file(path);
    if (!file) {
        error = "cannot open configuration file: " + path.string();
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = ParseConfig(buffer.str(), error);
    if (config) {
        spdlog::info("Loaded configuration from {}", path.string());
    }
    return config;
}

} // namespace core
} // namespace faasbox
