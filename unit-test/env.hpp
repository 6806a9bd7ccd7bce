#pragma once

#include "faasbox/core/engine_config.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace faasbox {
namespace test {

/// Fast-sampling configuration without prewarm
inline core::EngineConfig TestConfig() {
    return core::EngineConfigBuilder()
        .WithMinIdle(0)
        .WithMaxTotal(4)
        .WithSamplingInterval(std::chrono::milliseconds(10))
        .EnablePrewarm(false)
        .Build();
}

/// Per-process scratch directory under the system temp directory
inline std::filesystem::path ScratchDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("faasbox-test-" + std::to_string(::getpid()) + "-" + name);
    std::filesystem::remove_all(dir);
    return dir;
}

} // namespace test
} // namespace faasbox
