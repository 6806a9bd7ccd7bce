/**
 * @file image_provisioner.hpp
 * @brief Runtime image provisioning per (language, backend) pair
 *
 * Guarantees that the runtime image of every configured pair exists locally,
 * building it at most once per pair at a time. Concurrent requests for the
 * same pair collapse into a single build whose outcome every caller observes.
 *
 * @date 2025
 */

#pragma once

#include "faasbox/core/types.hpp"
#include "faasbox/runtime/sandbox_backend.hpp"
#include "faasbox/utils/container_utils.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <future>
#include <atomic>
#include <optional>

namespace faasbox {
namespace core {

/**
 * @struct ProvisionResult
 * @brief Outcome of provisioning one pair
 */
struct ProvisionResult {
    PoolKey key;
    bool success{false};
    bool built{false};           ///< A build ran for this call's outcome
    std::string image_tag;
    std::string error_message;
};

/**
 * @class ImageProvisioner
 * @brief Single-flight image builder
 *
 * A failed build is remembered: later Ensure() calls for that pair report the
 * same failure without rebuilding, until a caller explicitly asks for a retry.
 *
 * **Thread Safety**: All methods may be called concurrently. Pairs never
 * contend with each other.
 */
class ImageProvisioner {
public:
    /**
     * @param driver Container runtime
     * @param backends Backend registry
     * @param keys Pairs this provisioner serves
     */
    ImageProvisioner(utils::ContainerDriver& driver,
                     const runtime::BackendRegistry& backends,
                     const std::vector<PoolKey>& keys);

    ImageProvisioner(const ImageProvisioner&) = delete;
    ImageProvisioner& operator=(const ImageProvisioner&) = delete;

    /**
     * @brief Make sure the image of one pair exists
     *
     * If a build for the pair is already running, waits for it and returns
     * its outcome instead of starting another.
     *
     * @param key Pair to provision
     * @param retry_failed Rebuild a pair whose earlier build failed
     */
    ProvisionResult Ensure(const PoolKey& key, bool retry_failed = false);

    /**
     * @brief Provision every pair
     *
     * Idempotent: pairs whose image already exists do no work. Pairs that
     * failed earlier are retried. A failure for one pair does not stop the
     * others.
     */
    std::vector<ProvisionResult> EnsureImages();

    /// Pair provisioned successfully
    bool IsReady(const PoolKey& key) const;

    /// Image tag of a pair; empty for an unknown pair
    std::string ImageTag(const PoolKey& key) const;

    std::vector<PoolKey> Keys() const;

    /// Number of builds started since construction
    std::size_t BuildCount() const { return build_count_.load(); }

private:
    struct Entry {
        std::string image_tag;
        std::string recipe;
        mutable std::mutex mutex;
        std::shared_future<ProvisionResult> inflight;  ///< Valid while a provision runs
        std::optional<ProvisionResult> outcome;        ///< Last settled outcome
    };

    utils::ContainerDriver& driver_;
    std::map<PoolKey, std::unique_ptr<Entry>> entries_;  ///< Fixed after construction
    std::atomic<std::size_t> build_count_{0};

    ProvisionResult Provision(const PoolKey& key, const Entry& entry);
};

} // namespace core
} // namespace faasbox
