/**
 * @file pool_manager.hpp
 * @brief Warm container pools, one per (language, backend) pair
 *
 * Keeps started, idle containers ready so an execution does not pay the
 * container start cost. Each pair has its own queue, lock and container
 * ceiling; a slow backend never blocks the other.
 *
 * **Slot Lifecycle**:
 * ```
 * PROVISIONING --start ok--> IDLE --Checkout--> BUSY --Checkin(healthy, in budget)--> IDLE
 *                                                    \--Checkin(otherwise)---------> DESTROYING
 * IDLE --over max_idle_age--> DESTROYING
 * ```
 *
 * @date 2025
 */

#pragma once

#include "faasbox/core/types.hpp"
#include "faasbox/core/engine_config.hpp"
#include "faasbox/core/image_provisioner.hpp"
#include "faasbox/runtime/sandbox_backend.hpp"
#include "faasbox/utils/container_utils.hpp"

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <atomic>
#include <optional>

namespace faasbox {
namespace core {

/**
 * @struct CheckoutResult
 * @brief A slot, or the reason none could be handed out
 */
struct CheckoutResult {
    std::optional<ContainerSlot> slot;
    ErrorKind error_kind{ErrorKind::NONE};
    std::string error_message;
    bool cold_start{false};      ///< Container was started for this checkout

    bool Ok() const { return slot.has_value(); }
};

/**
 * @struct PoolStats
 * @brief Snapshot of one pair's pool
 */
struct PoolStats {
    PoolKey key;
    std::size_t idle{0};
    std::size_t busy{0};
    std::size_t starting{0};
    std::size_t total{0};              ///< Live containers (idle + busy + starting)
    std::size_t pending_destroy{0};    ///< Removals queued for retry
    std::size_t started_total{0};
    std::size_t destroyed_total{0};
    std::size_t start_failures{0};
};

/**
 * @class PoolManager
 * @brief Owns every sandbox container of the engine
 *
 * **Thread Safety**: All public methods may be called concurrently. Every
 * mutation of a pair's queue happens under that pair's own mutex, and no
 * container runtime call is made while holding it.
 */
class PoolManager {
public:
    PoolManager(utils::ContainerDriver& driver,
                const runtime::BackendRegistry& backends,
                ImageProvisioner& provisioner,
                const EngineConfig& config);

    /// Destroys every idle container
    virtual ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    /**
     * @brief Bring the idle queue of a pair up to count containers
     *
     * Returns immediately; containers are started in the background. Start
     * failures are logged and stop this round of prewarming.
     */
    void Prewarm(const PoolKey& key, std::size_t count);

    /**
     * @brief Take exclusive ownership of a started container
     *
     * Pops an idle slot, or starts a new container if the pair is below its
     * ceiling. At the ceiling, fails with POOL_EXHAUSTED immediately or after
     * waiting up to checkout_wait, depending on the pair's exhaustion policy.
     * The pair's image is provisioned on first use.
     */
    CheckoutResult Checkout(const PoolKey& key);

    /**
     * @brief Return ownership of a slot
     *
     * A healthy slot within its reuse budget goes back to the idle queue.
     * Any other slot is destroyed asynchronously, and the pair is replenished
     * if its idle count fell below min_idle.
     *
     * @param slot Slot previously obtained from Checkout()
     * @param healthy The container's state can be trusted
     */
    void Checkin(ContainerSlot slot, bool healthy);

    bool HasKey(const PoolKey& key) const { return pools_.count(key) > 0; }
    std::vector<PoolKey> Keys() const;
    PoolStats GetStats(const PoolKey& key) const;

    /// Block until every prewarm, replenishment and destruction has finished
    void WaitForBackgroundTasks();

    /**
     * @brief Stop replenishment and remove every idle container
     *
     * Slots checked out at this point are destroyed when checked in.
     */
    void Shutdown();

protected:
    /// Start a background task on its own thread; throws std::system_error when none can be created
    virtual std::future<void> LaunchTask(std::function<void()> task);

private:
    struct KeyPool {
        PoolKey key;
        PoolConfig config;
        mutable std::mutex mutex;
        std::condition_variable available;
        std::deque<ContainerSlot> idle;
        std::size_t busy{0};
        std::size_t starting{0};
        std::size_t total{0};
        std::vector<std::string> pending_destroy;
        std::size_t started_total{0};
        std::size_t destroyed_total{0};
        std::size_t start_failures{0};
    };

    utils::ContainerDriver& driver_;
    const runtime::BackendRegistry& backends_;
    ImageProvisioner& provisioner_;
    const EngineConfig& config_;

    std::map<PoolKey, std::unique_ptr<KeyPool>> pools_;  ///< Fixed after construction

    std::mutex tasks_mutex_;
    std::vector<std::future<void>> tasks_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<std::size_t> name_counter_{0};

    KeyPool* FindPool(const PoolKey& key) const;

    /// Start one container, retrying per start_retries; no lock held
    std::optional<ContainerSlot> StartSlot(KeyPool& pool, std::string& error);

    /// Grow the idle queue towards target, stopping at the first failure
    void FillIdle(KeyPool& pool, std::size_t target);

    void DestroySlot(KeyPool& pool, ContainerSlot slot);
    void RetryPendingDestroys(KeyPool& pool);
    void ScheduleReplenish(KeyPool& pool);
    void RunBackground(std::function<void()> task);
    std::string NextContainerName(const PoolKey& key);
};

} // namespace core
} // namespace faasbox
