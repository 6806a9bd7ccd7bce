/**
 * @file pool_manager.cpp
 * @brief Per-pair warm container pools
 *
 * **Accounting** (per pair, under the pair's mutex):
 * - total = idle + busy + starting; never exceeds max_total
 * - a start is reserved (total, starting incremented) before the runtime is
 *   called and released if the start fails
 * - retired slots leave total immediately; their removal runs in the
 *   background and a failed removal is retried on the next replenishment
 *
 * **Background work** (prewarm, replenishment, removal) runs on std::async
 * tasks tracked by the manager so shutdown can wait for all of them.
 *
 * @date 2025
 */

#include "faasbox/core/pool_manager.hpp"
#include "faasbox/runtime/language_spec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

#include <unistd.h>

namespace faasbox {
namespace core {

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

PoolManager::PoolManager(utils::ContainerDriver& driver,
                         const runtime::BackendRegistry& backends,
                         ImageProvisioner& provisioner,
                         const EngineConfig& config)
    : driver_(driver)
    , backends_(backends)
    , provisioner_(provisioner)
    , config_(config) {
    for (const auto& key : config_.Keys()) {
        auto pool = std::make_unique<KeyPool>();
        pool->key = key;
        pool->config = config_.PoolConfigFor(key);
        pools_[key] = std::move(pool);
    }
}

PoolManager::~PoolManager() {
    Shutdown();
    WaitForBackgroundTasks();
}

// ============================================================================
// PREWARM
// ============================================================================

void PoolManager::Prewarm(const PoolKey& key, std::size_t count) {
    KeyPool* pool = FindPool(key);
    if (!pool) {
        spdlog::warn("Cannot prewarm {}: pair not configured", key.ToString());
        return;
    }
    if (shutting_down_.load()) {
        return;
    }

    std::size_t target = std::min(count, pool->config.max_total);
    if (target == 0) {
        return;
    }

    spdlog::info("Prewarming {} container(s) for {}", target, key.ToString());
    RunBackground([this, pool, target]() { FillIdle(*pool, target); });
}

// ============================================================================
// CHECKOUT / CHECKIN
// ============================================================================

CheckoutResult PoolManager::Checkout(const PoolKey& key) {
    CheckoutResult result;

    KeyPool* pool = FindPool(key);
    if (!pool) {
        result.error_kind = ErrorKind::INVALID_REQUEST;
        result.error_message = "pair " + key.ToString() + " is not enabled";
        return result;
    }

    if (shutting_down_.load()) {
        result.error_kind = ErrorKind::INTERNAL;
        result.error_message = "pool is shutting down";
        return result;
    }

    auto image = provisioner_.Ensure(key);
    if (!image.success) {
        result.error_kind = ErrorKind::IMAGE_BUILD;
        result.error_message = "runtime image for " + key.ToString() + " unavailable: " + image.error_message;
        return result;
    }

    std::vector<ContainerSlot> expired;
    bool reserved = false;
    {
        std::unique_lock<std::mutex> lock(pool->mutex);
        auto deadline = std::chrono::steady_clock::now() + pool->config.checkout_wait;

        while (true) {
            auto now = std::chrono::steady_clock::now();

            // Retire slots that sat idle past their budget
            for (auto it = pool->idle.begin(); it != pool->idle.end();) {
                if (now - it->last_used > pool->config.max_idle_age) {
                    it->state = SlotState::DESTROYING;
                    expired.push_back(std::move(*it));
                    it = pool->idle.erase(it);
                    --pool->total;
                } else {
                    ++it;
                }
            }

            if (!pool->idle.empty()) {
                ContainerSlot slot = std::move(pool->idle.front());
                pool->idle.pop_front();
                slot.state = SlotState::BUSY;
                ++pool->busy;
                result.slot = std::move(slot);
                break;
            }

            if (pool->total < pool->config.max_total) {
                ++pool->total;
                ++pool->starting;
                reserved = true;
                break;
            }

            if (shutting_down_.load()) {
                result.error_kind = ErrorKind::INTERNAL;
                result.error_message = "pool is shutting down";
                break;
            }

            if (pool->config.exhaustion_policy == ExhaustionPolicy::FAIL_FAST || now >= deadline) {
                result.error_kind = ErrorKind::POOL_EXHAUSTED;
                result.error_message = "all " + std::to_string(pool->config.max_total) +
                                       " containers of " + key.ToString() + " are busy";
                break;
            }

            pool->available.wait_until(lock, deadline);
        }
    }

    for (auto& slot : expired) {
        spdlog::info("Retiring container {} (idle past {}s)", slot.ShortId(),
                     pool->config.max_idle_age.count());
        RunBackground([this, pool, slot]() { DestroySlot(*pool, slot); });
    }
    if (!expired.empty()) {
        ScheduleReplenish(*pool);
    }

    if (result.slot) {
        spdlog::debug("Checked out container {} from {}", result.slot->ShortId(), key.ToString());
        return result;
    }
    if (!reserved) {
        spdlog::warn("Checkout of {} failed: {}", key.ToString(), result.error_message);
        return result;
    }

    // Queue empty and below the ceiling: cold start for this caller
    std::string error;
    auto slot = StartSlot(*pool, error);
    {
        std::lock_guard<std::mutex> lock(pool->mutex);
        --pool->starting;
        if (slot) {
            ++pool->busy;
        } else {
            --pool->total;
            pool->available.notify_one();
        }
    }

    if (!slot) {
        result.error_kind = ErrorKind::CONTAINER_START;
        result.error_message = "container start failed for " + key.ToString() + ": " + error;
        return result;
    }

    slot->state = SlotState::BUSY;
    result.slot = std::move(slot);
    result.cold_start = true;
    spdlog::debug("Checked out cold container {} for {}", result.slot->ShortId(), key.ToString());
    return result;
}

void PoolManager::Checkin(ContainerSlot slot, bool healthy) {
    KeyPool* pool = FindPool(slot.key);
    if (!pool) {
        spdlog::error("Checkin of container {} for unknown pair {}", slot.ShortId(), slot.key.ToString());
        if (!driver_.RemoveContainer(slot.container_id)) {
            spdlog::error("Container {} could not be removed", slot.ShortId());
        }
        return;
    }

    const auto& budget = pool->config;
    std::string reason;
    bool replenish = false;
    {
        std::lock_guard<std::mutex> lock(pool->mutex);
        if (pool->busy > 0) {
            --pool->busy;
        }

        if (!healthy) {
            reason = "unhealthy";
        } else if (shutting_down_.load()) {
            reason = "pool shutting down";
        } else if (slot.executions >= budget.max_executions_per_container) {
            reason = "execution budget spent";
        } else if (slot.failures >= budget.max_failures_per_container) {
            reason = "failure budget spent";
        }

        if (reason.empty()) {
            slot.state = SlotState::IDLE;
            slot.last_used = std::chrono::steady_clock::now();
            pool->idle.push_back(slot);
        } else {
            slot.state = SlotState::DESTROYING;
            --pool->total;
            replenish = !shutting_down_.load() &&
                        pool->idle.size() + pool->starting < budget.min_idle;
        }
        pool->available.notify_one();
    }

    if (reason.empty()) {
        spdlog::debug("Container {} returned to {} ({} executions)", slot.ShortId(),
                      slot.key.ToString(), slot.executions);
        return;
    }

    spdlog::info("Retiring container {} of {} ({})", slot.ShortId(), slot.key.ToString(), reason);
    RunBackground([this, pool, slot]() { DestroySlot(*pool, slot); });

    if (replenish) {
        ScheduleReplenish(*pool);
    }
}

// ============================================================================
// INTROSPECTION
// ============================================================================

std::vector<PoolKey> PoolManager::Keys() const {
    std::vector<PoolKey> keys;
    for (const auto& [key, pool] : pools_) {
        keys.push_back(key);
    }
    return keys;
}

PoolStats PoolManager::GetStats(const PoolKey& key) const {
    PoolStats stats;
    stats.key = key;

    KeyPool* pool = FindPool(key);
    if (!pool) {
        return stats;
    }

    std::lock_guard<std::mutex> lock(pool->mutex);
    stats.idle = pool->idle.size();
    stats.busy = pool->busy;
    stats.starting = pool->starting;
    stats.total = pool->total;
    stats.pending_destroy = pool->pending_destroy.size();
    stats.started_total = pool->started_total;
    stats.destroyed_total = pool->destroyed_total;
    stats.start_failures = pool->start_failures;
    return stats;
}

// ============================================================================
// SHUTDOWN
// ============================================================================

void PoolManager::WaitForBackgroundTasks() {
    // Tasks may schedule further tasks (a removal triggering replenishment)
    while (true) {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            pending.swap(tasks_);
        }
        if (pending.empty()) {
            break;
        }
        for (auto& task : pending) {
            task.get();
        }
    }
}

void PoolManager::Shutdown() {
    if (shutting_down_.exchange(true)) {
        return;
    }

    spdlog::info("Shutting down container pools");

    for (auto& [key, pool] : pools_) {
        std::lock_guard<std::mutex> lock(pool->mutex);
        pool->available.notify_all();
    }

    WaitForBackgroundTasks();

    std::size_t removed = 0;
    for (auto& [key, pool] : pools_) {
        std::deque<ContainerSlot> idle;
        {
            std::lock_guard<std::mutex> lock(pool->mutex);
            idle.swap(pool->idle);
            pool->total -= idle.size();
        }

        for (auto& slot : idle) {
            slot.state = SlotState::DESTROYING;
            DestroySlot(*pool, slot);
            ++removed;
        }
        RetryPendingDestroys(*pool);
    }

    spdlog::info("Container pools shut down ({} idle containers removed)", removed);
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

PoolManager::KeyPool* PoolManager::FindPool(const PoolKey& key) const {
    auto it = pools_.find(key);
    return it == pools_.end() ? nullptr : it->second.get();
}

std::optional<ContainerSlot> PoolManager::StartSlot(KeyPool& pool, std::string& error) {
    const auto& language = runtime::GetLanguageSpec(pool.key.language);
    const auto& backend = backends_.Get(pool.key.backend);
    const int attempts = 1 + std::max(0, pool.config.start_retries);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        utils::ContainerSpec spec;
        spec.name = NextContainerName(pool.key);
        spec.image = provisioner_.ImageTag(pool.key);
        spec.runtime_args = backend.RunArgs();
        spec.command = language.idle_command;
        spec.memory_limit_mb = config_.container.memory_limit_mb;
        spec.cpu_limit = config_.container.cpu_limit;
        spec.pids_limit = config_.container.pids_limit;
        spec.tmpfs_size_mb = config_.container.tmpfs_size_mb;
        spec.labels["faasbox.pool"] = pool.key.ToString();
        spec.labels["faasbox.owner"] = std::to_string(::getpid());

        auto started = driver_.StartContainer(spec);
        if (started.success) {
            ContainerSlot slot;
            slot.container_id = started.output;
            slot.key = pool.key;
            slot.state = SlotState::PROVISIONING;
            slot.created_at = std::chrono::steady_clock::now();
            slot.last_used = slot.created_at;
            {
                std::lock_guard<std::mutex> lock(pool.mutex);
                ++pool.started_total;
            }
            spdlog::info("Started container {} for {} on {}", slot.ShortId(),
                         pool.key.ToString(), backend.DisplayName());
            return slot;
        }

        error = started.error_message;
        {
            std::lock_guard<std::mutex> lock(pool.mutex);
            ++pool.start_failures;
        }
        spdlog::warn("Start attempt {}/{} for {} failed: {}", attempt, attempts,
                     pool.key.ToString(), error);

        // docker run can leave a created but never started container behind
        if (!driver_.RemoveContainer(spec.name)) {
            spdlog::debug("No leftover container named {}", spec.name);
        }
    }

    return std::nullopt;
}

void PoolManager::FillIdle(KeyPool& pool, std::size_t target) {
    RetryPendingDestroys(pool);

    auto image = provisioner_.Ensure(pool.key);
    if (!image.success) {
        spdlog::warn("Not warming {}: runtime image unavailable", pool.key.ToString());
        return;
    }

    while (!shutting_down_.load()) {
        {
            std::lock_guard<std::mutex> lock(pool.mutex);
            if (pool.idle.size() + pool.starting >= target || pool.total >= pool.config.max_total) {
                break;
            }
            ++pool.total;
            ++pool.starting;
        }

        std::string error;
        auto slot = StartSlot(pool, error);

        bool discard = false;
        {
            std::lock_guard<std::mutex> lock(pool.mutex);
            --pool.starting;
            if (!slot) {
                --pool.total;
            } else if (shutting_down_.load()) {
                --pool.total;
                discard = true;
            } else {
                slot->state = SlotState::IDLE;
                slot->last_used = std::chrono::steady_clock::now();
                pool.idle.push_back(*slot);
            }
            pool.available.notify_one();
        }

        if (!slot) {
            spdlog::warn("Warming of {} stopped: {}", pool.key.ToString(), error);
            break;
        }
        if (discard) {
            DestroySlot(pool, *slot);
            break;
        }
    }
}

void PoolManager::DestroySlot(KeyPool& pool, ContainerSlot slot) {
    if (driver_.RemoveContainer(slot.container_id)) {
        std::lock_guard<std::mutex> lock(pool.mutex);
        ++pool.destroyed_total;
        spdlog::debug("Destroyed container {}", slot.ShortId());
        return;
    }

    spdlog::warn("Removal of container {} failed, retrying on next replenishment", slot.ShortId());
    std::lock_guard<std::mutex> lock(pool.mutex);
    pool.pending_destroy.push_back(slot.container_id);
}

void PoolManager::RetryPendingDestroys(KeyPool& pool) {
    std::vector<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(pool.mutex);
        pending.swap(pool.pending_destroy);
    }

    for (const auto& container_id : pending) {
        bool removed = driver_.RemoveContainer(container_id);
        std::lock_guard<std::mutex> lock(pool.mutex);
        if (removed) {
            ++pool.destroyed_total;
        } else {
            pool.pending_destroy.push_back(container_id);
        }
    }
}

void PoolManager::ScheduleReplenish(KeyPool& pool) {
    if (shutting_down_.load()) {
        return;
    }
    KeyPool* target = &pool;
    RunBackground([this, target]() { FillIdle(*target, target->config.min_idle); });
}

void PoolManager::RunBackground(std::function<void()> task) {
    auto guarded = [task = std::move(task)]() {
        try {
            task();
        }
        catch (const std::exception& e) {
            spdlog::error("Background pool task failed: {}", e.what());
        }
    };

    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);

        // Drop finished tasks
        tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(), [](std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }), tasks_.end());

        try {
            tasks_.push_back(LaunchTask(guarded));
            return;
        }
        catch (const std::system_error& e) {
            spdlog::warn("Could not launch background pool task ({}), running it inline", e.what());
        }
    }

    // Checkin runs from destructors, so a missing thread must not throw
    guarded();
}

std::future<void> PoolManager::LaunchTask(std::function<void()> task) {
    return std::async(std::launch::async, std::move(task));
}

std::string PoolManager::NextContainerName(const PoolKey& key) {
    return "faasbox-" + LanguageName(key.language) + "-" + BackendTag(key.backend) + "-" +
           std::to_string(::getpid()) + "-" + std::to_string(name_counter_.fetch_add(1) + 1);
}

} // namespace core
} // namespace faasbox
