/**
 * @file image_provisioner.cpp
 * @brief Single-flight runtime image provisioning
 *
 * **Per-pair gate**:
 * ```
 * Ensure(key)
 *   lock entry
 *   settled success            -> return it (no work)
 *   settled failure, no retry  -> return it (pair stays disabled)
 *   build in flight            -> unlock, wait on the shared future
 *   otherwise                  -> publish a shared future, unlock,
 *                                 inspect/build, settle, fulfil
 * ```
 *
 * @date 2025
 */

#include "faasbox/core/image_provisioner.hpp"
#include "faasbox/runtime/language_spec.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace faasbox {
namespace core {

ImageProvisioner::ImageProvisioner(utils::ContainerDriver& driver,
                                   const runtime::BackendRegistry& backends,
                                   const std::vector<PoolKey>& keys)
    : driver_(driver) {
    for (const auto& key : keys) {
        const auto& spec = runtime::GetLanguageSpec(key.language);
        const auto& backend = backends.Get(key.backend);

        auto entry = std::make_unique<Entry>();
        entry->recipe = runtime::BuildImageRecipe(spec, backend);
        entry->image_tag = runtime::ImageTagFor(spec, backend);
        entries_[key] = std::move(entry);
    }
}

ProvisionResult ImageProvisioner::Ensure(const PoolKey& key, bool retry_failed) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ProvisionResult result;
        result.key = key;
        result.error_message = "pair " + key.ToString() + " is not configured";
        return result;
    }
    Entry& entry = *it->second;

    std::promise<ProvisionResult> promise;
    {
        std::unique_lock<std::mutex> lock(entry.mutex);

        if (entry.outcome && (entry.outcome->success || !retry_failed)) {
            ProvisionResult settled = *entry.outcome;
            settled.built = false;
            return settled;
        }

        if (entry.inflight.valid()) {
            auto pending = entry.inflight;
            lock.unlock();
            spdlog::debug("Waiting for in-flight provisioning of {}", key.ToString());
            return pending.get();
        }

        entry.inflight = promise.get_future().share();
    }

    ProvisionResult result = Provision(key, entry);

    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        entry.outcome = result;
        entry.inflight = std::shared_future<ProvisionResult>();
    }
    promise.set_value(result);

    return result;
}

std::vector<ProvisionResult> ImageProvisioner::EnsureImages() {
    std::vector<ProvisionResult> results;
    results.reserve(entries_.size());

    for (const auto& [key, entry] : entries_) {
        results.push_back(Ensure(key, true));
    }
    return results;
}

bool ImageProvisioner::IsReady(const PoolKey& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->outcome && it->second->outcome->success;
}

std::string ImageProvisioner::ImageTag(const PoolKey& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? std::string() : it->second->image_tag;
}

std::vector<PoolKey> ImageProvisioner::Keys() const {
    std::vector<PoolKey> keys;
    for (const auto& [key, entry] : entries_) {
        keys.push_back(key);
    }
    return keys;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ProvisionResult ImageProvisioner::Provision(const PoolKey& key, const Entry& entry) {
    ProvisionResult result;
    result.key = key;
    result.image_tag = entry.image_tag;

    try {
        if (driver_.ImageExists(entry.image_tag)) {
            spdlog::debug("Image {} already present", entry.image_tag);
            result.success = true;
            return result;
        }

        spdlog::info("Image {} missing for {}, building", entry.image_tag, key.ToString());
        build_count_.fetch_add(1);
        result.built = true;

        auto build = driver_.BuildImage(entry.image_tag, entry.recipe);
        if (!build.success) {
            result.error_message = build.error_message.empty() ? "image build failed" : build.error_message;
            spdlog::error("Image build failed for {}: {}", key.ToString(), result.error_message);
            return result;
        }

        spdlog::info("Image {} built", entry.image_tag);
        result.success = true;
    }
    catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
        spdlog::error("Provisioning {} failed: {}", key.ToString(), e.what());
    }

    return result;
}

} // namespace core
} // namespace faasbox
