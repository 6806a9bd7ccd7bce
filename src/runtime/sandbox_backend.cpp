/**
 * @file sandbox_backend.cpp
 * @brief runc and gVisor backends and the tag registry
 *
 * @date 2025
 */

#include "faasbox/runtime/sandbox_backend.hpp"

#include <stdexcept>

namespace faasbox {
namespace runtime {

std::vector<std::string> NamespaceBackend::RunArgs() const {
    return {"--runtime=runc"};
}

std::vector<std::string> GVisorBackend::RunArgs() const {
    return {"--runtime=runsc"};
}

BackendRegistry::BackendRegistry() {
    backends_[core::BackendKind::RUNC] = std::make_unique<NamespaceBackend>();
    backends_[core::BackendKind::RUNSC] = std::make_unique<GVisorBackend>();
}

const SandboxBackend* BackendRegistry::Find(const std::string& tag) const {
    auto kind = core::ParseBackend(tag);
    if (!kind) {
        return nullptr;
    }
    auto it = backends_.find(*kind);
    return it == backends_.end() ? nullptr : it->second.get();
}

const SandboxBackend& BackendRegistry::Get(core::BackendKind kind) const {
    auto it = backends_.find(kind);
    if (it == backends_.end()) {
        throw std::out_of_range("no backend registered for " + core::BackendTag(kind));
    }
    return *it->second;
}

std::vector<core::BackendKind> BackendRegistry::Kinds() const {
    std::vector<core::BackendKind> kinds;
    for (const auto& [kind, backend] : backends_) {
        kinds.push_back(kind);
    }
    return kinds;
}

} // namespace runtime
} // namespace faasbox
