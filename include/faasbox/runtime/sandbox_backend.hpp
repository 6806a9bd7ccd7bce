/**
 * @file sandbox_backend.hpp
 * @brief Pluggable container isolation technologies
 *
 * A sandbox backend is selected by tag when a container is started. The pool
 * and the orchestrator only hold SandboxBackend references; everything that
 * differs between runc and gVisor lives behind this interface.
 *
 * @date 2025
 */

#pragma once

#include "faasbox/core/types.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>

namespace faasbox {
namespace runtime {

/**
 * @class SandboxBackend
 * @brief One container isolation technology
 */
class SandboxBackend {
public:
    virtual ~SandboxBackend() = default;

    virtual core::BackendKind Kind() const = 0;

    /// Canonical tag, equal to the OCI runtime name ("runc", "runsc")
    virtual std::string Tag() const = 0;

    /// Human-readable name for logs and reports
    virtual std::string DisplayName() const = 0;

    /**
     * @brief Container runtime arguments selecting this isolation technology
     *
     * Appended to the generic hardening the driver applies to every container.
     */
    virtual std::vector<std::string> RunArgs() const = 0;

    /// Value of the faasbox.backend image label
    virtual std::string ImageLabel() const { return Tag(); }
};

/**
 * @class NamespaceBackend
 * @brief Linux namespaces and cgroups on the shared host kernel (runc)
 */
class NamespaceBackend final : public SandboxBackend {
public:
    core::BackendKind Kind() const override { return core::BackendKind::RUNC; }
    std::string Tag() const override { return "runc"; }
    std::string DisplayName() const override { return "namespace isolation (runc)"; }
    std::vector<std::string> RunArgs() const override;
};

/**
 * @class GVisorBackend
 * @brief gVisor user-space kernel (runsc)
 *
 * Requires the runsc runtime to be registered with the Docker daemon.
 */
class GVisorBackend final : public SandboxBackend {
public:
    core::BackendKind Kind() const override { return core::BackendKind::RUNSC; }
    std::string Tag() const override { return "runsc"; }
    std::string DisplayName() const override { return "gVisor (runsc)"; }
    std::vector<std::string> RunArgs() const override;
};

/**
 * @class BackendRegistry
 * @brief Resolves backend tags to backend instances
 *
 * Immutable after construction; safe to share between threads.
 */
class BackendRegistry {
public:
    /// Registry holding the runc and runsc backends
    BackendRegistry();

    /**
     * @brief Resolve a tag or alias ("standard", "gvisor", ...)
     * @return Backend, or nullptr for an unknown tag
     */
    const SandboxBackend* Find(const std::string& tag) const;

    /// Backend of a kind; every BackendKind is registered
    const SandboxBackend& Get(core::BackendKind kind) const;

    std::vector<core::BackendKind> Kinds() const;

private:
    std::map<core::BackendKind, std::unique_ptr<SandboxBackend>> backends_;
};

} // namespace runtime
} // namespace faasbox
