/**
 * @file types.hpp
 * @brief Shared vocabulary of the execution engine
 *
 * Defines the identifiers, requests, results and metrics records that flow
 * between the image provisioner, the warm-container pool, the execution
 * orchestrator and the comparator.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <cstddef>

namespace faasbox {
namespace core {

/**
 * @enum Language
 * @brief Language runtimes a function may be written in
 */
enum class Language {
    PYTHON,  ///< CPython 3 interpreter
    NODE     ///< Node.js
};

/**
 * @enum BackendKind
 * @brief Sandbox isolation technologies
 */
enum class BackendKind {
    RUNC,   ///< Namespace isolation on the shared host kernel
    RUNSC   ///< gVisor user-space kernel emulation
};

/**
 * @enum SlotState
 * @brief Lifecycle of one pooled container
 *
 * PROVISIONING -> IDLE -> BUSY -> {IDLE, DESTROYING}. DESTROYING is terminal.
 */
enum class SlotState {
    PROVISIONING,  ///< Container is being created and started
    IDLE,          ///< Started, waiting in the pool for work
    BUSY,          ///< Checked out to exactly one execution
    DESTROYING     ///< Retired; will be removed
};

/**
 * @enum ErrorKind
 * @brief Failure taxonomy reported on execution results
 */
enum class ErrorKind {
    NONE,               ///< No error
    IMAGE_BUILD,        ///< Runtime image missing and could not be built
    POOL_EXHAUSTED,     ///< Per-key container ceiling reached
    CONTAINER_START,    ///< Container could not be started after retrying
    TIMEOUT,            ///< Execution forcibly terminated at the deadline
    RUNTIME_EXECUTION,  ///< User code exited with a non-zero status
    SAMPLING,           ///< Resource sampling failed (metrics are partial)
    INVALID_REQUEST,    ///< Unknown language/backend or malformed request
    INTERNAL            ///< Ambiguous runtime-layer failure
};

/**
 * @enum ExhaustionPolicy
 * @brief Checkout behaviour when a key has reached its container ceiling
 */
enum class ExhaustionPolicy {
    FAIL_FAST,  ///< Return POOL_EXHAUSTED immediately
    WAIT        ///< Block up to PoolConfig::checkout_wait, then fail
};

std::optional<Language> ParseLanguage(const std::string& name);
std::string LanguageName(Language language);

std::optional<BackendKind> ParseBackend(const std::string& tag);

/// Canonical tag of a backend, equal to the container runtime name
std::string BackendTag(BackendKind backend);

std::string ErrorKindName(ErrorKind kind);

std::optional<ExhaustionPolicy> ParseExhaustionPolicy(const std::string& name);
std::string ExhaustionPolicyName(ExhaustionPolicy policy);

/**
 * @struct PoolKey
 * @brief (language, backend) pair addressing one independent idle queue
 */
struct PoolKey {
    Language language{Language::PYTHON};
    BackendKind backend{BackendKind::RUNC};

    /// Render as "python/runc"
    std::string ToString() const;

    /// Parse "python/runc"; aliases accepted on both sides
    static std::optional<PoolKey> Parse(const std::string& text);

    bool operator==(const PoolKey& other) const {
        return language == other.language && backend == other.backend;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }
    bool operator<(const PoolKey& other) const {
        if (language != other.language) return language < other.language;
        return backend < other.backend;
    }
};

/**
 * @struct ContainerSlot
 * @brief One started container and its reuse bookkeeping
 */
struct ContainerSlot {
    std::string container_id;                       ///< Runtime-assigned identity
    PoolKey key;                                    ///< Owning queue
    SlotState state{SlotState::PROVISIONING};       ///< Lifecycle state
    std::size_t executions{0};                      ///< Completed executions
    std::size_t failures{0};                        ///< Executions that exited non-zero
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used;

    /// First 12 characters of the container id, for logs
    std::string ShortId() const;
};

/**
 * @struct PoolConfig
 * @brief Sizing and reuse budget of one pool key
 */
struct PoolConfig {
    std::size_t min_idle{1};                        ///< Replenish below this
    std::size_t max_total{4};                       ///< Ceiling of live containers
    std::size_t max_executions_per_container{50};   ///< Reuse budget (executions)
    std::size_t max_failures_per_container{5};      ///< Retire after this many non-zero exits
    std::chrono::seconds max_idle_age{300};         ///< Reuse budget (idle duration)
    ExhaustionPolicy exhaustion_policy{ExhaustionPolicy::FAIL_FAST};
    std::chrono::milliseconds checkout_wait{2000};  ///< Bound for ExhaustionPolicy::WAIT
    int start_retries{1};                           ///< Internal retries of a failed start
};

/**
 * @struct ExecutionRequest
 * @brief Self-contained description of one function invocation
 */
struct ExecutionRequest {
    std::string code;            ///< Source text to run
    std::string language;        ///< Language tag ("python", "node")
    int timeout_seconds{5};      ///< Wall-clock limit
    std::string backend;         ///< Backend tag ("runc", "runsc", ...)
    std::string function_name;   ///< Label for metrics only
};

/**
 * @struct ExecutionResult
 * @brief What the user code produced
 */
struct ExecutionResult {
    std::string output;          ///< Printed value (stdout, trailing whitespace trimmed)
    std::string stdout_output;   ///< Raw captured stdout
    std::string stderr_output;   ///< Raw captured stderr
    bool success{false};
    ErrorKind error_kind{ErrorKind::NONE};
    std::string error_message;
    int exit_code{-1};
    bool output_truncated{false};
};

/**
 * @struct MetricsRecord
 * @brief One observation per execution, produced on every path
 */
struct MetricsRecord {
    std::string function_name;
    std::string backend;                 ///< Canonical backend tag, or the raw tag if unknown
    std::string language;
    std::chrono::system_clock::time_point timestamp;

    double response_time_ms{0.0};        ///< Injection start to completion or kill
    double memory_usage_mb{0.0};         ///< Peak memory
    double cpu_usage_percent{0.0};       ///< Average CPU over the window
    double peak_cpu_percent{0.0};        ///< Peak CPU over the window
    std::size_t sample_count{0};

    bool error{false};
    bool partial_metrics{false};         ///< Sampling failed for part of the window
    std::string stdout_output;
    std::string stderr_output;
};

/**
 * @struct ExecutionOutcome
 * @brief Result and metrics of one execution
 */
struct ExecutionOutcome {
    ExecutionResult result;
    MetricsRecord metrics;
};

} // namespace core
} // namespace faasbox
