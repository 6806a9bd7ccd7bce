/**
 * @file types.cpp
 * @brief Name tables and parsers for the shared engine vocabulary
 *
 * @date 2025
 */

#include "faasbox/core/types.hpp"
#include "faasbox/utils/string_utils.hpp"

namespace faasbox {
namespace core {

std::optional<Language> ParseLanguage(const std::string& name) {
    std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "python" || lower == "python3" || lower == "py") return Language::PYTHON;
    if (lower == "node" || lower == "nodejs" || lower == "javascript" || lower == "js") {
        return Language::NODE;
    }
    return std::nullopt;
}

std::string LanguageName(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::NODE: return "node";
    }
    return "unknown";
}

std::optional<BackendKind> ParseBackend(const std::string& tag) {
    std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(tag));
    if (lower == "runc" || lower == "standard" || lower == "namespace") return BackendKind::RUNC;
    if (lower == "runsc" || lower == "gvisor") return BackendKind::RUNSC;
    return std::nullopt;
}

std::string BackendTag(BackendKind backend) {
    switch (backend) {
        case BackendKind::RUNC: return "runc";
        case BackendKind::RUNSC: return "runsc";
    }
    return "unknown";
}

std::string ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::IMAGE_BUILD: return "image_build_error";
        case ErrorKind::POOL_EXHAUSTED: return "pool_exhausted";
        case ErrorKind::CONTAINER_START: return "container_start_error";
        case ErrorKind::TIMEOUT: return "timeout_error";
        case ErrorKind::RUNTIME_EXECUTION: return "runtime_execution_error";
        case ErrorKind::SAMPLING: return "sampling_error";
        case ErrorKind::INVALID_REQUEST: return "invalid_request";
        case ErrorKind::INTERNAL: return "internal_error";
    }
    return "unknown";
}

std::optional<ExhaustionPolicy> ParseExhaustionPolicy(const std::string& name) {
    std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "fail_fast" || lower == "fail-fast" || lower == "fail") {
        return ExhaustionPolicy::FAIL_FAST;
    }
    if (lower == "wait" || lower == "block") return ExhaustionPolicy::WAIT;
    return std::nullopt;
}

std::string ExhaustionPolicyName(ExhaustionPolicy policy) {
    return policy == ExhaustionPolicy::WAIT ? "wait" : "fail_fast";
}

std::string PoolKey::ToString() const {
    return LanguageName(language) + "/" + BackendTag(backend);
}

std::optional<PoolKey> PoolKey::Parse(const std::string& text) {
    auto slash = text.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    auto language = ParseLanguage(text.substr(0, slash));
    auto backend = ParseBackend(text.substr(slash + 1));
    if (!language || !backend) {
        return std::nullopt;
    }
    return PoolKey{*language, *backend};
}

std::string ContainerSlot::ShortId() const {
    return utils::StringUtils::ShortId(container_id);
}

} // namespace core
} // namespace faasbox
