/**
 * @file language_spec.cpp
 * @brief Python and Node.js runtimes
 *
 * Both images share one layout:
 * - non-root user `sandbox` (uid 10001)
 * - working directory /sandbox owned by that user
 * - label faasbox.backend=<runtime>, faasbox.language=<language>
 *
 * User code is never baked into an image or written to disk; it reaches the
 * interpreter through stdin of an exec.
 *
 * @date 2025
 */

#include "faasbox/runtime/language_spec.hpp"
#include "faasbox/utils/hash_utils.hpp"

#include <sstream>
#include <stdexcept>

namespace faasbox {
namespace runtime {

namespace {

const LanguageSpec kPythonSpec{
    core::Language::PYTHON,
    "python",
    "python:3.11-slim",
    {"python3", "-u", "-"},
    {"tail", "-f", "/dev/null"}
};

const LanguageSpec kNodeSpec{
    core::Language::NODE,
    "node",
    "node:18-alpine",
    {"node", "-"},
    {"tail", "-f", "/dev/null"}
};

} // anonymous namespace

const LanguageSpec& GetLanguageSpec(core::Language language) {
    switch (language) {
        case core::Language::PYTHON: return kPythonSpec;
        case core::Language::NODE:   return kNodeSpec;
    }
    throw std::invalid_argument("unsupported language");
}

std::string BuildImageRecipe(const LanguageSpec& spec, const SandboxBackend& backend) {
    std::ostringstream df;
    df << "FROM " << spec.base_image << "\n";

    // alpine ships busybox adduser, debian-slim ships useradd
    if (spec.language == core::Language::NODE) {
        df << "RUN adduser -D -u 10001 sandbox\n";
    } else {
        df << "RUN useradd --create-home --uid 10001 sandbox\n";
    }

    df << "RUN mkdir -p /sandbox && chown sandbox /sandbox\n";
    df << "WORKDIR /sandbox\n";
    df << "ENV PYTHONDONTWRITEBYTECODE=1 PYTHONUNBUFFERED=1 NODE_ENV=production\n";
    df << "LABEL faasbox.language=\"" << spec.name << "\" faasbox.backend=\""
       << backend.ImageLabel() << "\"\n";
    df << "USER sandbox\n";

    df << "CMD [";
    for (std::size_t i = 0; i < spec.idle_command.size(); ++i) {
        if (i > 0) df << ", ";
        df << "\"" << spec.idle_command[i] << "\"";
    }
    df << "]\n";

    return df.str();
}

std::string ImageTagFor(const LanguageSpec& spec, const SandboxBackend& backend) {
    return "faasbox-" + spec.name + "-" + backend.Tag() + ":" +
           utils::HashUtils::ShortDigest(BuildImageRecipe(spec, backend));
}

} // namespace runtime
} // namespace faasbox
