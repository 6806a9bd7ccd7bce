#include "gtest/gtest.h"
#include "faasbox/core/types.hpp"
#include "faasbox/runtime/language_spec.hpp"
#include "faasbox/runtime/sandbox_backend.hpp"
#include "faasbox/utils/string_utils.hpp"

#include <regex>
#include <set>

using namespace std;
using namespace faasbox::core;
using namespace faasbox::runtime;
using faasbox::utils::StringUtils;

TEST(TypesTest, LanguageNames) {
    EXPECT_EQ(ParseLanguage("python"), Language::PYTHON);
    EXPECT_EQ(ParseLanguage(" Python3 "), Language::PYTHON);
    EXPECT_EQ(ParseLanguage("javascript"), Language::NODE);
    EXPECT_EQ(ParseLanguage("node"), Language::NODE);
    EXPECT_FALSE(ParseLanguage("ruby").has_value());
    EXPECT_EQ(LanguageName(Language::NODE), "node");
}

TEST(TypesTest, BackendAliases) {
    EXPECT_EQ(ParseBackend("runc"), BackendKind::RUNC);
    EXPECT_EQ(ParseBackend("standard"), BackendKind::RUNC);
    EXPECT_EQ(ParseBackend("namespace"), BackendKind::RUNC);
    EXPECT_EQ(ParseBackend("gVisor"), BackendKind::RUNSC);
    EXPECT_EQ(ParseBackend("runsc"), BackendKind::RUNSC);
    EXPECT_FALSE(ParseBackend("kata").has_value());
    EXPECT_EQ(BackendTag(BackendKind::RUNSC), "runsc");
}

TEST(TypesTest, ErrorKindNames) {
    EXPECT_EQ(ErrorKindName(ErrorKind::TIMEOUT), "timeout_error");
    EXPECT_EQ(ErrorKindName(ErrorKind::RUNTIME_EXECUTION), "runtime_execution_error");
    EXPECT_EQ(ErrorKindName(ErrorKind::POOL_EXHAUSTED), "pool_exhausted");
    EXPECT_EQ(ErrorKindName(ErrorKind::NONE), "none");
}

TEST(TypesTest, PoolKeyParse) {
    auto key = PoolKey::Parse("node/gvisor");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->language, Language::NODE);
    EXPECT_EQ(key->backend, BackendKind::RUNSC);
    EXPECT_EQ(key->ToString(), "node/runsc");

    EXPECT_FALSE(PoolKey::Parse("python").has_value());
    EXPECT_FALSE(PoolKey::Parse("python/kata").has_value());

    PoolKey a{Language::PYTHON, BackendKind::RUNC};
    PoolKey b{Language::PYTHON, BackendKind::RUNSC};
    EXPECT_TRUE(a < b);
    EXPECT_NE(a, b);
}

TEST(TypesTest, ExhaustionPolicy) {
    EXPECT_EQ(ParseExhaustionPolicy("wait"), ExhaustionPolicy::WAIT);
    EXPECT_EQ(ParseExhaustionPolicy("fail-fast"), ExhaustionPolicy::FAIL_FAST);
    EXPECT_FALSE(ParseExhaustionPolicy("maybe").has_value());
    EXPECT_EQ(ExhaustionPolicyName(ExhaustionPolicy::WAIT), "wait");
}

TEST(BackendRegistryTest, ResolvesTagsAndAliases) {
    BackendRegistry registry;

    const SandboxBackend* gvisor = registry.Find("gvisor");
    ASSERT_NE(gvisor, nullptr);
    EXPECT_EQ(gvisor->Tag(), "runsc");
    ASSERT_EQ(gvisor->RunArgs().size(), 1u);
    EXPECT_EQ(gvisor->RunArgs()[0], "--runtime=runsc");

    const SandboxBackend* standard = registry.Find("standard");
    ASSERT_NE(standard, nullptr);
    EXPECT_EQ(standard->Kind(), BackendKind::RUNC);
    EXPECT_EQ(standard->RunArgs()[0], "--runtime=runc");

    EXPECT_EQ(registry.Find("firecracker"), nullptr);
    EXPECT_EQ(registry.Kinds().size(), 2u);
    EXPECT_EQ(registry.Get(BackendKind::RUNSC).DisplayName(), "gVisor (runsc)");
}

TEST(LanguageSpecTest, Commands) {
    const auto& python = GetLanguageSpec(Language::PYTHON);
    EXPECT_EQ(python.name, "python");
    ASSERT_FALSE(python.run_command.empty());
    EXPECT_EQ(python.run_command.back(), "-");

    const auto& node = GetLanguageSpec(Language::NODE);
    EXPECT_EQ(node.name, "node");
    EXPECT_EQ(node.run_command.front(), "node");
    EXPECT_EQ(node.idle_command.front(), "tail");
}

TEST(LanguageSpecTest, RecipeRunsAsUnprivilegedUser) {
    BackendRegistry registry;
    auto recipe = BuildImageRecipe(GetLanguageSpec(Language::PYTHON), registry.Get(BackendKind::RUNC));

    EXPECT_EQ(recipe.rfind("FROM python:", 0), 0u);
    EXPECT_TRUE(StringUtils::Contains(recipe, "USER sandbox"));
    EXPECT_TRUE(StringUtils::Contains(recipe, "faasbox.backend=\"runc\""));
    EXPECT_TRUE(StringUtils::Contains(recipe, "CMD [\"tail\", \"-f\", \"/dev/null\"]"));
}

TEST(LanguageSpecTest, ImageTagsAreDeterministicAndDistinct) {
    BackendRegistry registry;
    const regex tag_format("faasbox-(python|node)-(runc|runsc):[0-9a-f]{12}");

    set<string> tags;
    for (auto language : {Language::PYTHON, Language::NODE}) {
        for (auto kind : registry.Kinds()) {
            const auto& spec = GetLanguageSpec(language);
            const auto& backend = registry.Get(kind);
            auto tag = ImageTagFor(spec, backend);
            EXPECT_TRUE(regex_match(tag, tag_format)) << tag;
            EXPECT_EQ(tag, ImageTagFor(spec, backend));
            tags.insert(tag);
        }
    }
    EXPECT_EQ(tags.size(), 4u);
}
