#include "gtest/gtest.h"
#include "FakeContainerDriver.hpp"
#include "faasbox/core/image_provisioner.hpp"
#include "faasbox/runtime/language_spec.hpp"

#include <future>
#include <vector>

using namespace std;
using namespace std::chrono;
using namespace faasbox::core;
using faasbox::runtime::BackendRegistry;
using faasbox::test::FakeContainerDriver;

class ImageProvisionerTest : public ::testing::Test {
protected:
    FakeContainerDriver driver;
    BackendRegistry backends;
    const PoolKey python_runc{Language::PYTHON, BackendKind::RUNC};
    const PoolKey python_runsc{Language::PYTHON, BackendKind::RUNSC};
    const PoolKey node_runc{Language::NODE, BackendKind::RUNC};
};

TEST_F(ImageProvisionerTest, BuildsMissingImageOnce) {
    ImageProvisioner provisioner(driver, backends, {python_runc});

    auto first = provisioner.Ensure(python_runc);
    ASSERT_TRUE(first.success) << first.error_message;
    EXPECT_TRUE(first.built);
    EXPECT_EQ(first.image_tag.rfind("faasbox-python-runc:", 0), 0u);
    EXPECT_TRUE(provisioner.IsReady(python_runc));

    auto second = provisioner.Ensure(python_runc);
    EXPECT_TRUE(second.success);
    EXPECT_FALSE(second.built);
    EXPECT_EQ(driver.BuildCalls(), 1);
    EXPECT_EQ(provisioner.BuildCount(), 1u);
}

TEST_F(ImageProvisionerTest, ExistingImageIsNotRebuilt) {
    const auto& spec = faasbox::runtime::GetLanguageSpec(Language::NODE);
    driver.AddImage(faasbox::runtime::ImageTagFor(spec, backends.Get(BackendKind::RUNC)));

    ImageProvisioner provisioner(driver, backends, {node_runc});
    auto result = provisioner.Ensure(node_runc);

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.built);
    EXPECT_EQ(driver.BuildCalls(), 0);
}

TEST_F(ImageProvisionerTest, ConcurrentCallersShareOneBuild) {
    driver.SetBuildDelay(milliseconds(100));
    ImageProvisioner provisioner(driver, backends, {python_runc});

    vector<future<ProvisionResult>> callers;
    for (int i = 0; i < 8; ++i) {
        callers.push_back(async(launch::async, [&] { return provisioner.Ensure(python_runc); }));
    }
    for (auto& caller : callers) {
        EXPECT_TRUE(caller.get().success);
    }
    EXPECT_EQ(driver.BuildCalls(), 1);
}

TEST_F(ImageProvisionerTest, FailureIsStickyUntilRetried) {
    driver.FailBuildsMatching("python-runsc");
    ImageProvisioner provisioner(driver, backends, {python_runsc});

    auto failed = provisioner.Ensure(python_runsc);
    EXPECT_FALSE(failed.success);
    EXPECT_FALSE(failed.error_message.empty());
    EXPECT_FALSE(provisioner.IsReady(python_runsc));

    // No rebuild without an explicit retry
    EXPECT_FALSE(provisioner.Ensure(python_runsc).success);
    EXPECT_EQ(driver.BuildCalls(), 1);

    driver.ClearBuildFailures();
    auto retried = provisioner.Ensure(python_runsc, true);
    EXPECT_TRUE(retried.success);
    EXPECT_TRUE(retried.built);
    EXPECT_EQ(driver.BuildCalls(), 2);
}

TEST_F(ImageProvisionerTest, FailuresAreIsolatedPerPair) {
    driver.FailBuildsMatching("-runsc:");
    ImageProvisioner provisioner(driver, backends, {python_runc, python_runsc, node_runc});

    auto results = provisioner.EnsureImages();
    ASSERT_EQ(results.size(), 3u);
    for (const auto& result : results) {
        EXPECT_EQ(result.success, result.key.backend == BackendKind::RUNC) << result.key.ToString();
    }
    EXPECT_TRUE(provisioner.IsReady(node_runc));
    EXPECT_FALSE(provisioner.IsReady(python_runsc));
}

TEST_F(ImageProvisionerTest, UnknownPair) {
    ImageProvisioner provisioner(driver, backends, {python_runc});
    auto result = provisioner.Ensure(node_runc);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(provisioner.ImageTag(node_runc).empty());
    EXPECT_EQ(driver.BuildCalls(), 0);
}

TEST_F(ImageProvisionerTest, RecipeTargetsBackendLabel) {
    ImageProvisioner provisioner(driver, backends, {python_runsc});
    ASSERT_TRUE(provisioner.Ensure(python_runsc).success);

    auto recipe = driver.LastRecipe();
    EXPECT_NE(recipe.find("faasbox.backend=\"runsc\""), string::npos);
    EXPECT_NE(recipe.find("USER sandbox"), string::npos);
}
