#include "gtest/gtest.h"
#include "env.hpp"
#include "FakeContainerDriver.hpp"
#include "faasbox/core/engine.hpp"

using namespace std;
using namespace std::chrono;
using namespace faasbox::core;
using faasbox::reporters::MemoryMetricsSink;
using faasbox::test::FakeContainerDriver;

class EngineTest : public ::testing::Test {
protected:
    EngineConfig config = faasbox::test::TestConfig();
    FakeContainerDriver* driver = nullptr;
    MemoryMetricsSink* sink = nullptr;

    unique_ptr<Engine> Create() {
        auto owned_driver = make_unique<FakeContainerDriver>();
        auto owned_sink = make_unique<MemoryMetricsSink>();
        driver = owned_driver.get();
        sink = owned_sink.get();
        return make_unique<Engine>(config, move(owned_driver), move(owned_sink));
    }

    static ExecutionRequest Request(const string& code, const string& language, const string& backend) {
        ExecutionRequest request;
        request.code = code;
        request.language = language;
        request.backend = backend;
        request.timeout_seconds = 5;
        request.function_name = "fn";
        return request;
    }
};

TEST_F(EngineTest, InitializeRunsStepsInOrder) {
    config.prewarm_on_start = true;
    config.default_pool.min_idle = 1;
    auto engine = Create();

    auto report = engine->Initialize();
    ASSERT_TRUE(report.ok);
    ASSERT_EQ(report.steps.size(), 4u);
    EXPECT_EQ(report.steps[0].name, "runtime-check");
    EXPECT_EQ(report.steps[1].name, "metrics-sink");
    EXPECT_EQ(report.steps[2].name, "images");
    EXPECT_EQ(report.steps[3].name, "prewarm");
    for (const auto& step : report.steps) {
        EXPECT_TRUE(step.ok) << step.name << ": " << step.message;
    }
    EXPECT_TRUE(report.disabled.empty());
    EXPECT_EQ(driver->BuildCalls(), 4);

    engine->WaitForBackgroundTasks();
    EXPECT_EQ(driver->StartCalls(), 4);
    EXPECT_EQ(engine->GetPoolStats({Language::NODE, BackendKind::RUNSC}).idle, 1u);

    engine->Shutdown();
    EXPECT_EQ(driver->LiveContainers(), 0u);
}

TEST_F(EngineTest, PrewarmStepSkippedWhenDisabled) {
    auto engine = Create();
    auto report = engine->Initialize();

    ASSERT_EQ(report.steps.size(), 4u);
    EXPECT_EQ(report.steps[3].message, "skipped");
    EXPECT_EQ(driver->StartCalls(), 0);
}

TEST_F(EngineTest, UnreachableRuntimeAborts) {
    auto engine = Create();
    driver->SetAvailable(false);

    auto report = engine->Initialize();
    EXPECT_FALSE(report.ok);
    ASSERT_EQ(report.steps.size(), 1u);
    EXPECT_EQ(report.steps[0].name, "runtime-check");
    EXPECT_FALSE(report.steps[0].ok);
    EXPECT_EQ(driver->BuildCalls(), 0);
}

TEST_F(EngineTest, FailedImageDisablesOnlyItsPair) {
    auto engine = Create();
    driver->FailBuildsMatching("python-runsc");

    auto report = engine->Initialize();
    EXPECT_TRUE(report.ok);
    ASSERT_EQ(report.disabled.size(), 1u);
    EXPECT_EQ(report.disabled[0].ToString(), "python/runsc");
    EXPECT_FALSE(report.steps[2].ok);

    auto disabled = engine->Execute(Request("print(1+1)", "python", "runsc"));
    EXPECT_EQ(disabled.result.error_kind, ErrorKind::IMAGE_BUILD);

    auto enabled = engine->Execute(Request("print(1+1)", "python", "runc"));
    EXPECT_TRUE(enabled.result.success);

    // A later retry recovers the pair
    driver->ClearBuildFailures();
    auto results = engine->EnsureImages();
    for (const auto& result : results) {
        EXPECT_TRUE(result.success) << result.key.ToString();
    }
    EXPECT_TRUE(engine->Execute(Request("print(1+1)", "python", "runsc")).result.success);
}

TEST_F(EngineTest, EnsureImagesIsIdempotent) {
    auto engine = Create();
    engine->Initialize();
    EXPECT_EQ(driver->BuildCalls(), 4);

    auto results = engine->EnsureImages();
    EXPECT_EQ(results.size(), 4u);
    for (const auto& result : results) {
        EXPECT_TRUE(result.success);
        EXPECT_FALSE(result.built);
    }
    EXPECT_EQ(driver->BuildCalls(), 4);
}

TEST_F(EngineTest, EveryExecutionIsRecorded) {
    auto engine = Create();
    engine->Initialize();

    engine->Execute(Request("print(1+1)", "python", "runc"));
    engine->Execute(Request("throw new Error('x')", "node", "runsc"));
    engine->Execute(Request("x", "cobol", "runc"));
    ASSERT_EQ(sink->Size(), 3u);

    auto records = sink->Records();
    EXPECT_FALSE(records[0].error);
    EXPECT_TRUE(records[1].error);
    EXPECT_EQ(records[1].backend, "runsc");
    EXPECT_TRUE(records[2].error);

    ComparisonRequest request;
    request.code = "print(1+1)";
    request.language = "python";
    request.function_name = "cmp";
    auto comparison = engine->Compare(request);
    EXPECT_TRUE(comparison.runc.result.success);
    EXPECT_TRUE(comparison.runsc.result.success);
    EXPECT_EQ(sink->Size(), 5u);
}

TEST_F(EngineTest, PrewarmByTag) {
    auto engine = Create();
    engine->Initialize();

    EXPECT_TRUE(engine->Prewarm("node", "gvisor", 2));
    EXPECT_FALSE(engine->Prewarm("node", "kata", 1));
    EXPECT_FALSE(engine->Prewarm("ruby", "runc", 1));

    engine->WaitForBackgroundTasks();
    EXPECT_EQ(driver->StartCalls(), 2);
}

TEST_F(EngineTest, PrewarmRejectsUnconfiguredPair) {
    config.languages = {Language::PYTHON};
    auto engine = Create();
    engine->Initialize();

    EXPECT_FALSE(engine->Prewarm("node", "runc", 1));
    EXPECT_EQ(engine->Keys().size(), 2u);
}

TEST_F(EngineTest, RejectsInvalidConstruction) {
    EXPECT_THROW({ Engine engine(config, nullptr, make_unique<MemoryMetricsSink>()); }, invalid_argument);

    config.default_pool.max_total = 0;
    config.default_pool.min_idle = 0;
    EXPECT_THROW({ Engine engine(config, make_unique<FakeContainerDriver>(), make_unique<MemoryMetricsSink>()); },
                 invalid_argument);
}

TEST_F(EngineTest, PoolStatsAfterExecution) {
    auto engine = Create();
    engine->Initialize();
    engine->Execute(Request("print(1+1)", "python", "runc"));

    auto stats = engine->GetPoolStats({Language::PYTHON, BackendKind::RUNC});
    EXPECT_EQ(stats.idle, 1u);
    EXPECT_EQ(stats.busy, 0u);
    EXPECT_EQ(stats.started_total, 1u);
}
