#include "gtest/gtest.h"
#include "env.hpp"
#include "FakeContainerDriver.hpp"
#include "faasbox/core/execution_orchestrator.hpp"
#include "faasbox/core/comparator.hpp"

#include <future>
#include <mutex>

using namespace std;
using namespace std::chrono;
using namespace faasbox::core;
using faasbox::runtime::BackendRegistry;
using faasbox::test::FakeContainerDriver;

class ExecutionOrchestratorTest : public ::testing::Test {
protected:
    FakeContainerDriver driver;
    BackendRegistry backends;
    EngineConfig config = faasbox::test::TestConfig();
    unique_ptr<ImageProvisioner> provisioner;
    unique_ptr<PoolManager> pool;
    unique_ptr<ExecutionOrchestrator> orchestrator;

    void SetUp() override {
        Create();
    }

    void Create() {
        orchestrator.reset();
        pool.reset();
        provisioner = make_unique<ImageProvisioner>(driver, backends, config.Keys());
        pool = make_unique<PoolManager>(driver, backends, *provisioner, config);
        orchestrator = make_unique<ExecutionOrchestrator>(driver, *pool, backends, config);
    }

    void TearDown() override {
        orchestrator.reset();
        pool.reset();
    }

    static ExecutionRequest Request(const string& code, const string& language, int timeout,
                                    const string& backend, const string& name) {
        ExecutionRequest request;
        request.code = code;
        request.language = language;
        request.timeout_seconds = timeout;
        request.backend = backend;
        request.function_name = name;
        return request;
    }
};

TEST_F(ExecutionOrchestratorTest, PrintsResult) {
    auto outcome = orchestrator->Execute(Request("print(1+1)", "python", 5, "standard", "add"));

    EXPECT_TRUE(outcome.result.success) << outcome.result.error_message;
    EXPECT_EQ(outcome.result.output, "2");
    EXPECT_EQ(outcome.result.stdout_output, "2\n");
    EXPECT_EQ(outcome.result.exit_code, 0);
    EXPECT_EQ(outcome.result.error_kind, ErrorKind::NONE);

    const auto& metrics = outcome.metrics;
    EXPECT_FALSE(metrics.error);
    EXPECT_EQ(metrics.function_name, "add");
    EXPECT_EQ(metrics.backend, "runc");
    EXPECT_EQ(metrics.language, "python");
    EXPECT_LT(metrics.response_time_ms, 5000.0);
    EXPECT_GT(metrics.response_time_ms, 0.0);
    EXPECT_GE(metrics.sample_count, 1u);
    EXPECT_DOUBLE_EQ(metrics.memory_usage_mb, 8.0);
    EXPECT_DOUBLE_EQ(metrics.cpu_usage_percent, 12.5);
    EXPECT_FALSE(metrics.partial_metrics);
}

TEST_F(ExecutionOrchestratorTest, InfiniteLoopTimesOut) {
    auto start = steady_clock::now();
    auto outcome = orchestrator->Execute(Request("while True: pass", "python", 1, "standard", "loop"));
    auto elapsed = steady_clock::now() - start;

    EXPECT_FALSE(outcome.result.success);
    EXPECT_EQ(outcome.result.error_kind, ErrorKind::TIMEOUT);
    EXPECT_TRUE(outcome.metrics.error);
    EXPECT_NE(outcome.result.error_message.find("1s timeout"), string::npos);
    EXPECT_GE(outcome.metrics.response_time_ms, 1000.0);
    EXPECT_LT(elapsed, seconds(3));

    // Killed and destroyed; never returned to the queue
    pool->WaitForBackgroundTasks();
    ASSERT_EQ(driver.Killed().size(), 1u);
    EXPECT_TRUE(driver.WasRemoved(driver.Killed()[0]));
    auto stats = pool->GetStats({Language::PYTHON, BackendKind::RUNC});
    EXPECT_EQ(stats.idle, 0u);
    EXPECT_EQ(stats.total, 0u);
}

TEST_F(ExecutionOrchestratorTest, ThrownErrorKeepsContainer) {
    auto outcome = orchestrator->Execute(Request("throw new Error('x')", "node", 5, "standard", "f"));

    EXPECT_FALSE(outcome.result.success);
    EXPECT_EQ(outcome.result.error_kind, ErrorKind::RUNTIME_EXECUTION);
    EXPECT_EQ(outcome.result.exit_code, 1);
    EXPECT_FALSE(outcome.result.stderr_output.empty());
    EXPECT_NE(outcome.metrics.stderr_output.find("Error: x"), string::npos);
    EXPECT_TRUE(outcome.metrics.error);

    pool->WaitForBackgroundTasks();
    EXPECT_TRUE(driver.Removed().empty());
    EXPECT_EQ(pool->GetStats({Language::NODE, BackendKind::RUNC}).idle, 1u);

    // The next request lands in the same container
    auto next = orchestrator->Execute(Request("print(1+1)", "node", 5, "runc", "g"));
    EXPECT_TRUE(next.result.success);
    EXPECT_EQ(driver.StartCalls(), 1);
}

TEST_F(ExecutionOrchestratorTest, NonZeroExitStatus) {
    auto outcome = orchestrator->Execute(Request("raise SystemExit(3)", "python", 5, "runc", "exit"));

    EXPECT_EQ(outcome.result.error_kind, ErrorKind::RUNTIME_EXECUTION);
    EXPECT_EQ(outcome.result.exit_code, 3);
    EXPECT_EQ(outcome.metrics.stderr_output, outcome.result.error_message);
}

TEST_F(ExecutionOrchestratorTest, SignalExitDestroysContainer) {
    auto outcome = orchestrator->Execute(Request("import os; os.kill(os.getpid(), 11)", "python", 5, "runc", "crash"));

    EXPECT_EQ(outcome.result.error_kind, ErrorKind::RUNTIME_EXECUTION);
    EXPECT_EQ(outcome.result.error_message, "exited with status 139 (possibly signal 11)");

    pool->WaitForBackgroundTasks();
    EXPECT_EQ(driver.Removed().size(), 1u);
}

TEST_F(ExecutionOrchestratorTest, RuntimeFailureIsInternal) {
    driver.Script("exec-failure", {"", "OCI runtime exec failed\n", 126, milliseconds(1)});
    auto outcome = orchestrator->Execute(Request("exec-failure", "python", 5, "runc", "broken"));

    EXPECT_EQ(outcome.result.error_kind, ErrorKind::INTERNAL);
    pool->WaitForBackgroundTasks();
    EXPECT_EQ(driver.Removed().size(), 1u);
}

TEST_F(ExecutionOrchestratorTest, UserExitInRuntimeRangeKeepsContainer) {
    auto outcome = orchestrator->Execute(Request("import sys; sys.exit(126)", "python", 5, "runc", "exit126"));

    EXPECT_EQ(outcome.result.error_kind, ErrorKind::RUNTIME_EXECUTION);
    EXPECT_EQ(outcome.result.exit_code, 126);
    EXPECT_EQ(outcome.result.error_message, "exited with status 126");

    pool->WaitForBackgroundTasks();
    EXPECT_TRUE(driver.Removed().empty());
    EXPECT_EQ(pool->GetStats({Language::PYTHON, BackendKind::RUNC}).idle, 1u);
}

TEST_F(ExecutionOrchestratorTest, SlowStatsDoNotDelayCaller) {
    driver.SetStatsDelay(milliseconds(1500));
    driver.Script("quick", {"done\n", "", 0, milliseconds(50)});

    auto start = steady_clock::now();
    auto outcome = orchestrator->Execute(Request("quick", "python", 5, "runc", "quick"));
    auto elapsed = steady_clock::now() - start;

    EXPECT_TRUE(outcome.result.success);
    EXPECT_LT(elapsed, milliseconds(1000));
    EXPECT_LT(outcome.metrics.response_time_ms, 1000.0);
    EXPECT_EQ(outcome.metrics.sample_count, 0u);
    EXPECT_TRUE(outcome.metrics.partial_metrics);
}

TEST_F(ExecutionOrchestratorTest, FailureBudgetRetiresContainer) {
    config.default_pool.max_failures_per_container = 2;
    Create();

    orchestrator->Execute(Request("raise SystemExit(3)", "python", 5, "runc", "a"));
    pool->WaitForBackgroundTasks();
    EXPECT_TRUE(driver.Removed().empty());

    orchestrator->Execute(Request("raise SystemExit(3)", "python", 5, "runc", "b"));
    pool->WaitForBackgroundTasks();
    EXPECT_EQ(driver.Removed().size(), 1u);
}

TEST_F(ExecutionOrchestratorTest, RejectsInvalidRequests) {
    auto language = orchestrator->Execute(Request("puts 1", "ruby", 5, "runc", "r"));
    EXPECT_EQ(language.result.error_kind, ErrorKind::INVALID_REQUEST);
    EXPECT_NE(language.result.error_message.find("ruby"), string::npos);
    EXPECT_TRUE(language.metrics.error);
    EXPECT_EQ(language.metrics.function_name, "r");

    auto backend = orchestrator->Execute(Request("print(1)", "python", 5, "kata", "k"));
    EXPECT_EQ(backend.result.error_kind, ErrorKind::INVALID_REQUEST);
    EXPECT_EQ(backend.metrics.backend, "kata");

    auto timeout = orchestrator->Execute(Request("print(1)", "python", 0, "runc", "t"));
    EXPECT_EQ(timeout.result.error_kind, ErrorKind::INVALID_REQUEST);

    EXPECT_EQ(driver.StartCalls(), 0);
    EXPECT_EQ(driver.ExecCalls(), 0);
}

TEST_F(ExecutionOrchestratorTest, BackendAliasIsCanonicalized) {
    auto outcome = orchestrator->Execute(Request("print(1+1)", "python", 5, "gvisor", "add"));
    EXPECT_TRUE(outcome.result.success);
    EXPECT_EQ(outcome.metrics.backend, "runsc");

    auto specs = driver.StartedSpecs();
    ASSERT_EQ(specs.size(), 1u);
    EXPECT_EQ(specs[0].runtime_args[0], "--runtime=runsc");
}

TEST_F(ExecutionOrchestratorTest, PoolFailureIsReported) {
    driver.FailStartsMatching("--runtime=runsc");
    auto outcome = orchestrator->Execute(Request("print(1+1)", "python", 5, "runsc", "add"));

    EXPECT_EQ(outcome.result.error_kind, ErrorKind::CONTAINER_START);
    EXPECT_TRUE(outcome.metrics.error);
    EXPECT_FALSE(outcome.metrics.stderr_output.empty());
    EXPECT_EQ(driver.ExecCalls(), 0);
}

TEST_F(ExecutionOrchestratorTest, StreamsOutput) {
    string out;
    string err;
    OutputStreams streams;
    streams.on_stdout = [&out](const string& chunk) { out += chunk; };
    streams.on_stderr = [&err](const string& chunk) { err += chunk; };

    orchestrator->Execute(Request("print(1+1)", "python", 5, "runc", "add"), &streams);
    orchestrator->Execute(Request("throw new Error('x')", "node", 5, "runc", "f"), &streams);

    EXPECT_EQ(out, "2\n");
    EXPECT_NE(err.find("Error: x"), string::npos);
}

TEST_F(ExecutionOrchestratorTest, MissingStatsGivePartialMetrics) {
    driver.SetStatsAvailable(false);
    auto outcome = orchestrator->Execute(Request("print(1+1)", "python", 5, "runc", "add"));

    EXPECT_TRUE(outcome.result.success);
    EXPECT_TRUE(outcome.metrics.partial_metrics);
    EXPECT_EQ(outcome.metrics.sample_count, 0u);
    EXPECT_DOUBLE_EQ(outcome.metrics.memory_usage_mb, 0.0);
}

TEST_F(ExecutionOrchestratorTest, ConcurrentExecutionsNeverShareContainer) {
    driver.Script("slow", {"ok\n", "", 0, milliseconds(30)});
    config.default_pool.max_total = 3;
    config.default_pool.exhaustion_policy = ExhaustionPolicy::WAIT;
    config.default_pool.checkout_wait = milliseconds(5000);
    Create();

    vector<future<ExecutionOutcome>> runs;
    for (int i = 0; i < 9; ++i) {
        runs.push_back(async(launch::async, [this, i] {
            return orchestrator->Execute(Request("slow", "python", 5, "runc", "f" + to_string(i)));
        }));
    }
    for (auto& run : runs) {
        auto outcome = run.get();
        EXPECT_TRUE(outcome.result.success) << outcome.result.error_message;
        EXPECT_EQ(outcome.result.output, "ok");
    }

    EXPECT_FALSE(driver.OverlapDetected());
    EXPECT_LE(driver.StartCalls(), 3);
}

TEST(ComparatorTest, RecordsBothBackendsWhenOneFails) {
    FakeContainerDriver driver;
    BackendRegistry backends;
    EngineConfig config = faasbox::test::TestConfig();
    ImageProvisioner provisioner(driver, backends, config.Keys());
    PoolManager pool(driver, backends, provisioner, config);
    ExecutionOrchestrator orchestrator(driver, pool, backends, config);
    Comparator comparator(orchestrator);

    driver.FailStartsMatching("--runtime=runsc");

    ComparisonRequest request;
    request.code = "print(1+1)";
    request.language = "python";
    request.timeout_seconds = 5;
    request.function_name = "add";
    auto comparison = comparator.Compare(request);

    EXPECT_TRUE(comparison.runc.result.success);
    EXPECT_EQ(comparison.runc.result.output, "2");
    EXPECT_EQ(comparison.runc.metrics.backend, "runc");

    EXPECT_FALSE(comparison.runsc.result.success);
    EXPECT_EQ(comparison.runsc.result.error_kind, ErrorKind::CONTAINER_START);
    EXPECT_EQ(comparison.runsc.metrics.backend, "runsc");
    EXPECT_EQ(comparison.runsc.metrics.function_name, "add");
    EXPECT_TRUE(comparison.runsc.metrics.error);
}

TEST(ComparatorTest, RunsIdenticalCodeOnBothBackends) {
    FakeContainerDriver driver;
    BackendRegistry backends;
    EngineConfig config = faasbox::test::TestConfig();
    ImageProvisioner provisioner(driver, backends, config.Keys());
    PoolManager pool(driver, backends, provisioner, config);
    ExecutionOrchestrator orchestrator(driver, pool, backends, config);
    Comparator comparator(orchestrator);

    ComparisonRequest request;
    request.code = "throw new Error('x')";
    request.language = "node";
    request.timeout_seconds = 5;
    request.function_name = "f";
    auto comparison = comparator.Compare(request);

    EXPECT_EQ(comparison.runc.result.error_kind, ErrorKind::RUNTIME_EXECUTION);
    EXPECT_EQ(comparison.runsc.result.error_kind, ErrorKind::RUNTIME_EXECUTION);
    EXPECT_EQ(driver.ExecCalls(), 2);

    auto specs = driver.StartedSpecs();
    ASSERT_EQ(specs.size(), 2u);
    EXPECT_EQ(specs[0].runtime_args[0], "--runtime=runc");
    EXPECT_EQ(specs[1].runtime_args[0], "--runtime=runsc");
}
