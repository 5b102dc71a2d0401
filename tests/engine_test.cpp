#include "pipeforge/engine/engine.hpp"

#include "pipeforge/catalog/catalog.hpp"
#include "pipeforge/run_log/run_log_store.hpp"
#include "pipeforge/secrets/secrets.hpp"
#include "pipeforge/tracking/tracker.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace pipeforge {
namespace {

using namespace std::chrono_literals;

constexpr std::string_view kLinear = R"({
  "name": "linear", "start_at": "one",
  "steps": [
    {"name": "one", "command": "echo 1", "next": "two"},
    {"name": "two", "command": "echo 2", "next": "three"},
    {"name": "three", "command": "echo 3"},
    {"name": "success", "type": "success"},
    {"name": "fail", "type": "fail"}
  ]})";

constexpr std::string_view kFanOut = R"({
  "name": "fanout", "start_at": "fan",
  "steps": [
    {"name": "fan", "type": "parallel", "next": "after", "branches": [
      {"name": "left", "start_at": "a", "steps": [
        {"name": "a", "command": "left"},
        {"name": "success", "type": "success"},
        {"name": "fail", "type": "fail"}]},
      {"name": "right", "start_at": "b", "steps": [
        {"name": "b", "command": "right"},
        {"name": "success", "type": "success"},
        {"name": "fail", "type": "fail"}]}]},
    {"name": "after", "command": "after"},
    {"name": "success", "type": "success"},
    {"name": "fail", "type": "fail"}
  ]})";

constexpr std::string_view kMap = R"({
  "name": "per_file", "start_at": "each",
  "steps": [
    {"name": "each", "type": "map", "iterate_on": "files", "iterate_as": "file",
     "branches": [
      {"name": "body", "start_at": "process", "steps": [
        {"name": "process", "command": "process"},
        {"name": "success", "type": "success"},
        {"name": "fail", "type": "fail"}]}]},
    {"name": "success", "type": "success"},
    {"name": "fail", "type": "fail"}
  ]})";

// Accepts the first `budget` writes, then fails every later one.
class ExhaustedStore final : public IRunLogStore {
public:
  explicit ExhaustedStore(int budget) : budget_(budget) {}

  auto put_run_log(const RunLog &) -> Result<void> override {
    if (budget_-- > 0) {
      return ok();
    }
    return fail(Error::FileOpenFailed);
  }
  auto get_run_log(std::string_view) -> Result<RunLog> override {
    return fail(Error::NotFound);
  }

private:
  int budget_;
};

class EngineTest : public ::testing::Test {
protected:
  auto settings() -> RunSettings {
    RunSettings s;
    s.run_id = "run-1";
    s.dag_hash = "hash";
    s.working_dir = dir_.path();
    return s;
  }

  auto services() -> EngineServices {
    return EngineServices{.executor = &executor_,
                          .catalog = &catalog_,
                          .store = &store_,
                          .tracker = tracker_,
                          .secrets = secrets_};
  }

  auto run(const GraphPtr &graph, RunSettings s) -> Result<RunLog> {
    Engine engine(services());
    return test::run_coro(io_, engine.run(graph, std::move(s)));
  }

  auto run(std::string_view json) -> Result<RunLog> {
    return run(test::compile_json(json), settings());
  }

  static auto paths(const RunLog &log) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto &record : log.steps) {
      out.push_back(record.path);
    }
    return out;
  }

  boost::asio::io_context io_;
  test::TempDir dir_;
  test::FakeExecutor executor_{io_.get_executor()};
  BufferedRunLogStore store_;
  FileSystemCatalog catalog_{dir_ / "catalog"};
  ITracker *tracker_{nullptr};
  ISecretsProvider *secrets_{nullptr};
};

TEST_F(EngineTest, LinearPipelineRunsInOrder) {
  auto log = run(kLinear);
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Success);
  EXPECT_EQ(executor_.commands(),
            (std::vector<std::string>{"echo 1", "echo 2", "echo 3"}));
  EXPECT_EQ(paths(*log), (std::vector<std::string>{"one", "two", "three"}));
  for (const auto &record : log->steps) {
    ASSERT_EQ(record.attempts.size(), 1);
    EXPECT_EQ(record.attempts[0].status, StepStatus::Success);
    EXPECT_EQ(record.attempts[0].attempt, 1);
    EXPECT_FALSE(record.attempts[0].mock);
  }
  EXPECT_EQ(log->find("success"), nullptr);

  auto stored = store_.get_run_log("run-1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, StepStatus::Success);
  EXPECT_EQ(stored->dag_hash, "hash");
  EXPECT_GE(stored->finished_at_ms, stored->started_at_ms);
}

TEST_F(EngineTest, FailureWithoutHandlerStopsBranch) {
  executor_.on("echo 1", {.exit_code = 3, .stderr_output = "boom"});
  auto log = run(kLinear);
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Failed);
  EXPECT_EQ(executor_.commands(), (std::vector<std::string>{"echo 1"}));

  const auto *one = log->latest("one");
  ASSERT_NE(one, nullptr);
  EXPECT_EQ(one->status, StepStatus::Failed);
  EXPECT_EQ(one->exit_code, 3);
  EXPECT_EQ(one->message, "exit code 3: boom");
  EXPECT_EQ(log->find("two"), nullptr);
  EXPECT_EQ(log->failed_paths(), (std::vector<std::string>{"one"}));
}

TEST_F(EngineTest, OnFailureRoutesToHandler) {
  executor_.fail("echo 1");
  auto log = run(R"({
    "name": "guarded", "start_at": "one",
    "steps": [
      {"name": "one", "command": "echo 1", "next": "two",
       "on_failure": "recover"},
      {"name": "two", "command": "echo 2"},
      {"name": "recover", "command": "cleanup"},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Success);
  EXPECT_EQ(executor_.commands(),
            (std::vector<std::string>{"echo 1", "cleanup"}));
  EXPECT_EQ(log->latest("one")->status, StepStatus::Failed);
  EXPECT_EQ(log->latest("recover")->status, StepStatus::Success);
  EXPECT_EQ(log->find("two"), nullptr);
}

TEST_F(EngineTest, FailNodeFailsRun) {
  executor_.fail("echo 1");
  auto log = run(R"({
    "name": "explicit", "start_at": "one",
    "steps": [
      {"name": "one", "command": "echo 1", "on_failure": "fail"},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Failed);
  EXPECT_EQ(log->find("fail"), nullptr);
}

TEST_F(EngineTest, AsIsNodeSucceedsWithoutDispatch) {
  auto log = run(R"({
    "name": "noop", "start_at": "marker",
    "steps": [
      {"name": "marker", "type": "as-is"},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Success);
  EXPECT_TRUE(executor_.dispatches().empty());
  EXPECT_EQ(log->latest("marker")->kind, NodeKind::AsIs);
}

TEST_F(EngineTest, SequentialModeRunsBranchesOneAfterAnother) {
  executor_.on("left", {.delay = 40ms}).on("right", {.delay = 40ms});
  auto s = settings();
  s.enable_parallel = false;
  auto log = run(test::compile_json(kFanOut), std::move(s));
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Success);

  const auto *left = executor_.find("left");
  const auto *right = executor_.find("right");
  ASSERT_NE(left, nullptr);
  ASSERT_NE(right, nullptr);
  EXPECT_LE(left->finished, right->started);
  EXPECT_EQ(executor_.commands().back(), "after");
}

TEST_F(EngineTest, ParallelModeOverlapsBranches) {
  executor_.on("left", {.delay = 40ms}).on("right", {.delay = 40ms});
  auto log = run(kFanOut);
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Success);

  const auto *left = executor_.find("left");
  const auto *right = executor_.find("right");
  ASSERT_NE(left, nullptr);
  ASSERT_NE(right, nullptr);
  EXPECT_LT(right->started, left->finished);
  EXPECT_LT(left->started, right->finished);
  EXPECT_EQ(executor_.commands().back(), "after");

  ASSERT_NE(log->branch("fan.left"), nullptr);
  EXPECT_EQ(log->branch("fan.left")->status, StepStatus::Success);
  EXPECT_EQ(log->branch("fan.right")->status, StepStatus::Success);
  EXPECT_EQ(log->latest("fan")->kind, NodeKind::Parallel);
}

TEST_F(EngineTest, FailedBranchFailsParallelNode) {
  executor_.fail("right");
  auto log = run(kFanOut);
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Failed);

  EXPECT_EQ(log->latest("fan.left.a")->status, StepStatus::Success);
  EXPECT_EQ(log->latest("fan.right.b")->status, StepStatus::Failed);
  EXPECT_EQ(log->branch("fan.right")->status, StepStatus::Failed);
  const auto *fan = log->latest("fan");
  ASSERT_NE(fan, nullptr);
  EXPECT_EQ(fan->status, StepStatus::Failed);
  EXPECT_EQ(fan->message, "failed branches: fan.right");
  EXPECT_EQ(executor_.find("after"), nullptr);
}

TEST_F(EngineTest, SequentialBranchStopsAtFatalError) {
  std::filesystem::create_directories(dir_ / "data");
  auto s = settings();
  s.enable_parallel = false;
  auto log = run(test::compile_json(R"({
    "name": "fanout", "start_at": "fan",
    "steps": [
      {"name": "fan", "type": "parallel", "next": "after", "branches": [
        {"name": "left", "start_at": "a", "steps": [
          {"name": "a", "command": "left", "catalog": {"get": ["x"]}},
          {"name": "success", "type": "success"},
          {"name": "fail", "type": "fail"}]},
        {"name": "right", "start_at": "b", "steps": [
          {"name": "b", "command": "right"},
          {"name": "success", "type": "success"},
          {"name": "fail", "type": "fail"}]}]},
      {"name": "after", "command": "after"},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})"),
                 std::move(s));
  ASSERT_FALSE(log.has_value());
  EXPECT_EQ(log.error(), Error::EmptyGet);
  EXPECT_TRUE(executor_.dispatches().empty());

  auto stored = store_.get_run_log("run-1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, StepStatus::Failed);
  EXPECT_EQ(stored->find("fan.right.b"), nullptr);
  EXPECT_EQ(stored->latest("fan")->status, StepStatus::Failed);
}

TEST_F(EngineTest, MapBindsEachItem) {
  auto s = settings();
  s.parameters["files"] = *parse_json(R"(["alpha", "beta"])");
  auto log = run(test::compile_json(kMap), std::move(s));
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Success);

  ASSERT_EQ(executor_.dispatches().size(), 2);
  std::vector<std::string> bound;
  for (const auto &d : executor_.dispatches()) {
    bound.push_back(d.env.at("PIPEFORGE_PRM_file"));
    EXPECT_EQ(d.env.at("PIPEFORGE_PRM_files"), R"(["alpha","beta"])");
  }
  std::ranges::sort(bound);
  EXPECT_EQ(bound, (std::vector<std::string>{R"("alpha")", R"("beta")"}));

  EXPECT_EQ(log->latest("each.alpha.process")->status, StepStatus::Success);
  EXPECT_EQ(log->latest("each.beta.process")->status, StepStatus::Success);
  EXPECT_EQ(log->branch("each.alpha")->status, StepStatus::Success);
}

TEST_F(EngineTest, MapItemThatCannotNameBranchFails) {
  auto s = settings();
  s.parameters["files"] = *parse_json(R"(["a.csv", "b.csv"])");
  auto log = run(test::compile_json(kMap), std::move(s));
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Failed);
  EXPECT_NE(log->latest("each")->message.find("a.csv"), std::string::npos);
  EXPECT_TRUE(executor_.dispatches().empty());
}

TEST_F(EngineTest, FailedItemFailsMapNode) {
  executor_.fail("process");
  auto s = settings();
  s.parameters["files"] = *parse_json(R"([1, 2])");
  auto log = run(test::compile_json(kMap), std::move(s));
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Failed);
  EXPECT_EQ(executor_.dispatches().size(), 2);
  EXPECT_EQ(log->latest("each")->message, "failed branches: each.1 each.2");
}

TEST_F(EngineTest, MapWithoutCollectionFails) {
  auto log = run(kMap);
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Failed);
  const auto *each = log->latest("each");
  ASSERT_NE(each, nullptr);
  EXPECT_EQ(each->status, StepStatus::Failed);
  EXPECT_NE(each->message.find("not set"), std::string::npos);
  EXPECT_TRUE(executor_.dispatches().empty());
}

TEST_F(EngineTest, EmbeddedDagRunsUnderDagSegment) {
  auto log = run(R"({
    "name": "outer", "start_at": "inner",
    "steps": [
      {"name": "inner", "type": "dag", "branches": [
        {"name": "sub", "start_at": "x", "steps": [
          {"name": "x", "command": "inner x"},
          {"name": "success", "type": "success"},
          {"name": "fail", "type": "fail"}]}]},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Success);
  EXPECT_EQ(log->latest("inner.dag.x")->status, StepStatus::Success);
  EXPECT_EQ(log->branch("inner.dag")->status, StepStatus::Success);
  EXPECT_EQ(log->latest("inner")->kind, NodeKind::Dag);
}

TEST_F(EngineTest, ParametersFlowDownstream) {
  executor_.on("echo 1",
               {.stdout_output = "hello\npipeforge::param {\"count\": 3}\n"});
  auto log = run(kLinear);
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(dump_json(log->parameters.at("count")), "3");

  const auto *two = executor_.find("echo 2");
  ASSERT_NE(two, nullptr);
  EXPECT_EQ(two->env.at("PIPEFORGE_PRM_count"), "3");
  EXPECT_EQ(two->env.at("PIPEFORGE_RUN_ID"), "run-1");
  EXPECT_FALSE(executor_.find("echo 1")->env.contains("PIPEFORGE_PRM_count"));
}

TEST_F(EngineTest, FailedTaskDoesNotPublishParameters) {
  executor_.on("echo 1", {.exit_code = 1,
                          .stdout_output = "pipeforge::param {\"count\": 3}\n"});
  auto log = run(kLinear);
  ASSERT_TRUE(log.has_value());
  EXPECT_FALSE(log->parameters.contains("count"));
}

TEST_F(EngineTest, TrackLinesBecomeMetrics) {
  test::RecordingTracker tracker;
  tracker_ = &tracker;
  executor_.on("echo 1",
               {.stdout_output = "pipeforge::track {\"key\": \"loss\", "
                                 "\"value\": 7, \"step\": 2}\n"
                                 "pipeforge::track {\"key\": \"\"}\n"
                                 "pipeforge::track {\"key\": \"rows\", "
                                 "\"value\": 100}\n"});
  auto s = settings();
  s.environment["PIPEFORGE_TRACK_ACCURACY"] = "42";
  s.environment["HOME"] = "/root";
  s.parameters["lr"] = *parse_json("0.5");
  auto log = run(test::compile_json(kLinear), std::move(s));
  ASSERT_TRUE(log.has_value());

  using Metric = test::RecordingTracker::Metric;
  EXPECT_EQ(tracker.metrics,
            (std::vector<Metric>{{.key = "loss", .value = "7", .step = 2},
                                 {.key = "rows", .value = "100", .step = 0}}));
  EXPECT_EQ(tracker.parameters,
            (std::map<std::string, std::string>{{"lr", "0.5"}}));

  const auto *one = log->latest("one");
  ASSERT_NE(one->metric("loss_2"), nullptr);
  EXPECT_EQ(dump_json(*one->metric("loss_2")), "7");
  ASSERT_NE(one->metric("rows"), nullptr);
  EXPECT_EQ(dump_json(*one->metric("rows")), "100");
  ASSERT_NE(one->metric("accuracy"), nullptr);
  EXPECT_EQ(dump_json(*one->metric("accuracy")), "42");

  const auto *dispatch = executor_.find("echo 1");
  EXPECT_EQ(dispatch->env.at("PIPEFORGE_TRACK_ACCURACY"), "42");
  EXPECT_FALSE(dispatch->env.contains("HOME"));
}

TEST_F(EngineTest, FailedTaskDiscardsMetrics) {
  test::RecordingTracker tracker;
  tracker_ = &tracker;
  executor_.on("echo 1",
               {.exit_code = 2,
                .stdout_output = "pipeforge::track {\"key\": \"loss\", "
                                 "\"value\": 7}\n"});
  auto s = settings();
  s.environment["PIPEFORGE_TRACK_ACCURACY"] = "42";
  auto log = run(test::compile_json(kLinear), std::move(s));
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Failed);

  const auto *one = log->latest("one");
  ASSERT_NE(one, nullptr);
  EXPECT_EQ(one->exit_code, 2);
  EXPECT_EQ(one->metric("loss"), nullptr);
  EXPECT_EQ(one->metric("accuracy"), nullptr);
  EXPECT_TRUE(tracker.metrics.empty());
}

TEST_F(EngineTest, SecretsAreExported) {
  EnvSecretsProvider secrets(
      std::map<std::string, std::string>{{"API_KEY", "s3cret"}});
  secrets_ = &secrets;
  auto log = run(R"({
    "name": "secret", "start_at": "call",
    "steps": [
      {"name": "call", "command": "curl", "secrets": ["API_KEY"]},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Success);
  EXPECT_EQ(executor_.find("curl")->env.at("API_KEY"), "s3cret");
}

TEST_F(EngineTest, UnresolvedSecretFailsNode) {
  EnvSecretsProvider secrets(std::map<std::string, std::string>{});
  secrets_ = &secrets;
  auto log = run(R"({
    "name": "secret", "start_at": "call",
    "steps": [
      {"name": "call", "command": "curl", "secrets": ["API_KEY"]},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Failed);
  EXPECT_TRUE(executor_.dispatches().empty());
  EXPECT_NE(log->latest("call")->message.find("API_KEY"), std::string::npos);
}

TEST_F(EngineTest, ImageRoutesTaskToContainer) {
  auto log = run(R"({
    "name": "boxed", "start_at": "train",
    "steps": [
      {"name": "train", "command": "python train.py", "image": "python:3.12"},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Success);
  const auto *d = executor_.find("python train.py");
  ASSERT_NE(d, nullptr);
  EXPECT_TRUE(d->container);
  EXPECT_EQ(d->image, "python:3.12");
  const auto working = std::filesystem::absolute(dir_.path()).string();
  EXPECT_NE(std::ranges::find(d->mounts, working + ":" + working),
            d->mounts.end());
}

TEST_F(EngineTest, ContainerExecutorNeedsImage) {
  auto s = settings();
  s.executor_type = ExecutorType::LocalContainer;
  auto log = run(test::compile_json(kLinear), std::move(s));
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Failed);
  EXPECT_EQ(log->latest("one")->message, "no container image configured");
  EXPECT_TRUE(executor_.dispatches().empty());
}

TEST_F(EngineTest, CatalogCarriesArtifactsBetweenNodes) {
  std::filesystem::create_directories(dir_ / "data");
  std::filesystem::create_directories(dir_ / "stage2");
  const auto produced = dir_ / "data" / "out.csv";
  executor_.on("produce", {.side_effect = [produced](const EnvMap &) {
                             test::write_file(produced, "id,value\n1,2\n");
                           }});
  auto log = run(R"({
    "name": "handoff", "start_at": "produce",
    "steps": [
      {"name": "produce", "command": "produce", "next": "consume",
       "catalog": {"put": ["*.csv"]}},
      {"name": "consume", "command": "consume",
       "catalog": {"get": ["out.csv"], "compute_data_folder": "stage2"}},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  ASSERT_TRUE(log.has_value());
  EXPECT_EQ(log->status, StepStatus::Success);

  EXPECT_EQ(test::read_file(catalog_.run_folder("run-1") / "out.csv"),
            "id,value\n1,2\n");
  EXPECT_EQ(test::read_file(dir_ / "stage2" / "out.csv"), "id,value\n1,2\n");

  const auto &put = log->latest("produce")->data_catalogs;
  ASSERT_EQ(put.size(), 1);
  EXPECT_EQ(put[0].stage, CatalogStage::Put);
  EXPECT_EQ(put[0].catalog_path, "run-1/out.csv");
  EXPECT_EQ(put[0].produced_by, "produce");
  const auto &got = log->latest("consume")->data_catalogs;
  ASSERT_EQ(got.size(), 1);
  EXPECT_EQ(got[0].stage, CatalogStage::Get);
  EXPECT_EQ(got[0].name, "out.csv");
}

TEST_F(EngineTest, GetBeforeAnyPutIsFatal) {
  std::filesystem::create_directories(dir_ / "data");
  auto log = run(R"({
    "name": "premature", "start_at": "consume",
    "steps": [
      {"name": "consume", "command": "consume",
       "catalog": {"get": ["in.csv"]}},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  ASSERT_FALSE(log.has_value());
  EXPECT_EQ(log.error(), Error::EmptyGet);
  EXPECT_TRUE(executor_.dispatches().empty());

  auto stored = store_.get_run_log("run-1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, StepStatus::Failed);
  EXPECT_EQ(stored->latest("consume")->status, StepStatus::Failed);
}

TEST_F(EngineTest, MissingComputeFolderIsFatal) {
  auto log = run(R"({
    "name": "nofolder", "start_at": "produce",
    "steps": [
      {"name": "produce", "command": "produce",
       "catalog": {"put": ["*.csv"]}},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  ASSERT_FALSE(log.has_value());
  EXPECT_EQ(log.error(), Error::NoComputeFolder);
  EXPECT_EQ(store_.get_run_log("run-1")->status, StepStatus::Failed);
}

TEST_F(EngineTest, RerunExecutesFromFailedNode) {
  auto graph = test::compile_json(kLinear);
  executor_.fail("echo 2");
  auto first = run(graph, settings());
  ASSERT_TRUE(first.has_value());
  ASSERT_EQ(first->status, StepStatus::Failed);

  executor_.on("echo 2", {});
  auto plan = plan_rerun(*graph, *first);
  ASSERT_TRUE(plan.has_value());
  auto s = settings();
  s.run_id = "run-2";
  s.prior = &*first;
  s.plan = &*plan;
  auto second = run(graph, std::move(s));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->status, StepStatus::Success);
  EXPECT_EQ(second->original_run_id, "run-1");
  EXPECT_TRUE(second->use_cached);

  EXPECT_EQ(executor_.commands(),
            (std::vector<std::string>{"echo 1", "echo 2", "echo 2", "echo 3"}));
  EXPECT_TRUE(second->latest("one")->mock);
  auto two = second->attempts("two");
  ASSERT_EQ(two.size(), 2);
  EXPECT_EQ(two[0].status, StepStatus::Failed);
  EXPECT_EQ(two[1].status, StepStatus::Success);
  EXPECT_EQ(two[1].attempt, 2);
  EXPECT_FALSE(two[1].mock);
  EXPECT_EQ(second->latest("three")->attempt, 1);
  EXPECT_EQ(executor_.dispatches()[2].env.at("PIPEFORGE_RUN_ID"), "run-2");
}

TEST_F(EngineTest, RerunOfFailedParallelNodeRunsEveryBranch) {
  auto graph = test::compile_json(R"({
    "name": "prepared_fanout", "start_at": "prep",
    "steps": [
      {"name": "prep", "command": "prep", "next": "fan"},
      {"name": "fan", "type": "parallel", "next": "after", "branches": [
        {"name": "left", "start_at": "a", "steps": [
          {"name": "a", "command": "left"},
          {"name": "success", "type": "success"},
          {"name": "fail", "type": "fail"}]},
        {"name": "right", "start_at": "b", "steps": [
          {"name": "b", "command": "right"},
          {"name": "success", "type": "success"},
          {"name": "fail", "type": "fail"}]}]},
      {"name": "after", "command": "after"},
      {"name": "success", "type": "success"},
      {"name": "fail", "type": "fail"}
    ]})");
  executor_.fail("right");
  auto first = run(graph, settings());
  ASSERT_TRUE(first.has_value());
  ASSERT_EQ(first->status, StepStatus::Failed);
  const auto dispatched = executor_.dispatches().size();
  ASSERT_EQ(dispatched, 3);

  executor_.on("right", {});
  auto plan = plan_rerun(*graph, *first);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->action("prep"), RerunAction::Skip);
  EXPECT_EQ(plan->action("fan"), RerunAction::Execute);

  auto s = settings();
  s.run_id = "run-2";
  s.prior = &*first;
  s.plan = &*plan;
  auto second = run(graph, std::move(s));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->status, StepStatus::Success);

  auto commands = executor_.commands();
  std::vector<std::string> rerun(commands.begin() + dispatched,
                                 commands.end());
  ASSERT_EQ(rerun.size(), 3);
  EXPECT_EQ(rerun.back(), "after");
  rerun.pop_back();
  std::ranges::sort(rerun);
  EXPECT_EQ(rerun, (std::vector<std::string>{"left", "right"}));

  auto prep = second->attempts("prep");
  ASSERT_EQ(prep.size(), 1);
  EXPECT_TRUE(prep[0].mock);

  for (const auto *path : {"fan.left.a", "fan.right.b", "fan"}) {
    auto attempts = second->attempts(path);
    ASSERT_EQ(attempts.size(), 2) << path;
    EXPECT_EQ(attempts[0].attempt, 1) << path;
    EXPECT_FALSE(attempts[0].mock) << path;
    EXPECT_EQ(attempts[1].attempt, 2) << path;
    EXPECT_FALSE(attempts[1].mock) << path;
    EXPECT_EQ(attempts[1].status, StepStatus::Success) << path;
  }
  EXPECT_EQ(second->attempts("fan.left.a")[0].status, StepStatus::Success);
  EXPECT_EQ(second->attempts("fan.right.b")[0].status, StepStatus::Failed);
  EXPECT_EQ(second->branch("fan.right")->status, StepStatus::Success);
  EXPECT_EQ(second->latest("after")->attempt, 1);
}

TEST_F(EngineTest, RerunOfSuccessfulRunExecutesNothing) {
  auto graph = test::compile_json(kFanOut);
  auto first = run(graph, settings());
  ASSERT_TRUE(first.has_value());
  ASSERT_EQ(first->status, StepStatus::Success);
  const auto dispatched = executor_.dispatches().size();

  auto plan = plan_rerun(*graph, *first);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->count(RerunAction::Execute), 0);

  auto s = settings();
  s.run_id = "run-2";
  s.prior = &*first;
  s.plan = &*plan;
  auto second = run(graph, std::move(s));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->status, StepStatus::Success);
  EXPECT_EQ(executor_.dispatches().size(), dispatched);

  ASSERT_EQ(second->steps.size(), first->steps.size());
  for (const auto &record : first->steps) {
    const auto *replayed = second->latest(record.path);
    ASSERT_NE(replayed, nullptr) << record.path;
    EXPECT_TRUE(replayed->mock);
    EXPECT_EQ(replayed->status, record.attempts.back().status);
    EXPECT_EQ(replayed->attempt, record.attempts.back().attempt);
  }
  EXPECT_EQ(second->branch("fan.left")->status, StepStatus::Success);
}

TEST_F(EngineTest, PersistenceFailureAbortsRun) {
  ExhaustedStore store(1);
  auto svc = services();
  svc.store = &store;
  Engine engine(svc);
  auto log =
      test::run_coro(io_, engine.run(test::compile_json(kLinear), settings()));
  ASSERT_FALSE(log.has_value());
  EXPECT_EQ(log.error(), Error::FileOpenFailed);
  EXPECT_EQ(executor_.commands(), (std::vector<std::string>{"echo 1"}));
}

TEST_F(EngineTest, UnwritableStoreStopsBeforeDispatch) {
  ExhaustedStore store(0);
  auto svc = services();
  svc.store = &store;
  Engine engine(svc);
  auto log =
      test::run_coro(io_, engine.run(test::compile_json(kLinear), settings()));
  ASSERT_FALSE(log.has_value());
  EXPECT_EQ(log.error(), Error::FileOpenFailed);
  EXPECT_TRUE(executor_.dispatches().empty());
}

TEST_F(EngineTest, PlanWithoutPriorIsRejected) {
  RerunPlan plan;
  auto s = settings();
  s.plan = &plan;
  auto log = run(test::compile_json(kLinear), std::move(s));
  ASSERT_FALSE(log.has_value());
  EXPECT_EQ(log.error(), Error::InvalidArgument);
}

TEST_F(EngineTest, GeneratesRunIdWhenMissing) {
  auto s = settings();
  s.run_id.clear();
  auto log = run(test::compile_json(kLinear), std::move(s));
  ASSERT_TRUE(log.has_value());
  EXPECT_FALSE(log->run_id.empty());
  EXPECT_TRUE(store_.get_run_log(log->run_id).has_value());
}

} // namespace
} // namespace pipeforge
