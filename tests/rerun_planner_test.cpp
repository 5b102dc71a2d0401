#include "pipeforge/engine/rerun_planner.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

namespace pipeforge {
namespace {

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
        {"name": "a", "command": "echo a"},
        {"name": "success", "type": "success"},
        {"name": "fail", "type": "fail"}]},
      {"name": "right", "start_at": "b", "steps": [
        {"name": "b", "command": "echo b"},
        {"name": "success", "type": "success"},
        {"name": "fail", "type": "fail"}]}]},
    {"name": "after", "command": "echo after"},
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

auto record(RunLog &log, std::string path, StepStatus status, int attempt = 1)
    -> void {
  auto name = path.substr(path.rfind('.') + 1);
  log.append_attempt(StepLog{.name = std::move(name),
                             .path = std::move(path),
                             .status = status,
                             .attempt = attempt});
}

TEST(RerunPlannerTest, SuccessfulRunSkipsEverything) {
  auto graph = test::compile_json(kLinear);
  RunLog prior{.run_id = "r1"};
  record(prior, "one", StepStatus::Success);
  record(prior, "two", StepStatus::Success);
  record(prior, "three", StepStatus::Success);

  auto plan = plan_rerun(*graph, prior);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->count(RerunAction::Execute), 0);
  EXPECT_EQ(plan->count(RerunAction::Skip), 3);
}

TEST(RerunPlannerTest, FailedNodeAndDownstreamExecute) {
  auto graph = test::compile_json(kLinear);
  RunLog prior{.run_id = "r1"};
  record(prior, "one", StepStatus::Success);
  record(prior, "two", StepStatus::Failed);

  auto plan = plan_rerun(*graph, prior);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->action("one"), RerunAction::Skip);
  EXPECT_EQ(plan->action("two"), RerunAction::Execute);
  EXPECT_EQ(plan->action("three"), RerunAction::Execute);
}

TEST(RerunPlannerTest, LatestAttemptDecides) {
  auto graph = test::compile_json(kLinear);
  RunLog prior{.run_id = "r2"};
  record(prior, "one", StepStatus::Failed, 1);
  record(prior, "one", StepStatus::Success, 2);
  record(prior, "two", StepStatus::Success);
  record(prior, "three", StepStatus::Success, 1);
  record(prior, "three", StepStatus::Failed, 2);

  auto plan = plan_rerun(*graph, prior);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->action("one"), RerunAction::Skip);
  EXPECT_EQ(plan->action("two"), RerunAction::Skip);
  EXPECT_EQ(plan->action("three"), RerunAction::Execute);
}

TEST(RerunPlannerTest, NeverAttemptedNodesExecute) {
  auto graph = test::compile_json(kLinear);
  RunLog prior{.run_id = "r1"};
  record(prior, "one", StepStatus::Success);

  auto plan = plan_rerun(*graph, prior);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->action("one"), RerunAction::Skip);
  EXPECT_EQ(plan->action("two"), RerunAction::Execute);
  EXPECT_EQ(plan->action("three"), RerunAction::Execute);
}

TEST(RerunPlannerTest, FailedParallelNodeRunsAgainWhole) {
  auto graph = test::compile_json(kFanOut);
  RunLog prior{.run_id = "r1"};
  record(prior, "fan.left.a", StepStatus::Success);
  record(prior, "fan.right.b", StepStatus::Failed);
  record(prior, "fan", StepStatus::Failed);

  auto plan = plan_rerun(*graph, prior);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->action("fan"), RerunAction::Execute);
  EXPECT_EQ(plan->action("fan.left.a"), RerunAction::Execute);
  EXPECT_EQ(plan->action("fan.right.b"), RerunAction::Execute);
  EXPECT_EQ(plan->action("after"), RerunAction::Execute);
  EXPECT_EQ(plan->count(RerunAction::Skip), 0);
}

TEST(RerunPlannerTest, SucceededParallelNodeIsSkippedWhole) {
  auto graph = test::compile_json(kFanOut);
  RunLog prior{.run_id = "r1"};
  record(prior, "fan.left.a", StepStatus::Success);
  record(prior, "fan.right.b", StepStatus::Success);
  record(prior, "fan", StepStatus::Success);
  record(prior, "after", StepStatus::Failed);

  auto plan = plan_rerun(*graph, prior);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->action("fan"), RerunAction::Skip);
  EXPECT_EQ(plan->action("after"), RerunAction::Execute);
}

TEST(RerunPlannerTest, RecoveredChildFailureRunsCompositeAgain) {
  auto graph = test::compile_json(kFanOut);
  RunLog prior{.run_id = "r1"};
  record(prior, "fan.left.a", StepStatus::Failed);
  record(prior, "fan.right.b", StepStatus::Success);
  record(prior, "fan", StepStatus::Success);
  record(prior, "after", StepStatus::Success);

  auto plan = plan_rerun(*graph, prior);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->action("fan"), RerunAction::Execute);
  EXPECT_EQ(plan->action("after"), RerunAction::Execute);
}

TEST(RerunPlannerTest, FailedMapNodeRunsEveryItem) {
  auto graph = test::compile_json(kMap);
  RunLog prior{.run_id = "r1"};
  prior.parameters["files"] = *parse_json(R"(["a", "b"])");
  record(prior, "each.a.process", StepStatus::Success);
  record(prior, "each.b.process", StepStatus::Failed);
  record(prior, "each", StepStatus::Failed);

  auto plan = plan_rerun(*graph, prior);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->action("each"), RerunAction::Execute);
  EXPECT_EQ(plan->action("each.a.process"), RerunAction::Execute);
  EXPECT_EQ(plan->action("each.b.process"), RerunAction::Execute);
}

TEST(RerunPlannerTest, UnknownPriorPathIsInvariantViolation) {
  auto graph = test::compile_json(kLinear);
  RunLog prior{.run_id = "r1"};
  record(prior, "one", StepStatus::Success);
  record(prior, "renamed", StepStatus::Success);

  auto plan = plan_rerun(*graph, prior);
  ASSERT_FALSE(plan.has_value());
  EXPECT_EQ(plan.error(), Error::InvariantViolation);
}

} // namespace
} // namespace pipeforge
