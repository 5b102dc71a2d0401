#include "pipeforge/run_log/run_log_store.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

namespace pipeforge {
namespace {

auto sample_log(std::string run_id) -> RunLog {
  RunLog log;
  log.run_id = std::move(run_id);
  log.status = StepStatus::Success;
  log.append_attempt(StepLog{.name = "a",
                             .path = "a",
                             .kind = NodeKind::Task,
                             .status = StepStatus::Success});
  return log;
}

class RunLogStoreTest : public ::testing::TestWithParam<bool> {
protected:
  void SetUp() override {
    if (GetParam()) {
      store_ = std::make_unique<FileSystemRunLogStore>(dir_ / "logs");
    } else {
      store_ = std::make_unique<BufferedRunLogStore>();
    }
  }

  test::TempDir dir_;
  std::unique_ptr<IRunLogStore> store_;
};

TEST_P(RunLogStoreTest, MissingRunIsNotFound) {
  auto r = store_->get_run_log("nope");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::NotFound);
}

TEST_P(RunLogStoreTest, PutThenGet) {
  ASSERT_TRUE(store_->put_run_log(sample_log("run-1")).has_value());
  auto r = store_->get_run_log("run-1");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->run_id, "run-1");
  ASSERT_NE(r->latest("a"), nullptr);
  EXPECT_EQ(r->latest("a")->status, StepStatus::Success);
}

TEST_P(RunLogStoreTest, PutOverwrites) {
  auto log = sample_log("run-1");
  ASSERT_TRUE(store_->put_run_log(log).has_value());
  log.status = StepStatus::Failed;
  log.append_attempt(StepLog{.name = "b", .path = "b"});
  ASSERT_TRUE(store_->put_run_log(log).has_value());

  auto r = store_->get_run_log("run-1");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, StepStatus::Failed);
  EXPECT_EQ(r->steps.size(), 2);
}

INSTANTIATE_TEST_SUITE_P(Stores, RunLogStoreTest, ::testing::Bool(),
                         [](const auto &info) {
                           return info.param ? "FileSystem" : "Buffered";
                         });

TEST(FileSystemRunLogStoreTest, OneJsonFilePerRun) {
  test::TempDir dir;
  FileSystemRunLogStore store(dir / "logs");
  ASSERT_TRUE(store.put_run_log(sample_log("run-1")).has_value());
  ASSERT_TRUE(store.put_run_log(sample_log("run-2")).has_value());

  EXPECT_EQ(store.path_for("run-1"), dir / "logs" / "run-1.json");
  EXPECT_TRUE(std::filesystem::exists(dir / "logs" / "run-1.json"));
  EXPECT_TRUE(std::filesystem::exists(dir / "logs" / "run-2.json"));
  EXPECT_FALSE(std::filesystem::exists(dir / "logs" / "run-1.json.tmp"));

  auto text = test::read_file(store.path_for("run-1"));
  EXPECT_NE(text.find("\"run_id\""), std::string::npos);
}

TEST(FileSystemRunLogStoreTest, RejectsUnsafeRunIds) {
  test::TempDir dir;
  FileSystemRunLogStore store(dir.path());
  auto empty = store.put_run_log(sample_log(""));
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), Error::InvalidArgument);
  auto slash = store.put_run_log(sample_log("../escape"));
  ASSERT_FALSE(slash.has_value());
  EXPECT_EQ(slash.error(), Error::InvalidArgument);
}

TEST(FileSystemRunLogStoreTest, ReadsStayInsideTheDirectory) {
  test::TempDir dir;
  FileSystemRunLogStore outside(dir.path());
  ASSERT_TRUE(outside.put_run_log(sample_log("escape")).has_value());

  FileSystemRunLogStore store(dir / "logs");
  auto r = store.get_run_log("../escape");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidArgument);
  EXPECT_FALSE(store.get_run_log("").has_value());
}

TEST(FileSystemRunLogStoreTest, CorruptFileIsParseError) {
  test::TempDir dir;
  FileSystemRunLogStore store(dir.path());
  test::write_file(store.path_for("broken"), "{not json");
  auto r = store.get_run_log("broken");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::ParseError);
}

} // namespace
} // namespace pipeforge
