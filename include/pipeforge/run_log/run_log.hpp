#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/dag/node.hpp"
#include "pipeforge/util/enum.hpp"
#include "pipeforge/util/json.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge {

enum class StepStatus : std::uint8_t { Pending, Running, Success, Failed };
BOOST_DESCRIBE_ENUM(StepStatus, Pending, Running, Success, Failed)
PIPEFORGE_DEFINE_ENUM_SERDE(StepStatus, StepStatus::Pending)

[[nodiscard]] constexpr auto is_terminal(StepStatus s) noexcept -> bool {
  return s == StepStatus::Success || s == StepStatus::Failed;
}

using ParameterMap = std::map<std::string, JsonValue>;

struct MetricEntry {
  std::string key;
  JsonValue value;
};

// Metric key persisted for a (key, step) event.
[[nodiscard]] auto metric_key(std::string_view key, int step) -> std::string;

enum class CatalogStage : std::uint8_t { Get, Put };
BOOST_DESCRIBE_ENUM(CatalogStage, Get, Put)
PIPEFORGE_DEFINE_ENUM_SERDE(CatalogStage, CatalogStage::Get)

struct ArtifactRef {
  // Path relative to the compute data folder, e.g. "data.csv".
  std::string name;
  std::string produced_by;
  std::string catalog_path;
  std::string compute_data_folder;
  std::uint64_t size_bytes{0};
  CatalogStage stage{CatalogStage::Get};

  auto operator==(const ArtifactRef &) const -> bool = default;
};

// One execution attempt of one node path.
struct StepLog {
  std::string name;
  std::string path;
  NodeKind kind{NodeKind::Task};
  StepStatus status{StepStatus::Pending};
  int attempt{1};
  std::int64_t started_at_ms{0};
  std::int64_t finished_at_ms{0};
  int exit_code{0};
  std::string message;
  // Outcome taken over from an earlier run rather than computed.
  bool mock{false};
  std::vector<MetricEntry> user_defined_metrics;
  std::vector<ArtifactRef> data_catalogs;

  // Records (key, step); re-emitting the same pair overwrites in place.
  auto record_metric(std::string_view key, JsonValue value, int step = 0)
      -> void;
  [[nodiscard]] auto metric(std::string_view key) const -> const JsonValue *;
};

struct StepRecord {
  std::string path;
  std::vector<StepLog> attempts;
};

struct BranchLog {
  std::string path;
  StepStatus status{StepStatus::Pending};
};

struct RunLog {
  std::string run_id;
  std::string original_run_id;
  std::string tag;
  std::string dag_hash;
  bool use_cached{false};
  StepStatus status{StepStatus::Pending};
  std::int64_t started_at_ms{0};
  std::int64_t finished_at_ms{0};
  ParameterMap parameters;
  // Insertion ordered: a path appears when it is first dispatched.
  std::vector<StepRecord> steps;
  std::vector<BranchLog> branches;

  [[nodiscard]] auto find(std::string_view path) const -> const StepRecord *;
  [[nodiscard]] auto latest(std::string_view path) const -> const StepLog *;
  [[nodiscard]] auto attempts(std::string_view path) const
      -> std::span<const StepLog>;

  // Appends an attempt for step.path. The reference is invalidated by the
  // next mutation of the log.
  auto append_attempt(StepLog step) -> StepLog &;
  auto mutable_latest(std::string_view path) -> StepLog *;
  // Replaces every attempt recorded for `path`.
  auto set_attempts(std::string path, std::vector<StepLog> attempts) -> void;

  auto set_branch_status(std::string_view path, StepStatus status) -> void;
  [[nodiscard]] auto branch(std::string_view path) const -> const BranchLog *;

  // Paths whose latest attempt did not succeed.
  [[nodiscard]] auto failed_paths() const -> std::vector<std::string>;

  // Must be called after steps is replaced wholesale (e.g. after loading).
  auto rebuild_index() -> void;

private:
  ankerl::unordered_dense::map<std::string, std::size_t> index_;
};

[[nodiscard]] auto to_json(const RunLog &run_log) -> Result<std::string>;
[[nodiscard]] auto run_log_from_json(std::string_view text)
    -> Result<RunLog>;

} // namespace pipeforge
