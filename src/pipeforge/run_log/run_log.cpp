#include "pipeforge/run_log/run_log.hpp"

#include "pipeforge/util/log.hpp"

#include <glaze/json.hpp>

#include <algorithm>
#include <format>
#include <utility>

namespace pipeforge {
namespace detail {

// Wire shape of the persisted run log; enums travel as snake_case strings.
struct ArtifactJson {
  std::string name;
  std::string produced_by;
  std::string catalog_path;
  std::string compute_data_folder;
  std::uint64_t size_bytes{0};
  std::string stage;
};

struct StepLogJson {
  std::string name;
  std::string path;
  std::string step_type;
  std::string status;
  int attempt{1};
  std::int64_t started_at_ms{0};
  std::int64_t finished_at_ms{0};
  int exit_code{0};
  std::string message;
  bool mock{false};
  std::vector<MetricEntry> user_defined_metrics;
  std::vector<ArtifactJson> data_catalogs;
};

struct StepRecordJson {
  std::string path;
  std::vector<StepLogJson> attempts;
};

struct BranchLogJson {
  std::string path;
  std::string status;
};

struct RunLogJson {
  std::string run_id;
  std::string original_run_id;
  std::string tag;
  std::string dag_hash;
  bool use_cached{false};
  std::string status;
  std::int64_t started_at_ms{0};
  std::int64_t finished_at_ms{0};
  ParameterMap parameters;
  std::vector<StepRecordJson> steps;
  std::vector<BranchLogJson> branches;
};

} // namespace detail
} // namespace pipeforge

namespace glz {
template <> struct meta<pipeforge::MetricEntry> {
  using T = pipeforge::MetricEntry;
  static constexpr auto value = object("key", &T::key, "value", &T::value);
};

template <> struct meta<pipeforge::detail::ArtifactJson> {
  using T = pipeforge::detail::ArtifactJson;
  static constexpr auto value =
      object("name", &T::name, "produced_by", &T::produced_by, "catalog_path",
             &T::catalog_path, "compute_data_folder", &T::compute_data_folder,
             "size_bytes", &T::size_bytes, "stage", &T::stage);
};

template <> struct meta<pipeforge::detail::StepLogJson> {
  using T = pipeforge::detail::StepLogJson;
  static constexpr auto value = object(
      "name", &T::name, "path", &T::path, "step_type", &T::step_type,
      "status", &T::status, "attempt", &T::attempt, "started_at_ms",
      &T::started_at_ms, "finished_at_ms", &T::finished_at_ms, "exit_code",
      &T::exit_code, "message", &T::message, "mock", &T::mock,
      "user_defined_metrics", &T::user_defined_metrics, "data_catalogs",
      &T::data_catalogs);
};

template <> struct meta<pipeforge::detail::StepRecordJson> {
  using T = pipeforge::detail::StepRecordJson;
  static constexpr auto value =
      object("path", &T::path, "attempts", &T::attempts);
};

template <> struct meta<pipeforge::detail::BranchLogJson> {
  using T = pipeforge::detail::BranchLogJson;
  static constexpr auto value =
      object("path", &T::path, "status", &T::status);
};

template <> struct meta<pipeforge::detail::RunLogJson> {
  using T = pipeforge::detail::RunLogJson;
  static constexpr auto value = object(
      "run_id", &T::run_id, "original_run_id", &T::original_run_id, "tag",
      &T::tag, "dag_hash", &T::dag_hash, "use_cached", &T::use_cached,
      "status", &T::status, "started_at_ms", &T::started_at_ms,
      "finished_at_ms", &T::finished_at_ms, "parameters", &T::parameters,
      "steps", &T::steps, "branches", &T::branches);
};
} // namespace glz

namespace pipeforge {

auto metric_key(std::string_view key, int step) -> std::string {
  if (step == 0) {
    return std::string(key);
  }
  return std::format("{}_{}", key, step);
}

auto StepLog::record_metric(std::string_view key, JsonValue value, int step)
    -> void {
  auto full_key = metric_key(key, step);
  auto it = std::ranges::find(user_defined_metrics, full_key,
                              &MetricEntry::key);
  if (it != user_defined_metrics.end()) {
    it->value = std::move(value);
    return;
  }
  user_defined_metrics.push_back(
      MetricEntry{.key = std::move(full_key), .value = std::move(value)});
}

auto StepLog::metric(std::string_view key) const -> const JsonValue * {
  auto it = std::ranges::find(user_defined_metrics, key, &MetricEntry::key);
  return it == user_defined_metrics.end() ? nullptr : &it->value;
}

auto RunLog::find(std::string_view path) const -> const StepRecord * {
  auto it = index_.find(std::string(path));
  return it == index_.end() ? nullptr : &steps[it->second];
}

auto RunLog::latest(std::string_view path) const -> const StepLog * {
  const auto *record = find(path);
  if (!record || record->attempts.empty()) {
    return nullptr;
  }
  return &record->attempts.back();
}

auto RunLog::attempts(std::string_view path) const
    -> std::span<const StepLog> {
  const auto *record = find(path);
  if (!record) {
    return {};
  }
  return record->attempts;
}

auto RunLog::append_attempt(StepLog step) -> StepLog & {
  auto it = index_.find(step.path);
  if (it == index_.end()) {
    it = index_.emplace(step.path, steps.size()).first;
    steps.push_back(StepRecord{.path = step.path, .attempts = {}});
  }
  auto &attempts = steps[it->second].attempts;
  attempts.push_back(std::move(step));
  return attempts.back();
}

auto RunLog::mutable_latest(std::string_view path) -> StepLog * {
  auto it = index_.find(std::string(path));
  if (it == index_.end() || steps[it->second].attempts.empty()) {
    return nullptr;
  }
  return &steps[it->second].attempts.back();
}

auto RunLog::set_attempts(std::string path, std::vector<StepLog> attempts)
    -> void {
  auto it = index_.find(path);
  if (it == index_.end()) {
    index_.emplace(path, steps.size());
    steps.push_back(
        StepRecord{.path = std::move(path), .attempts = std::move(attempts)});
    return;
  }
  steps[it->second].attempts = std::move(attempts);
}

auto RunLog::set_branch_status(std::string_view path, StepStatus status)
    -> void {
  auto it = std::ranges::find(branches, path, &BranchLog::path);
  if (it != branches.end()) {
    it->status = status;
    return;
  }
  branches.push_back(BranchLog{.path = std::string(path), .status = status});
}

auto RunLog::branch(std::string_view path) const -> const BranchLog * {
  auto it = std::ranges::find(branches, path, &BranchLog::path);
  return it == branches.end() ? nullptr : &*it;
}

auto RunLog::failed_paths() const -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto &record : steps) {
    if (!record.attempts.empty() &&
        record.attempts.back().status != StepStatus::Success) {
      out.push_back(record.path);
    }
  }
  return out;
}

auto RunLog::rebuild_index() -> void {
  index_.clear();
  for (std::size_t i = 0; i < steps.size(); ++i) {
    index_.emplace(steps[i].path, i);
  }
}

auto to_json(const RunLog &run_log) -> Result<std::string> {
  detail::RunLogJson raw{.run_id = run_log.run_id,
                         .original_run_id = run_log.original_run_id,
                         .tag = run_log.tag,
                         .dag_hash = run_log.dag_hash,
                         .use_cached = run_log.use_cached,
                         .status = std::string(to_string_view(run_log.status)),
                         .started_at_ms = run_log.started_at_ms,
                         .finished_at_ms = run_log.finished_at_ms,
                         .parameters = run_log.parameters,
                         .steps = {},
                         .branches = {}};
  raw.steps.reserve(run_log.steps.size());
  for (const auto &record : run_log.steps) {
    auto &out = raw.steps.emplace_back(
        detail::StepRecordJson{.path = record.path, .attempts = {}});
    for (const auto &step : record.attempts) {
      detail::StepLogJson js{
          .name = step.name,
          .path = step.path,
          .step_type = std::string(to_string_view(step.kind)),
          .status = std::string(to_string_view(step.status)),
          .attempt = step.attempt,
          .started_at_ms = step.started_at_ms,
          .finished_at_ms = step.finished_at_ms,
          .exit_code = step.exit_code,
          .message = step.message,
          .mock = step.mock,
          .user_defined_metrics = step.user_defined_metrics,
          .data_catalogs = {}};
      for (const auto &ref : step.data_catalogs) {
        js.data_catalogs.push_back(detail::ArtifactJson{
            .name = ref.name,
            .produced_by = ref.produced_by,
            .catalog_path = ref.catalog_path,
            .compute_data_folder = ref.compute_data_folder,
            .size_bytes = ref.size_bytes,
            .stage = std::string(to_string_view(ref.stage))});
      }
      out.attempts.push_back(std::move(js));
    }
  }
  for (const auto &branch : run_log.branches) {
    raw.branches.push_back(detail::BranchLogJson{
        .path = branch.path,
        .status = std::string(to_string_view(branch.status))});
  }

  std::string buffer;
  if (auto ec = glz::write<glz::opts{.prettify = true}>(raw, buffer); ec) {
    log::error("failed to serialize run log {}", run_log.run_id);
    return fail(Error::ParseError);
  }
  return ok(std::move(buffer));
}

auto run_log_from_json(std::string_view text) -> Result<RunLog> {
  detail::RunLogJson raw{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    log::error("run log parse error: {}", glz::format_error(ec, text));
    return fail(Error::ParseError);
  }

  RunLog run_log;
  run_log.run_id = std::move(raw.run_id);
  run_log.original_run_id = std::move(raw.original_run_id);
  run_log.tag = std::move(raw.tag);
  run_log.dag_hash = std::move(raw.dag_hash);
  run_log.use_cached = raw.use_cached;
  run_log.status = parse<StepStatus>(raw.status);
  run_log.started_at_ms = raw.started_at_ms;
  run_log.finished_at_ms = raw.finished_at_ms;
  run_log.parameters = std::move(raw.parameters);
  for (auto &record : raw.steps) {
    StepRecord out{.path = std::move(record.path), .attempts = {}};
    for (auto &js : record.attempts) {
      StepLog step{.name = std::move(js.name),
                   .path = std::move(js.path),
                   .kind = parse<NodeKind>(js.step_type),
                   .status = parse<StepStatus>(js.status),
                   .attempt = js.attempt,
                   .started_at_ms = js.started_at_ms,
                   .finished_at_ms = js.finished_at_ms,
                   .exit_code = js.exit_code,
                   .message = std::move(js.message),
                   .mock = js.mock,
                   .user_defined_metrics = std::move(js.user_defined_metrics),
                   .data_catalogs = {}};
      for (auto &ref : js.data_catalogs) {
        step.data_catalogs.push_back(ArtifactRef{
            .name = std::move(ref.name),
            .produced_by = std::move(ref.produced_by),
            .catalog_path = std::move(ref.catalog_path),
            .compute_data_folder = std::move(ref.compute_data_folder),
            .size_bytes = ref.size_bytes,
            .stage = parse<CatalogStage>(ref.stage)});
      }
      out.attempts.push_back(std::move(step));
    }
    run_log.steps.push_back(std::move(out));
  }
  for (auto &branch : raw.branches) {
    run_log.branches.push_back(BranchLog{
        .path = std::move(branch.path), .status = parse<StepStatus>(branch.status)});
  }
  run_log.rebuild_index();
  return ok(std::move(run_log));
}

} // namespace pipeforge
