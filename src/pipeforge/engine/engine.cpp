#include "pipeforge/engine/engine.hpp"

#include "pipeforge/catalog/catalog.hpp"
#include "pipeforge/dag/node_path.hpp"
#include "pipeforge/engine/map_items.hpp"
#include "pipeforge/executor/executor_utils.hpp"
#include "pipeforge/run_log/run_log_store.hpp"
#include "pipeforge/secrets/secrets.hpp"
#include "pipeforge/tracking/tracker.hpp"
#include "pipeforge/util/id.hpp"
#include "pipeforge/util/log.hpp"
#include "pipeforge/util/time.hpp"

#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>

#include <exception>
#include <system_error>
#include <format>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pipeforge {

namespace {

namespace fs = std::filesystem;

inline constexpr std::string_view kParameterEnvPrefix = "PIPEFORGE_PRM_";
inline constexpr std::size_t kStderrTail = 1024;

// Variables bound by enclosing map nodes, innermost last.
using Bindings = ParameterMap;

struct Branch {
  std::string path;
  const Graph *graph{nullptr};
  Bindings bindings;
};

[[nodiscard]] auto failure_message(const ExecutorResult &result)
    -> std::string {
  if (!result.error.empty()) {
    return result.error;
  }
  auto message = std::format("exit code {}", result.exit_code);
  if (!result.stderr_output.empty()) {
    std::string_view tail = result.stderr_output;
    if (tail.size() > kStderrTail) {
      tail = tail.substr(tail.size() - kStderrTail);
    }
    message += std::format(": {}", tail);
  }
  return message;
}

// State of one run. Lives on the engine's executor; concurrent branches only
// interleave at suspension points, so no locking is needed.
class RunExecution {
public:
  RunExecution(EngineServices services, RunSettings settings)
      : services_(services), settings_(std::move(settings)) {}

  auto execute(const Graph &graph) -> task<Result<RunLog>> {
    log_.run_id = settings_.run_id;
    log_.original_run_id =
        settings_.prior ? settings_.prior->run_id : std::string{};
    log_.tag = settings_.tag;
    log_.dag_hash = settings_.dag_hash;
    log_.use_cached = settings_.prior != nullptr;
    log_.parameters = settings_.parameters;
    log_.status = StepStatus::Running;
    log_.started_at_ms = util::now_millis();
    if (auto r = persist(); !r) {
      co_return fail(r.error());
    }

    if (services_.tracker) {
      for (const auto &[name, value] : log_.parameters) {
        services_.tracker->log_parameter(name, value);
      }
    }

    log::info("run {} started ({} mode{})", log_.run_id,
              settings_.enable_parallel ? "parallel" : "sequential",
              log_.use_cached
                  ? std::format(", re-run of {}", log_.original_run_id)
                  : std::string{});

    auto outcome = co_await run_graph(graph, "", Bindings{});

    log_.status = (outcome && *outcome == StepStatus::Success)
                      ? StepStatus::Success
                      : StepStatus::Failed;
    log_.finished_at_ms = util::now_millis();
    auto stored = persist();

    if (!outcome) {
      log::error("run {} aborted: {}: {}", log_.run_id,
                 error_kind(outcome.error()), outcome.error().message());
      co_return fail(outcome.error());
    }
    if (!stored) {
      co_return fail(stored.error());
    }
    log::info("run {} finished: {}", log_.run_id, to_string_view(log_.status));
    co_return ok(std::move(log_));
  }

private:
  // The first failed write is kept in `persist_error_` and aborts the run at
  // the next node boundary.
  auto persist() -> Result<void> {
    if (!services_.store) {
      return ok();
    }
    auto r = services_.store->put_run_log(log_);
    if (!r) {
      log::error("failed to persist run log {}: {}", log_.run_id,
                 r.error().message());
      if (!persist_error_) {
        persist_error_ = r.error();
      }
    }
    return r;
  }

  // Runs one branch from its start node to a terminal.
  auto run_graph(const Graph &graph, std::string prefix, Bindings bindings)
      -> task<Result<StepStatus>> {
    std::unordered_set<const Node *> visited;
    const Node *node = &graph.start_at();
    while (true) {
      if (node->kind() == NodeKind::Success) {
        co_return ok(StepStatus::Success);
      }
      if (node->kind() == NodeKind::Fail) {
        co_return ok(StepStatus::Failed);
      }
      auto path = node_path::join(prefix, node->name);
      if (!visited.insert(node).second) {
        log::error("branch '{}' reached {} twice", prefix, path);
        co_return fail(Error::InvariantViolation);
      }

      auto outcome = co_await run_node(*node, path, bindings);
      if (!outcome) {
        co_return fail(outcome.error());
      }
      if (persist_error_) {
        co_return fail(persist_error_);
      }

      const Node *next = nullptr;
      if (*outcome == StepStatus::Success) {
        next = graph.find(node->next);
      } else if (node->on_failure) {
        log::info("{} failed, routing to {}", path, *node->on_failure);
        next = graph.find(*node->on_failure);
      } else {
        co_return ok(StepStatus::Failed);
      }
      if (!next) {
        co_return fail(Error::InvariantViolation);
      }
      node = next;
    }
  }

  auto run_node(const Node &node, const std::string &path,
                const Bindings &bindings) -> task<Result<StepStatus>> {
    if (settings_.plan &&
        settings_.plan->action(path) == RerunAction::Skip) {
      co_return ok(replay(path));
    }
    carry_prior_attempts(path);

    switch (node.kind()) {
    case NodeKind::Task:
      co_return co_await run_task(node, std::get<TaskSpec>(node.spec), path,
                                  bindings);
    case NodeKind::AsIs:
      co_return run_as_is(node, path);
    case NodeKind::Parallel:
    case NodeKind::Map:
    case NodeKind::Dag:
      co_return co_await run_composite(node, path, bindings);
    case NodeKind::Success:
    case NodeKind::Fail:
      break;
    }
    co_return fail(Error::InvariantViolation);
  }

  // Copies the prior run's records for `path` and everything beneath it.
  auto replay(const std::string &path) -> StepStatus {
    for (const auto &record : settings_.prior->steps) {
      if (!node_path::is_within(record.path, path)) {
        continue;
      }
      auto attempts = record.attempts;
      for (auto &attempt : attempts) {
        attempt.mock = true;
      }
      log_.set_attempts(record.path, std::move(attempts));
    }
    for (const auto &branch : settings_.prior->branches) {
      if (node_path::is_within(branch.path, path)) {
        log_.set_branch_status(branch.path, branch.status);
      }
    }
    log::info("{} skipped, reusing run {}", path, settings_.prior->run_id);
    const auto *latest = log_.latest(path);
    return latest ? latest->status : StepStatus::Success;
  }

  // Earlier attempts stay in front of the one about to start.
  auto carry_prior_attempts(const std::string &path) -> void {
    if (!settings_.prior || log_.find(path)) {
      return;
    }
    auto prior = settings_.prior->attempts(path);
    if (!prior.empty()) {
      log_.set_attempts(path, std::vector<StepLog>(prior.begin(), prior.end()));
    }
  }

  auto begin_step(const Node &node, const std::string &path) -> int {
    const auto attempt = static_cast<int>(log_.attempts(path).size()) + 1;
    log_.append_attempt(StepLog{.name = node.name,
                                .path = path,
                                .kind = node.kind(),
                                .status = StepStatus::Pending,
                                .attempt = attempt,
                                .started_at_ms = util::now_millis()});
    log_.mutable_latest(path)->status = StepStatus::Running;
    log::debug("{} attempt {} running", path, attempt);
    return attempt;
  }

  auto finish_step(const std::string &path, StepStatus status,
                   std::string message = {}) -> StepStatus {
    auto *step = log_.mutable_latest(path);
    step->status = status;
    step->finished_at_ms = util::now_millis();
    if (!message.empty()) {
      step->message = std::move(message);
    }
    if (status == StepStatus::Success) {
      log::info("{} succeeded", path);
    } else {
      log::warn("{} failed: {}", path, step->message);
    }
    persist();
    return status;
  }

  [[nodiscard]] auto compute_folder(const Node &node) const -> fs::path {
    fs::path folder = settings_.compute_data_folder;
    if (node.catalog && !node.catalog->compute_data_folder.empty()) {
      folder = node.catalog->compute_data_folder;
    }
    if (folder.is_relative() && !settings_.working_dir.empty()) {
      folder = settings_.working_dir / folder;
    }
    return folder;
  }

  // Checks the compute folder and performs the node's catalog gets.
  auto catalog_get(const Node &node, const std::string &path)
      -> Result<void> {
    if (!node.catalog || !services_.catalog) {
      return ok();
    }
    const auto folder = compute_folder(node);
    if (!fs::is_directory(folder)) {
      finish_step(path, StepStatus::Failed,
                  std::format("compute data folder {} does not exist",
                              folder.string()));
      return fail(Error::NoComputeFolder);
    }
    for (const auto &pattern : node.catalog->get) {
      auto refs = services_.catalog->get(log_.run_id, pattern, folder, path);
      if (!refs) {
        finish_step(path, StepStatus::Failed,
                    std::format("catalog get '{}': {}", pattern,
                                refs.error().message()));
        return fail(refs.error());
      }
      auto &catalogs = log_.mutable_latest(path)->data_catalogs;
      catalogs.insert(catalogs.end(), refs->begin(), refs->end());
    }
    return ok();
  }

  auto catalog_put(const Node &node, const std::string &path)
      -> Result<void> {
    if (!node.catalog || !services_.catalog) {
      return ok();
    }
    const auto folder = compute_folder(node);
    for (const auto &pattern : node.catalog->put) {
      auto refs = services_.catalog->put(log_.run_id, pattern, folder, path);
      if (!refs) {
        finish_step(path, StepStatus::Failed,
                    std::format("catalog put '{}': {}", pattern,
                                refs.error().message()));
        return fail(refs.error());
      }
      auto &catalogs = log_.mutable_latest(path)->data_catalogs;
      catalogs.insert(catalogs.end(), refs->begin(), refs->end());
    }
    return ok();
  }

  auto run_as_is(const Node &node, const std::string &path)
      -> Result<StepStatus> {
    begin_step(node, path);
    if (auto r = catalog_get(node, path); !r) {
      return fail(r.error());
    }
    if (auto r = catalog_put(node, path); !r) {
      return fail(r.error());
    }
    return ok(finish_step(path, StepStatus::Success));
  }

  // Parameters, map bindings and secrets exported to a task.
  auto build_env(const TaskSpec &spec, const Bindings &bindings,
                 std::string &problem) -> std::optional<EnvMap> {
    EnvMap env;
    auto export_parameter = [&env](const std::string &name,
                                   const JsonValue &value) {
      auto key = std::string(kParameterEnvPrefix) + name;
      if (!is_valid_env_key(key)) {
        log::warn("parameter '{}' cannot be exported to the environment",
                  name);
        return;
      }
      env.insert_or_assign(std::move(key), dump_json(value));
    };
    for (const auto &[name, value] : log_.parameters) {
      export_parameter(name, value);
    }
    for (const auto &[name, value] : bindings) {
      export_parameter(name, value);
    }
    for (const auto &[name, value] : settings_.environment) {
      if (name.starts_with(kEnvMetricPrefix)) {
        env.insert_or_assign(name, value);
      }
    }
    env.insert_or_assign("PIPEFORGE_RUN_ID", log_.run_id);

    for (const auto &secret : spec.secrets) {
      if (!services_.secrets) {
        problem = std::format("secret '{}' requested but no secrets provider "
                              "is configured",
                              secret);
        return std::nullopt;
      }
      auto value = services_.secrets->get(secret);
      if (!value) {
        problem = std::format("secret '{}' could not be resolved", secret);
        return std::nullopt;
      }
      env.insert_or_assign(secret, std::move(*value));
    }
    return env;
  }

  auto backend_config(const Node &node, const TaskSpec &spec, EnvMap env,
                      std::string &problem) -> std::optional<ExecutorConfig> {
    const auto working_dir = settings_.working_dir.empty()
                                 ? fs::current_path()
                                 : fs::absolute(settings_.working_dir);
    const bool containerised = !spec.image.empty() ||
                               settings_.executor_type ==
                                   ExecutorType::LocalContainer;
    if (!containerised) {
      return ShellExecutorConfig{.command = spec.command,
                                 .working_dir = working_dir.string(),
                                 .execution_timeout = spec.timeout,
                                 .env = std::move(env)};
    }

    DockerExecutorConfig config{
        .image = spec.image.empty() ? settings_.docker_image : spec.image,
        .command = spec.command,
        .working_dir = working_dir.string(),
        .execution_timeout = spec.timeout,
        .env = std::move(env),
        .mounts = {std::format("{0}:{0}", working_dir.string())}};
    if (config.image.empty()) {
      problem = "no container image configured";
      return std::nullopt;
    }
    const auto folder = fs::absolute(compute_folder(node)).lexically_normal();
    const auto rel = folder.lexically_relative(working_dir);
    if (rel.empty() || rel.begin()->string() == "..") {
      config.mounts.push_back(std::format("{0}:{0}", folder.string()));
    }
    return config;
  }

  auto run_task(const Node &node, const TaskSpec &spec,
                const std::string &path, const Bindings &bindings)
      -> task<Result<StepStatus>> {
    const auto attempt = begin_step(node, path);
    if (auto r = catalog_get(node, path); !r) {
      co_return fail(r.error());
    }

    std::string problem;
    auto env = build_env(spec, bindings, problem);
    if (!env) {
      co_return ok(finish_step(path, StepStatus::Failed, std::move(problem)));
    }
    auto env_snapshot = settings_.environment;
    for (const auto &[key, value] : *env) {
      env_snapshot.insert_or_assign(key, value);
    }
    auto config = backend_config(node, spec, std::move(*env), problem);
    if (!config) {
      co_return ok(finish_step(path, StepStatus::Failed, std::move(problem)));
    }

    log::info("dispatching {} (attempt {})", path, attempt);
    auto result = co_await execute_async(
        *services_.executor,
        make_instance_id(RunId{log_.run_id}, path, attempt),
        std::move(*config));

    const bool succeeded =
        result.exit_code == 0 && result.error.empty() && !result.timed_out;
    auto events = parse_node_events(result.stdout_output);
    auto *step = log_.mutable_latest(path);
    step->exit_code = result.exit_code;
    for (const auto &line : events.malformed) {
      log::warn("{}: ignoring malformed line '{}'", path, line);
    }

    // Metrics and parameters of a failed attempt are dropped.
    if (!succeeded) {
      co_return ok(
          finish_step(path, StepStatus::Failed, failure_message(result)));
    }

    for (auto &event : events.metrics) {
      if (services_.tracker) {
        services_.tracker->log_metric(event.key, event.value, event.step);
      }
      step->record_metric(event.key, std::move(event.value), event.step);
    }
    for (auto &metric : capture_env_metrics(env_snapshot)) {
      step->record_metric(metric.key, std::move(metric.value));
    }
    for (auto &[name, value] : events.parameters) {
      if (services_.tracker) {
        services_.tracker->log_parameter(name, value);
      }
      log_.parameters.insert_or_assign(name, std::move(value));
    }
    if (auto r = catalog_put(node, path); !r) {
      co_return fail(r.error());
    }
    co_return ok(finish_step(path, StepStatus::Success));
  }

  auto run_composite(const Node &node, const std::string &path,
                     const Bindings &bindings) -> task<Result<StepStatus>> {
    begin_step(node, path);

    std::vector<Branch> branches;
    if (const auto *par = std::get_if<ParallelSpec>(&node.spec)) {
      for (const auto &[name, body] : par->branches) {
        branches.push_back(Branch{.path = node_path::join(path, name),
                                  .graph = body.get(),
                                  .bindings = bindings});
      }
    } else if (const auto *map = std::get_if<MapSpec>(&node.spec)) {
      auto scope = log_.parameters;
      for (const auto &[name, value] : bindings) {
        scope.insert_or_assign(name, value);
      }
      std::string diagnostic;
      auto items = resolve_map_items(scope, map->iterate_on, &diagnostic);
      if (!items) {
        co_return ok(
            finish_step(path, StepStatus::Failed, std::move(diagnostic)));
      }
      for (auto &item : *items) {
        Branch branch{.path = node_path::join(path, item.segment),
                      .graph = map->branch.get(),
                      .bindings = bindings};
        branch.bindings.insert_or_assign(map->iterate_as,
                                         std::move(item.value));
        branches.push_back(std::move(branch));
      }
    } else if (const auto *dag = std::get_if<DagSpec>(&node.spec)) {
      branches.push_back(
          Branch{.path = node_path::join(path, node_path::kDagBranch),
                 .graph = dag->body.get(),
                 .bindings = bindings});
    }

    for (const auto &branch : branches) {
      log_.set_branch_status(branch.path, StepStatus::Running);
    }
    auto results = co_await run_branches(std::move(branches));

    std::vector<std::string> failed;
    for (auto &[branch_path, result] : results) {
      if (!result) {
        finish_step(path, StepStatus::Failed,
                    std::format("{} aborted: {}", branch_path,
                                result.error().message()));
        co_return fail(result.error());
      }
      if (*result != StepStatus::Success) {
        failed.push_back(branch_path);
      }
    }
    if (failed.empty()) {
      co_return ok(finish_step(path, StepStatus::Success));
    }
    std::string message = "failed branches:";
    for (const auto &branch_path : failed) {
      message += " " + branch_path;
    }
    co_return ok(finish_step(path, StepStatus::Failed, std::move(message)));
  }

  auto run_branch(Branch branch) -> task<Result<StepStatus>> {
    auto result = co_await run_graph(*branch.graph, branch.path,
                                     std::move(branch.bindings));
    log_.set_branch_status(branch.path,
                           result ? *result : StepStatus::Failed);
    co_return result;
  }

  using BranchResults =
      std::vector<std::pair<std::string, Result<StepStatus>>>;

  auto run_branches(std::vector<Branch> branches) -> task<BranchResults> {
    BranchResults results;
    results.reserve(branches.size());

    // A fatal error in one branch keeps the later ones from starting.
    if (!settings_.enable_parallel || branches.size() <= 1) {
      for (auto &branch : branches) {
        auto branch_path = branch.path;
        auto r = co_await run_branch(std::move(branch));
        const bool fatal = !r.has_value();
        results.emplace_back(std::move(branch_path), std::move(r));
        if (fatal) {
          break;
        }
      }
      co_return results;
    }

    auto ex = co_await boost::asio::this_coro::executor;
    using Op = decltype(co_spawn(ex, std::declval<task<Result<StepStatus>>>(),
                                 boost::asio::deferred));
    std::vector<Op> ops;
    ops.reserve(branches.size());
    std::vector<std::string> paths;
    for (auto &branch : branches) {
      paths.push_back(branch.path);
      ops.push_back(
          co_spawn(ex, run_branch(std::move(branch)), boost::asio::deferred));
    }

    auto [order, exceptions, outcomes] =
        co_await boost::asio::experimental::make_parallel_group(std::move(ops))
            .async_wait(boost::asio::experimental::wait_for_all(),
                        use_awaitable);
    for (const auto &ep : exceptions) {
      if (ep) {
        std::rethrow_exception(ep);
      }
    }
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
      results.emplace_back(std::move(paths[i]), std::move(outcomes[i]));
    }
    co_return results;
  }

  EngineServices services_;
  RunSettings settings_;
  RunLog log_;
  std::error_code persist_error_;
};

} // namespace

struct Engine::Impl {
  EngineServices services;
};

Engine::Engine(EngineServices services)
    : impl_(std::make_unique<Impl>(Impl{.services = services})) {}

Engine::~Engine() = default;

auto Engine::run(GraphPtr graph, RunSettings settings)
    -> task<Result<RunLog>> {
  if (!graph || !impl_->services.executor) {
    co_return fail(Error::InvalidArgument);
  }
  if (settings.plan && !settings.prior) {
    co_return fail(Error::InvalidArgument);
  }
  if (settings.run_id.empty()) {
    settings.run_id = generate_run_id().str();
  }
  RunExecution execution(impl_->services, std::move(settings));
  co_return co_await execution.execute(*graph);
}

} // namespace pipeforge
