#pragma once

#include "pipeforge/core/coroutine.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/dag/graph.hpp"
#include "pipeforge/engine/rerun_planner.hpp"
#include "pipeforge/executor/executor.hpp"
#include "pipeforge/run_log/run_log.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace pipeforge {

class ICatalog;
class IRunLogStore;
class ITracker;
class ISecretsProvider;

// Collaborators of the engine. Non-owning; tracker and secrets may be null.
struct EngineServices {
  IExecutor *executor{nullptr};
  ICatalog *catalog{nullptr};
  IRunLogStore *store{nullptr};
  ITracker *tracker{nullptr};
  ISecretsProvider *secrets{nullptr};
};

struct RunSettings {
  std::string run_id;
  std::string tag;
  std::string dag_hash;
  // false runs parallel branches and map items one after another.
  bool enable_parallel{true};
  ExecutorType executor_type{ExecutorType::Local};
  // Image for ExecutorType::LocalContainer when a task names none.
  std::string docker_image;
  std::filesystem::path working_dir;
  // Relative paths resolve against working_dir.
  std::filesystem::path compute_data_folder{"data"};
  ParameterMap parameters;
  // Environment snapshot visible to every task.
  std::map<std::string, std::string> environment;

  // Set for re-runs. Both must outlive the run.
  const RunLog *prior{nullptr};
  const RerunPlan *plan{nullptr};
};

// Walks a compiled graph, dispatching leaves to the compute backend and
// recording every attempt in the run log.
//
// Node failures are data: they end up as StepStatus::Failed in the log and
// the returned RunLog. The Result carries only fatal problems (catalog
// preconditions, invariant violations, persistence failure), in which case
// the run log has still been persisted with status Failed.
class Engine {
public:
  explicit Engine(EngineServices services);
  ~Engine();

  Engine(const Engine &) = delete;
  auto operator=(const Engine &) -> Engine & = delete;

  [[nodiscard]] auto run(GraphPtr graph, RunSettings settings)
      -> task<Result<RunLog>>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace pipeforge
