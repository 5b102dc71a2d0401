#include "pipeforge/engine/rerun_planner.hpp"

#include "pipeforge/dag/node_path.hpp"
#include "pipeforge/util/log.hpp"

#include <algorithm>
#include <unordered_set>

namespace pipeforge {

auto RerunPlan::count(RerunAction action) const -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count(
      actions_, action, &std::pair<const std::string, RerunAction>::second));
}

namespace {

class Planner {
public:
  Planner(const RunLog &prior, RerunPlan &plan) : prior_(prior), plan_(plan) {}

  auto plan_graph(const Graph &graph) -> Result<void> {
    std::unordered_set<const Node *> visited;
    const Node *node = &graph.start_at();
    while (node && !node->is_terminal()) {
      if (!visited.insert(node).second) {
        log::error("re-run planning revisited {}", node->name);
        return fail(Error::InvariantViolation);
      }
      auto path = node->name;

      // A composite that executes runs its whole body again.
      const bool skip = node->is_composite() ? subtree_succeeded(path)
                                             : succeeded(path);
      if (!skip) {
        log::info("re-run starts at {}", path);
        plan_.set(std::move(path), RerunAction::Execute);
        mark_downstream(graph, *node);
        return ok();
      }
      plan_.set(std::move(path), RerunAction::Skip);
      node = graph.find(node->next);
    }
    return ok();
  }

private:
  [[nodiscard]] auto succeeded(std::string_view path) const -> bool {
    const auto *latest = prior_.latest(path);
    return latest && latest->status == StepStatus::Success;
  }

  // The composite itself and every path recorded beneath it.
  [[nodiscard]] auto subtree_succeeded(std::string_view path) const -> bool {
    if (!succeeded(path)) {
      return false;
    }
    return std::ranges::all_of(prior_.steps, [&](const auto &record) {
      return !node_path::is_within(record.path, path) ||
             succeeded(record.path);
    });
  }

  auto mark_downstream(const Graph &graph, const Node &from) -> void {
    for (const auto *next : graph.downstream_of(from.name)) {
      if (!next->is_terminal()) {
        plan_.set(next->name, RerunAction::Execute);
      }
    }
  }

  const RunLog &prior_;
  RerunPlan &plan_;
};

} // namespace

auto plan_rerun(const Graph &graph, const RunLog &prior) -> Result<RerunPlan> {
  for (const auto &record : prior.steps) {
    if (!graph.resolve(record.path)) {
      log::error("run {} records '{}' which is not part of the pipeline",
                 prior.run_id, record.path);
      return fail(Error::InvariantViolation);
    }
  }

  RerunPlan plan;
  Planner planner(prior, plan);
  if (auto r = planner.plan_graph(graph); !r) {
    return fail(r.error());
  }
  log::info("re-run plan against {}: {} skip, {} execute", prior.run_id,
            plan.count(RerunAction::Skip), plan.count(RerunAction::Execute));
  return ok(std::move(plan));
}

} // namespace pipeforge
