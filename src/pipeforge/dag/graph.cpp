#include "pipeforge/dag/graph.hpp"

#include "pipeforge/dag/node_path.hpp"
#include "pipeforge/util/id.hpp"
#include "pipeforge/util/log.hpp"

#include <boost/algorithm/string/split.hpp>

#include <algorithm>
#include <format>
#include <optional>
#include <ranges>
#include <unordered_set>
#include <utility>

namespace pipeforge {

namespace {

[[nodiscard]] auto is_valid_node_name(std::string_view name) -> bool {
  return !name.empty() && name.find('.') == std::string_view::npos &&
         name.find('%') == std::string_view::npos && !has_control_chars(name);
}

class Diagnostics {
public:
  Diagnostics(std::vector<std::string> &errors, std::string_view scope)
      : errors_(errors), scope_(scope) {}

  auto report(Error e, std::string message) -> void {
    if (!first_) {
      first_ = e;
    }
    errors_.push_back(scope_.empty()
                          ? std::move(message)
                          : std::format("{}: {}", scope_, message));
  }

  auto absorb(const std::error_code &ec) -> void {
    if (!first_ && ec.category() == error_category()) {
      first_ = static_cast<Error>(ec.value());
    }
  }

  [[nodiscard]] auto failed() const noexcept -> bool {
    return first_.has_value();
  }
  [[nodiscard]] auto first() const noexcept -> Error {
    return first_.value_or(Error::Unknown);
  }

private:
  std::vector<std::string> &errors_;
  std::string_view scope_;
  std::optional<Error> first_;
};

} // namespace

auto Graph::find(std::string_view name) const -> const Node * {
  const auto idx = dag_.get_index(name);
  return idx == kInvalidNode ? nullptr : &nodes_[idx];
}

auto Graph::downstream_of(std::string_view name) const
    -> std::vector<const Node *> {
  std::vector<const Node *> out;
  for (const auto idx : dag_.reachable_from(dag_.get_index(name))) {
    out.push_back(&nodes_[idx]);
  }
  return out;
}

auto Graph::resolve(std::string_view path) const -> const Node * {
  std::vector<std::string> segments;
  boost::algorithm::split(segments, path, [](char c) { return c == '.'; });

  const Graph *graph = this;
  std::size_t i = 0;
  while (i < segments.size()) {
    const Node *node = graph->find(segments[i++]);
    if (!node || i == segments.size()) {
      return node;
    }
    const auto &branch_segment = segments[i++];
    if (i == segments.size()) {
      // Path names a branch, not a node.
      return nullptr;
    }
    if (const auto *par = std::get_if<ParallelSpec>(&node->spec)) {
      auto it = std::ranges::find(par->branches, branch_segment,
                                  &std::pair<std::string, GraphPtr>::first);
      if (it == par->branches.end()) {
        return nullptr;
      }
      graph = it->second.get();
    } else if (const auto *map = std::get_if<MapSpec>(&node->spec)) {
      graph = map->branch.get();
    } else if (const auto *dag = std::get_if<DagSpec>(&node->spec)) {
      if (branch_segment != node_path::kDagBranch) {
        return nullptr;
      }
      graph = dag->body.get();
    } else {
      return nullptr;
    }
  }
  return nullptr;
}

auto compile_graph(const GraphDeclaration &declaration, std::string_view scope,
                   std::vector<std::string> &errors) -> Result<GraphPtr> {
  Diagnostics diag(errors, scope);
  auto graph = std::make_shared<Graph>();
  graph->name_ = declaration.name;

  if (declaration.steps.empty()) {
    diag.report(Error::InvalidBranch, "graph has no steps");
    return fail(diag.first());
  }

  auto compile_body = [&](const GraphDeclaration &body,
                          std::string branch_scope) -> GraphPtr {
    auto res = compile_graph(body, branch_scope, errors);
    if (!res) {
      diag.absorb(res.error());
      return nullptr;
    }
    return std::move(*res);
  };

  for (const auto &step : declaration.steps) {
    if (!is_valid_node_name(step.name)) {
      diag.report(Error::InvalidNodeName,
                  std::format("invalid node name '{}' (must be non-empty, "
                              "without '.' or '%')",
                              step.name));
      continue;
    }
    auto kind = util::try_parse_enum<NodeKind>(step.type);
    if (!kind) {
      diag.report(Error::UnknownNodeKind,
                  std::format("node '{}': unknown type '{}'", step.name,
                              step.type));
      continue;
    }
    if (auto idx = graph->dag_.add_node(step.name); !idx) {
      diag.report(Error::DuplicateNode,
                  std::format("duplicate node name '{}'", step.name));
      continue;
    }

    Node node{.name = step.name,
              .next = step.next,
              .on_failure = step.on_failure.empty()
                                ? std::nullopt
                                : std::optional<std::string>{step.on_failure},
              .catalog = step.catalog,
              .spec = SuccessSpec{}};
    const auto node_scope = node_path::join(scope, step.name);

    switch (*kind) {
    case NodeKind::Task: {
      if (step.command.empty()) {
        diag.report(Error::MissingCommand,
                    std::format("task '{}' has no command", step.name));
      }
      node.spec = TaskSpec{.command = step.command,
                           .image = step.image,
                           .timeout = step.timeout > 0
                                          ? std::chrono::seconds(step.timeout)
                                          : kDefaultTaskTimeout,
                           .secrets = step.secrets};
      break;
    }
    case NodeKind::AsIs:
      node.spec = AsIsSpec{};
      break;
    case NodeKind::Parallel: {
      ParallelSpec spec;
      if (step.branches.empty()) {
        diag.report(Error::InvalidBranch,
                    std::format("parallel '{}' has no branches", step.name));
      }
      std::unordered_set<std::string> seen;
      for (const auto &branch : step.branches) {
        if (!is_valid_node_name(branch.name)) {
          diag.report(Error::InvalidNodeName,
                      std::format("parallel '{}': invalid branch name '{}'",
                                  step.name, branch.name));
          continue;
        }
        if (!seen.insert(branch.name).second) {
          diag.report(Error::DuplicateNode,
                      std::format("parallel '{}': duplicate branch '{}'",
                                  step.name, branch.name));
          continue;
        }
        if (auto body = compile_body(
                branch, node_path::join(node_scope, branch.name))) {
          spec.branches.emplace_back(branch.name, std::move(body));
        }
      }
      node.spec = std::move(spec);
      break;
    }
    case NodeKind::Map: {
      MapSpec spec{.iterate_on = step.iterate_on,
                   .iterate_as = step.iterate_as,
                   .branch = nullptr};
      if (step.iterate_on.empty() || step.iterate_as.empty()) {
        diag.report(Error::InvalidBranch,
                    std::format("map '{}' needs iterate_on and iterate_as",
                                step.name));
      }
      if (step.branches.size() != 1) {
        diag.report(Error::InvalidBranch,
                    std::format("map '{}' must declare exactly one branch",
                                step.name));
      } else {
        spec.branch = compile_body(step.branches.front(), node_scope);
      }
      node.spec = std::move(spec);
      break;
    }
    case NodeKind::Dag: {
      DagSpec spec;
      if (step.branches.size() != 1) {
        diag.report(Error::InvalidBranch,
                    std::format("dag '{}' must declare exactly one body",
                                step.name));
      } else {
        spec.body = compile_body(
            step.branches.front(),
            node_path::join(node_scope, node_path::kDagBranch));
      }
      node.spec = std::move(spec);
      break;
    }
    case NodeKind::Success:
    case NodeKind::Fail:
      if (!step.next.empty() || !step.on_failure.empty()) {
        diag.report(Error::InvalidArgument,
                    std::format("terminal node '{}' cannot have outgoing edges",
                                step.name));
      }
      if (*kind == NodeKind::Success) {
        node.spec = SuccessSpec{};
      } else {
        node.spec = FailSpec{};
      }
      break;
    }
    graph->nodes_.push_back(std::move(node));
  }

  const auto count_kind = [&](NodeKind k) {
    return std::ranges::count_if(graph->nodes_,
                                 [k](const Node &n) { return n.kind() == k; });
  };
  if (count_kind(NodeKind::Success) != 1 || count_kind(NodeKind::Fail) != 1) {
    diag.report(Error::MissingTerminal,
                "graph must have exactly one success and one fail node");
  }
  if (declaration.start_at.empty() ||
      !graph->dag_.has_node(declaration.start_at)) {
    diag.report(Error::MissingStartNode,
                std::format("start_at '{}' is not a node of the graph",
                            declaration.start_at));
  }
  if (diag.failed()) {
    return fail(diag.first());
  }

  for (auto [i, node] : std::views::enumerate(graph->nodes_)) {
    const auto idx = static_cast<NodeIndex>(i);
    if (node.kind() == NodeKind::Success) {
      graph->success_ = idx;
    } else if (node.kind() == NodeKind::Fail) {
      graph->fail_ = idx;
    }
  }
  graph->start_ = graph->dag_.get_index(declaration.start_at);

  for (auto &node : graph->nodes_) {
    if (node.is_terminal()) {
      continue;
    }
    if (node.next.empty()) {
      node.next = graph->success_node().name;
    }
    if (auto r = graph->dag_.add_edge(node.name, node.next, EdgeKind::Next);
        !r) {
      diag.report(r.error() == Error::CycleDetected ? Error::CycleDetected
                                                    : Error::UnknownNeighbour,
                  std::format("node '{}': next '{}' is invalid", node.name,
                              node.next));
    }
    if (node.on_failure) {
      if (auto r = graph->dag_.add_edge(node.name, *node.on_failure,
                                        EdgeKind::OnFailure);
          !r) {
        diag.report(r.error() == Error::CycleDetected
                        ? Error::CycleDetected
                        : Error::UnknownNeighbour,
                    std::format("node '{}': on_failure '{}' is invalid",
                                node.name, *node.on_failure));
      }
    }
  }

  if (!diag.failed()) {
    if (auto r = graph->dag_.is_valid(); !r) {
      diag.report(Error::CycleDetected, "cycle detected in graph");
    }
  }
  if (diag.failed()) {
    return fail(diag.first());
  }
  return ok(GraphPtr{std::move(graph)});
}

auto compile(const GraphDeclaration &declaration,
             std::vector<std::string> *errors) -> Result<GraphPtr> {
  std::vector<std::string> local;
  auto &sink = errors ? *errors : local;
  auto res = compile_graph(declaration, "", sink);
  if (!res) {
    for (const auto &msg : sink) {
      log::debug("compile: {}", msg);
    }
  }
  return res;
}

} // namespace pipeforge
