#pragma once

#include "pipeforge/dag/declaration.hpp"
#include "pipeforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pipeforge {

// Order must match the alternatives of NodeSpec.
enum class NodeKind : std::uint8_t {
  Task,
  AsIs,
  Parallel,
  Map,
  Dag,
  Success,
  Fail,
};
BOOST_DESCRIBE_ENUM(NodeKind, Task, AsIs, Parallel, Map, Dag, Success, Fail)
PIPEFORGE_DEFINE_ENUM_SERDE(NodeKind, NodeKind::Task)

class Graph;
using GraphPtr = std::shared_ptr<const Graph>;

inline constexpr std::chrono::seconds kDefaultTaskTimeout{3600};

struct TaskSpec {
  std::string command;
  // Non-empty runs the node in this container image.
  std::string image;
  std::chrono::seconds timeout{kDefaultTaskTimeout};
  std::vector<std::string> secrets;
};

struct AsIsSpec {};

struct ParallelSpec {
  // Declaration order is dispatch order.
  std::vector<std::pair<std::string, GraphPtr>> branches;
};

struct MapSpec {
  std::string iterate_on;
  std::string iterate_as;
  GraphPtr branch;
};

struct DagSpec {
  GraphPtr body;
};

struct SuccessSpec {};
struct FailSpec {};

using NodeSpec = std::variant<TaskSpec, AsIsSpec, ParallelSpec, MapSpec,
                              DagSpec, SuccessSpec, FailSpec>;

struct Node {
  std::string name;
  // Empty only for terminal nodes.
  std::string next;
  std::optional<std::string> on_failure;
  std::optional<CatalogSettings> catalog;
  NodeSpec spec;

  [[nodiscard]] auto kind() const noexcept -> NodeKind {
    return static_cast<NodeKind>(spec.index());
  }

  [[nodiscard]] auto is_terminal() const noexcept -> bool {
    return kind() == NodeKind::Success || kind() == NodeKind::Fail;
  }

  [[nodiscard]] auto is_composite() const noexcept -> bool {
    const auto k = kind();
    return k == NodeKind::Parallel || k == NodeKind::Map || k == NodeKind::Dag;
  }
};

} // namespace pipeforge
