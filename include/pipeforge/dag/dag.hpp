#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/util/enum.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge {

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

enum class EdgeKind : std::uint8_t { Next, OnFailure };
BOOST_DESCRIBE_ENUM(EdgeKind, Next, OnFailure)
PIPEFORGE_DEFINE_ENUM_SERDE(EdgeKind, EdgeKind::Next)

struct Edge {
  NodeIndex to{kInvalidNode};
  EdgeKind kind{EdgeKind::Next};
};

// Adjacency index over the nodes of one graph level. Composite bodies are
// indexed separately by their own DAG.
class DAG {
public:
  [[nodiscard]] auto add_node(std::string name) -> Result<NodeIndex>;
  [[nodiscard]] auto add_edge(std::string_view from, std::string_view to,
                              EdgeKind kind) -> Result<void>;

  [[nodiscard]] auto has_node(std::string_view name) const -> bool;
  [[nodiscard]] auto get_index(std::string_view name) const -> NodeIndex;
  [[nodiscard]] auto get_key(NodeIndex idx) const -> std::string_view;

  // Fails with CycleDetected if any next/on_failure path revisits a node.
  [[nodiscard]] auto is_valid() const -> Result<void>;

  [[nodiscard]] auto edges(NodeIndex idx) const noexcept
      -> std::span<const Edge>;

  // Every node reachable from `from` through any edge, excluding `from`,
  // in breadth-first order.
  [[nodiscard]] auto reachable_from(NodeIndex from) const
      -> std::vector<NodeIndex>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return adjacency_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return adjacency_.empty();
  }

private:
  std::vector<std::vector<Edge>> adjacency_;
  std::vector<std::string> keys_;
  ankerl::unordered_dense::map<std::string, NodeIndex> key_to_idx_;
};

} // namespace pipeforge
