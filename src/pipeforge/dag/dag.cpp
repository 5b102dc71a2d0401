#include "pipeforge/dag/dag.hpp"

#include <ranges>
#include <utility>

namespace pipeforge {

auto DAG::add_node(std::string name) -> Result<NodeIndex> {
  if (key_to_idx_.contains(name)) {
    return fail(Error::DuplicateNode);
  }
  const auto idx = static_cast<NodeIndex>(adjacency_.size());
  adjacency_.emplace_back();
  keys_.push_back(name);
  key_to_idx_.emplace(std::move(name), idx);
  return ok(idx);
}

auto DAG::add_edge(std::string_view from, std::string_view to, EdgeKind kind)
    -> Result<void> {
  const NodeIndex from_idx = get_index(from);
  const NodeIndex to_idx = get_index(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::UnknownNeighbour);
  }
  if (from_idx == to_idx) {
    return fail(Error::CycleDetected);
  }
  adjacency_[from_idx].push_back(Edge{.to = to_idx, .kind = kind});
  return ok();
}

auto DAG::has_node(std::string_view name) const -> bool {
  return get_index(name) != kInvalidNode;
}

auto DAG::get_index(std::string_view name) const -> NodeIndex {
  auto it = key_to_idx_.find(std::string(name));
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DAG::get_key(NodeIndex idx) const -> std::string_view {
  if (idx >= keys_.size()) {
    return {};
  }
  return keys_[idx];
}

auto DAG::is_valid() const -> Result<void> {
  // 0 = unvisited, 1 = on the DFS stack, 2 = done
  std::vector<std::uint8_t> state(adjacency_.size(), 0);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  stack.reserve(adjacency_.size());

  for (NodeIndex start : std::views::iota(
           NodeIndex{0}, static_cast<NodeIndex>(adjacency_.size()))) {
    if (state[start] != 0) {
      continue;
    }
    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, edge_idx] = stack.back();
      const auto &out = adjacency_[node];
      if (edge_idx < out.size()) {
        const NodeIndex child = out[edge_idx++].to;
        if (state[child] == 1) {
          return fail(Error::CycleDetected);
        }
        if (state[child] == 0) {
          state[child] = 1;
          stack.emplace_back(child, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return ok();
}

auto DAG::edges(NodeIndex idx) const noexcept -> std::span<const Edge> {
  if (idx >= adjacency_.size()) {
    return {};
  }
  return adjacency_[idx];
}

auto DAG::reachable_from(NodeIndex from) const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  if (from >= adjacency_.size()) {
    return out;
  }
  std::vector<bool> seen(adjacency_.size(), false);
  seen[from] = true;
  std::vector<NodeIndex> queue{from};
  std::size_t head = 0;
  while (head < queue.size()) {
    const NodeIndex current = queue[head++];
    for (const auto &edge : adjacency_[current]) {
      if (!seen[edge.to]) {
        seen[edge.to] = true;
        queue.push_back(edge.to);
        out.push_back(edge.to);
      }
    }
  }
  return out;
}

} // namespace pipeforge
