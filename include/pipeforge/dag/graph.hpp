#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/dag/dag.hpp"
#include "pipeforge/dag/declaration.hpp"
#include "pipeforge/dag/node.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge {

// Immutable, validated graph of one level. Composite nodes hold their bodies
// as further Graph values.
class Graph {
public:
  [[nodiscard]] auto name() const noexcept -> const std::string & {
    return name_;
  }
  [[nodiscard]] auto start_at() const noexcept -> const Node & {
    return nodes_[start_];
  }
  [[nodiscard]] auto success_node() const noexcept -> const Node & {
    return nodes_[success_];
  }
  [[nodiscard]] auto fail_node() const noexcept -> const Node & {
    return nodes_[fail_];
  }
  [[nodiscard]] auto nodes() const noexcept -> std::span<const Node> {
    return nodes_;
  }
  [[nodiscard]] auto index() const noexcept -> const DAG & { return dag_; }

  [[nodiscard]] auto find(std::string_view name) const -> const Node *;

  // Nodes reachable from `name` through next and on_failure edges.
  [[nodiscard]] auto downstream_of(std::string_view name) const
      -> std::vector<const Node *>;

  // Resolves a dotted node path to its node. Map item segments match any
  // value.
  [[nodiscard]] auto resolve(std::string_view path) const -> const Node *;

private:
  friend auto compile_graph(const GraphDeclaration &, std::string_view,
                            std::vector<std::string> &) -> Result<GraphPtr>;

  std::string name_;
  std::vector<Node> nodes_;
  DAG dag_;
  NodeIndex start_{0};
  NodeIndex success_{0};
  NodeIndex fail_{0};
};

// Validates a declaration and builds its Graph. Every problem found is
// appended to `errors` (when given); the returned error is the first one.
[[nodiscard]] auto compile(const GraphDeclaration &declaration,
                           std::vector<std::string> *errors = nullptr)
    -> Result<GraphPtr>;

// Recursive worker behind compile(); `scope` prefixes error messages.
[[nodiscard]] auto compile_graph(const GraphDeclaration &declaration,
                                 std::string_view scope,
                                 std::vector<std::string> &errors)
    -> Result<GraphPtr>;

} // namespace pipeforge
