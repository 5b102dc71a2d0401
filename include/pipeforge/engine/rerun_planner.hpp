#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/dag/graph.hpp"
#include "pipeforge/run_log/run_log.hpp"
#include "pipeforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace pipeforge {

enum class RerunAction : std::uint8_t { Skip, Execute };
BOOST_DESCRIBE_ENUM(RerunAction, Skip, Execute)
PIPEFORGE_DEFINE_ENUM_SERDE(RerunAction, RerunAction::Execute)

// Decisions for one re-run, keyed by node path. Paths without a decision
// execute.
class RerunPlan {
public:
  auto set(std::string path, RerunAction action) -> void {
    actions_.insert_or_assign(std::move(path), action);
  }

  [[nodiscard]] auto action(std::string_view path) const -> RerunAction {
    auto it = actions_.find(path);
    return it == actions_.end() ? RerunAction::Execute : it->second;
  }

  [[nodiscard]] auto actions() const noexcept
      -> const std::map<std::string, RerunAction, std::less<>> & {
    return actions_;
  }

  [[nodiscard]] auto count(RerunAction action) const -> std::size_t;

private:
  std::map<std::string, RerunAction, std::less<>> actions_;
};

// Walks the top level of `graph` in engine order against `prior`. A node is
// skipped when its prior latest attempt succeeded; a composite additionally
// needs every path recorded beneath it to have succeeded. The first node that
// is not skipped, and every node reachable after it, executes. A composite
// that executes runs all of its branches again.
//
// Fails with InvariantViolation if `prior` records a path the graph does not
// contain.
[[nodiscard]] auto plan_rerun(const Graph &graph, const RunLog &prior)
    -> Result<RerunPlan>;

} // namespace pipeforge
