#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/run_log/run_log.hpp"
#include "pipeforge/util/json.hpp"

#include <format>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pipeforge {

struct MapItem {
  // Path segment of the iteration, the textual rendering of `value`.
  std::string segment;
  JsonValue value;
};

// Resolves the iteration collection of a map node from `parameters`. Every
// item must render to a distinct, non-empty segment without '.'.
[[nodiscard]] inline auto resolve_map_items(const ParameterMap &parameters,
                                            std::string_view iterate_on,
                                            std::string *diagnostic)
    -> Result<std::vector<MapItem>> {
  auto report = [diagnostic](std::string message) {
    if (diagnostic) {
      *diagnostic = std::move(message);
    }
    return fail(Error::InvalidArgument);
  };

  auto it = parameters.find(std::string(iterate_on));
  if (it == parameters.end()) {
    return report(std::format("parameter '{}' is not set", iterate_on));
  }
  if (!it->second.is_array()) {
    return report(std::format("parameter '{}' is not a list", iterate_on));
  }

  std::vector<MapItem> items;
  std::unordered_set<std::string> seen;
  for (const auto &value : it->second.get_array()) {
    auto segment = stringify(value);
    if (segment.empty() || segment.find('.') != std::string::npos) {
      return report(std::format(
          "item '{}' of '{}' cannot name a branch (empty or contains '.')",
          segment, iterate_on));
    }
    if (!seen.insert(segment).second) {
      return report(
          std::format("item '{}' of '{}' is repeated", segment, iterate_on));
    }
    items.push_back(MapItem{.segment = std::move(segment), .value = value});
  }
  return ok(std::move(items));
}

} // namespace pipeforge
