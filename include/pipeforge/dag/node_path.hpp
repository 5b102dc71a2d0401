#pragma once

#include <string>
#include <string_view>

namespace pipeforge::node_path {

// Branch segment under an embedded `dag` node.
inline constexpr std::string_view kDagBranch = "dag";

[[nodiscard]] inline auto join(std::string_view prefix, std::string_view name)
    -> std::string {
  if (prefix.empty()) {
    return std::string(name);
  }
  std::string out;
  out.reserve(prefix.size() + name.size() + 1);
  out.append(prefix).push_back('.');
  out.append(name);
  return out;
}

// True if `path` is `ancestor` itself or lies underneath it.
[[nodiscard]] inline auto is_within(std::string_view path,
                                    std::string_view ancestor) -> bool {
  if (!path.starts_with(ancestor)) {
    return false;
  }
  return path.size() == ancestor.size() || path[ancestor.size()] == '.';
}

} // namespace pipeforge::node_path
