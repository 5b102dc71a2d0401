#include "pipeforge/cli/commands.hpp"
#include "pipeforge/cli/formatting.hpp"
#include "pipeforge/config/pipeline_definition.hpp"
#include "pipeforge/util/json.hpp"
#include "pipeforge/util/log.hpp"

#include <filesystem>
#include <print>
#include <variant>
#include <vector>

namespace pipeforge::cli {

namespace {

struct ValidationResult {
  std::string name;
  std::size_t node_count{0};
  bool valid{false};
  std::string kind;
  std::vector<std::string> errors;
};

auto count_nodes(const Graph &graph) -> std::size_t {
  std::size_t count = 0;
  for (const auto &node : graph.nodes()) {
    ++count;
    if (const auto *par = std::get_if<ParallelSpec>(&node.spec)) {
      for (const auto &[name, branch] : par->branches) {
        count += count_nodes(*branch);
      }
    } else if (const auto *map = std::get_if<MapSpec>(&node.spec)) {
      count += count_nodes(*map->branch);
    } else if (const auto *dag = std::get_if<DagSpec>(&node.spec)) {
      count += count_nodes(*dag->body);
    }
  }
  return count;
}

auto validate_file(const std::string &path) -> ValidationResult {
  ValidationResult vr;
  std::string diagnostic;
  std::vector<std::string> errors;
  auto res = PipelineLoader::load_from_file(path, &diagnostic, &errors);
  if (res) {
    vr.valid = true;
    vr.name = res->graph->name();
    vr.node_count = count_nodes(*res->graph);
    return vr;
  }
  vr.kind = std::string(error_kind(res.error()));
  if (!diagnostic.empty()) {
    vr.errors.push_back(std::move(diagnostic));
  }
  for (auto &e : errors) {
    vr.errors.push_back(std::move(e));
  }
  if (vr.errors.empty()) {
    vr.errors.push_back(res.error().message());
  }
  return vr;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  if (!std::filesystem::exists(opts.pipeline_file)) {
    std::println(stderr, "Error: File does not exist: {}", opts.pipeline_file);
    return 1;
  }

  auto vr = validate_file(opts.pipeline_file);

  if (opts.json) {
    JsonValue obj{
        {"file", opts.pipeline_file},
        {"valid", vr.valid},
    };
    if (vr.valid) {
      obj.get_object().emplace("name", vr.name);
      obj.get_object().emplace("nodes",
                               static_cast<std::int64_t>(vr.node_count));
    } else {
      JsonValue arr = std::vector<JsonValue>{};
      for (const auto &e : vr.errors) {
        arr.get_array().emplace_back(e);
      }
      obj.get_object().emplace("kind", vr.kind);
      obj.get_object().emplace("errors", std::move(arr));
    }
    std::println("{}", dump_json(obj));
    return vr.valid ? 0 : 1;
  }

  if (vr.valid) {
    std::println("{} {} ({} nodes)", fmt::ansi::green("OK"), opts.pipeline_file,
                 vr.node_count);
    return 0;
  }
  std::println("{} {} ({})", fmt::ansi::red("INVALID"), opts.pipeline_file,
               vr.kind);
  for (const auto &e : vr.errors) {
    std::println("  - {}", e);
  }
  return 1;
}

} // namespace pipeforge::cli
