#include "pipeforge/cli/commands.hpp"
#include "pipeforge/cli/formatting.hpp"
#include "pipeforge/config/config.hpp"
#include "pipeforge/run_log/run_log_store.hpp"

#include <format>
#include <print>

namespace pipeforge::cli {

auto cmd_inspect(const InspectOptions &opts) -> int {
  auto config = fmt::load_config(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: failed to load config: {}",
                 config.error().message());
    return 1;
  }

  if (config->run_log_store.type != RunLogStoreType::FileSystem) {
    std::println(stderr,
                 "Error: inspect needs a file_system run log store, the "
                 "configured store keeps nothing between invocations");
    return 1;
  }

  FileSystemRunLogStore store(config->run_log_store.location);
  auto run_log = store.get_run_log(opts.run_id);
  if (!run_log) {
    fmt::print_error(std::format("cannot read run {}", opts.run_id),
                     run_log.error(), {});
    return 1;
  }

  if (opts.json) {
    auto text = to_json(*run_log);
    if (!text) {
      std::println(stderr, "Error: {}", text.error().message());
      return 1;
    }
    std::println("{}", *text);
    return 0;
  }

  fmt::print_run_log(*run_log);
  return 0;
}

} // namespace pipeforge::cli
