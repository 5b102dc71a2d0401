#include "pipeforge/app/pipeline_runner.hpp"
#include "pipeforge/cli/commands.hpp"
#include "pipeforge/cli/formatting.hpp"
#include "pipeforge/util/log.hpp"

#include <print>

namespace pipeforge::cli {

namespace {

auto report(const Result<RunLog> &res, const PipelineRunner &runner,
            bool json) -> int {
  if (!res) {
    fmt::print_error("run aborted", res.error(), runner.diagnostic());
    return 1;
  }
  if (json) {
    auto text = to_json(*res);
    if (!text) {
      fmt::print_error("cannot serialize run log", text.error(), {});
      return 1;
    }
    std::println("{}", *text);
  } else {
    fmt::print_run_log(*res);
  }
  return res->status == StepStatus::Success ? 0 : 1;
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  auto config = fmt::load_config(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: failed to load config: {}",
                 config.error().message());
    return 1;
  }

  PipelineRunner runner(std::move(*config));
  if (auto r = runner.init(); !r) {
    fmt::print_error("initialization failed", r.error(), runner.diagnostic());
    return 1;
  }
  log::start();

  auto res = runner.run(RunRequest{.pipeline_file = opts.pipeline_file,
                                   .run_id = opts.run_id,
                                   .tag = opts.tag,
                                   .parameters_file = opts.parameters_file,
                                   .enable_parallel = opts.enable_parallel});
  auto code = report(res, runner, opts.json);
  log::stop();
  return code;
}

auto cmd_retry(const RetryOptions &opts) -> int {
  auto config = fmt::load_config(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: failed to load config: {}",
                 config.error().message());
    return 1;
  }

  PipelineRunner runner(std::move(*config));
  if (auto r = runner.init(); !r) {
    fmt::print_error("initialization failed", r.error(), runner.diagnostic());
    return 1;
  }
  log::start();

  auto res =
      runner.retry(RetryRequest{.previous_run_id = opts.previous_run_id,
                                .pipeline_file = opts.pipeline_file,
                                .run_id = opts.run_id,
                                .parameters_file = opts.parameters_file,
                                .force = opts.force});
  auto code = report(res, runner, opts.json);
  log::stop();
  return code;
}

} // namespace pipeforge::cli
