#include "pipeforge/cli/commands.hpp"
#include "pipeforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("PIPEFORGE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Command output goes to stdout; log lines stay on stderr.
  pipeforge::log::set_output_stderr();
  pipeforge::log::set_level(pipeforge::log::Level::Warn);

  CLI::App app{"PipeForge", "Runs DAG pipelines and resumes failed runs"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  pipeforge run -f pipeline.toml -c pipeforge.toml\n"
             "  pipeforge retry <run_id> -f pipeline.toml\n"
             "  pipeforge inspect <run_id> --json\n"
             "\nTip: Set PIPEFORGE_CONFIG=pipeforge.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  pipeforge::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Execute a pipeline");
  run->footer("\nExamples:\n"
              "  pipeforge run -f pipeline.toml\n"
              "  pipeforge run -f pipeline.json --parameters-file params.json "
              "--tag nightly\n"
              "  pipeforge run -f pipeline.toml --sequential");
  run_opts.config_file = env_config;
  run->add_option("-c,--config", run_opts.config_file, "System config file")
      ->check(CLI::ExistingFile);
  run->add_option("-f,--file", run_opts.pipeline_file,
                  "Pipeline definition (.toml or .json)")
      ->required()
      ->check(CLI::ExistingFile);
  run->add_option("--run-id", run_opts.run_id,
                  "Run id (default: generated)");
  run->add_option("--tag", run_opts.tag, "Free-form tag stored in the run log");
  run->add_option("--parameters-file", run_opts.parameters_file,
                  "JSON object of initial parameters")
      ->check(CLI::ExistingFile);
  auto *sequential = run->add_flag_callback(
      "--sequential", [&run_opts] { run_opts.enable_parallel = false; },
      "Run parallel branches and map items one at a time");
  auto *parallel = run->add_flag_callback(
      "--parallel", [&run_opts] { run_opts.enable_parallel = true; },
      "Run parallel branches and map items concurrently");
  sequential->excludes(parallel);
  run->add_flag("--json", run_opts.json, "Print the run log as JSON");
  run->callback(
      [&run_opts]() { std::exit(pipeforge::cli::cmd_run(run_opts)); });

  pipeforge::cli::RetryOptions retry_opts;
  auto *retry = app.add_subcommand(
      "retry", "Re-run a previous run, skipping what already succeeded");
  retry->footer("\nExamples:\n"
                "  pipeforge retry <run_id> -f pipeline.toml\n"
                "  pipeforge retry <run_id> -f pipeline.toml --force");
  retry_opts.config_file = env_config;
  retry->add_option("-c,--config", retry_opts.config_file,
                    "System config file")
      ->check(CLI::ExistingFile);
  retry->add_option("run_id", retry_opts.previous_run_id, "Previous run id")
      ->required();
  retry->add_option("-f,--file", retry_opts.pipeline_file,
                    "Pipeline definition (.toml or .json)")
      ->required()
      ->check(CLI::ExistingFile);
  retry->add_option("--run-id", retry_opts.run_id,
                    "New run id (default: generated)");
  retry->add_option("--parameters-file", retry_opts.parameters_file,
                    "JSON object overriding the previous parameters")
      ->check(CLI::ExistingFile);
  retry->add_flag("--force", retry_opts.force,
                  "Proceed even if the pipeline definition changed");
  retry->add_flag("--json", retry_opts.json, "Print the run log as JSON");
  retry->callback(
      [&retry_opts]() { std::exit(pipeforge::cli::cmd_retry(retry_opts)); });

  pipeforge::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Parse and compile a pipeline definition");
  validate->add_option("-f,--file", validate_opts.pipeline_file,
                       "Pipeline definition (.toml or .json)")
      ->required();
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(pipeforge::cli::cmd_validate(validate_opts));
  });

  pipeforge::cli::InspectOptions inspect_opts;
  auto *inspect = app.add_subcommand("inspect", "Show a stored run log");
  inspect_opts.config_file = env_config;
  inspect->add_option("-c,--config", inspect_opts.config_file,
                      "System config file")
      ->check(CLI::ExistingFile);
  inspect->add_option("run_id", inspect_opts.run_id, "Run id")->required();
  inspect->add_flag("--json", inspect_opts.json, "Output JSON");
  inspect->callback([&inspect_opts]() {
    std::exit(pipeforge::cli::cmd_inspect(inspect_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
