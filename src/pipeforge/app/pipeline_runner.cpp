#include "pipeforge/app/pipeline_runner.hpp"

#include "pipeforge/catalog/catalog.hpp"
#include "pipeforge/engine/rerun_planner.hpp"
#include "pipeforge/executor/composite_executor.hpp"
#include "pipeforge/run_log/run_log_store.hpp"
#include "pipeforge/secrets/secrets.hpp"
#include "pipeforge/tracking/tracker.hpp"
#include "pipeforge/util/id.hpp"
#include "pipeforge/util/log.hpp"

#include <boost/process/v2/environment.hpp>

#include <exception>
#include <filesystem>
#include <format>

namespace pipeforge {

auto current_environment() -> std::map<std::string, std::string> {
  std::map<std::string, std::string> out;
  for (const auto &entry : boost::process::v2::environment::current()) {
    out.insert_or_assign(entry.key().string(), entry.value().string());
  }
  return out;
}

PipelineRunner::PipelineRunner(SystemConfig config)
    : config_(std::move(config)), environment_(current_environment()) {}

PipelineRunner::~PipelineRunner() = default;

auto PipelineRunner::init() -> Result<void> {
  log::set_level(config_.logging.level);
  if (!config_.logging.file.empty() &&
      !log::set_output_file(config_.logging.file)) {
    diagnostic_ = std::format("cannot open log file {}", config_.logging.file);
    return fail(Error::FileOpenFailed);
  }

  switch (config_.run_log_store.type) {
  case RunLogStoreType::Buffered:
    store_ = std::make_unique<BufferedRunLogStore>();
    break;
  case RunLogStoreType::FileSystem:
    store_ =
        std::make_unique<FileSystemRunLogStore>(config_.run_log_store.location);
    break;
  }

  catalog_ = std::make_unique<FileSystemCatalog>(config_.catalog.location);

  switch (config_.secrets.type) {
  case SecretsType::Env:
    secrets_ = std::make_unique<EnvSecretsProvider>(environment_);
    break;
  case SecretsType::Dotenv: {
    auto provider = DotenvSecretsProvider::load(config_.secrets.location);
    if (!provider) {
      diagnostic_ =
          std::format("cannot load secrets from {}", config_.secrets.location);
      return fail(provider.error());
    }
    secrets_ = std::move(*provider);
    break;
  }
  }

  tracker_ = create_tracker(config_.tracker.type);
  executor_ = create_composite_executor(io_.get_executor());
  log::debug("runner ready: executor={} store={} catalog={}",
             to_string_view(config_.run.executor),
             to_string_view(config_.run_log_store.type),
             config_.catalog.location);
  return ok();
}

auto PipelineRunner::base_settings(const PipelineDefinition &pipeline) const
    -> RunSettings {
  RunSettings settings;
  settings.dag_hash = pipeline.dag_hash;
  settings.enable_parallel = config_.run.enable_parallel;
  settings.executor_type = config_.run.executor;
  settings.docker_image = config_.run.docker_image;
  settings.working_dir = config_.run.working_dir.empty()
                             ? std::filesystem::current_path()
                             : std::filesystem::path(config_.run.working_dir);
  settings.compute_data_folder = config_.catalog.compute_data_folder;
  settings.environment = environment_;
  return settings;
}

auto PipelineRunner::execute(const PipelineDefinition &pipeline,
                             RunSettings settings) -> Result<RunLog> {
  Engine engine(EngineServices{.executor = executor_.get(),
                               .catalog = catalog_.get(),
                               .store = store_.get(),
                               .tracker = tracker_.get(),
                               .secrets = secrets_.get()});

  std::optional<Result<RunLog>> outcome;
  co_spawn(
      io_,
      [&]() -> task<void> {
        outcome = co_await engine.run(pipeline.graph, std::move(settings));
      },
      [](std::exception_ptr ep) {
        if (ep) {
          std::rethrow_exception(ep);
        }
      });

  try {
    io_.restart();
    io_.run();
  } catch (const std::exception &e) {
    log::error("pipeline execution raised: {}", e.what());
    diagnostic_ = e.what();
    return fail(Error::Unknown);
  }
  if (!outcome) {
    return fail(Error::Unknown);
  }
  if (!*outcome) {
    diagnostic_ = std::format("{}: {}", error_kind(outcome->error()),
                              outcome->error().message());
  }
  return std::move(*outcome);
}

auto PipelineRunner::run(const RunRequest &request) -> Result<RunLog> {
  std::vector<std::string> errors;
  auto pipeline =
      PipelineLoader::load_from_file(request.pipeline_file, &diagnostic_,
                                     &errors);
  if (!pipeline) {
    for (const auto &e : errors) {
      diagnostic_ += "\n  " + e;
    }
    return fail(pipeline.error());
  }

  auto settings = base_settings(*pipeline);
  settings.run_id =
      request.run_id.empty() ? generate_run_id().str() : request.run_id;
  settings.tag = request.tag;
  if (request.enable_parallel) {
    settings.enable_parallel = *request.enable_parallel;
  }
  if (!request.parameters_file.empty()) {
    auto params = load_parameters_file(request.parameters_file, &diagnostic_);
    if (!params) {
      return fail(params.error());
    }
    settings.parameters = std::move(*params);
  }

  if (store_->get_run_log(settings.run_id)) {
    diagnostic_ = std::format("run id {} already exists", settings.run_id);
    return fail(Error::AlreadyExists);
  }
  return execute(*pipeline, std::move(settings));
}

auto PipelineRunner::retry(const RetryRequest &request) -> Result<RunLog> {
  auto prior = store_->get_run_log(request.previous_run_id);
  if (!prior) {
    diagnostic_ =
        std::format("no run log found for run {}", request.previous_run_id);
    return fail(prior.error());
  }

  std::vector<std::string> errors;
  auto pipeline =
      PipelineLoader::load_from_file(request.pipeline_file, &diagnostic_,
                                     &errors);
  if (!pipeline) {
    for (const auto &e : errors) {
      diagnostic_ += "\n  " + e;
    }
    return fail(pipeline.error());
  }

  if (prior->dag_hash != pipeline->dag_hash) {
    if (!request.force) {
      diagnostic_ = std::format(
          "pipeline definition changed since run {} (hash {} != {}); use "
          "--force to re-run anyway",
          prior->run_id, prior->dag_hash, pipeline->dag_hash);
      return fail(Error::DagHashMismatch);
    }
    log::warn("re-running {} against a changed pipeline definition",
              prior->run_id);
  }

  auto plan = plan_rerun(*pipeline->graph, *prior);
  if (!plan) {
    diagnostic_ = std::format(
        "run {} does not match the supplied pipeline: {}", prior->run_id,
        plan.error().message());
    return fail(plan.error());
  }

  auto settings = base_settings(*pipeline);
  settings.run_id =
      request.run_id.empty() ? generate_run_id().str() : request.run_id;
  if (settings.run_id == prior->run_id) {
    diagnostic_ = "a re-run needs a new run id";
    return fail(Error::AlreadyExists);
  }
  settings.tag = prior->tag;
  settings.parameters = prior->parameters;
  if (!request.parameters_file.empty()) {
    auto params = load_parameters_file(request.parameters_file, &diagnostic_);
    if (!params) {
      return fail(params.error());
    }
    for (auto &[name, value] : *params) {
      settings.parameters.insert_or_assign(name, std::move(value));
    }
  }

  if (auto r = catalog_->sync_between_runs(prior->run_id, settings.run_id);
      !r) {
    diagnostic_ = std::format("cannot sync catalog of run {}: {}",
                              prior->run_id, r.error().message());
    return fail(r.error());
  }

  settings.prior = &*prior;
  settings.plan = &*plan;
  return execute(*pipeline, std::move(settings));
}

auto PipelineRunner::load_run_log(std::string_view run_id) -> Result<RunLog> {
  auto run_log = store_->get_run_log(run_id);
  if (!run_log) {
    diagnostic_ = std::format("no run log found for run {}", run_id);
  }
  return run_log;
}

} // namespace pipeforge
