#pragma once

#include "pipeforge/config/config.hpp"
#include "pipeforge/config/pipeline_definition.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/engine/engine.hpp"
#include "pipeforge/run_log/run_log.hpp"

#include <boost/asio/io_context.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pipeforge {

class ICatalog;
class IExecutor;
class IRunLogStore;
class ISecretsProvider;
class ITracker;

struct RunRequest {
  std::string pipeline_file;
  std::string run_id;
  std::string tag;
  std::string parameters_file;
  // Overrides [run] enable_parallel when set.
  std::optional<bool> enable_parallel;
};

struct RetryRequest {
  std::string previous_run_id;
  std::string pipeline_file;
  std::string run_id;
  std::string parameters_file;
  // Proceed even when the pipeline definition changed since the prior run.
  bool force{false};
};

// Builds the configured services and drives single pipeline runs on a private
// io_context.
class PipelineRunner {
public:
  explicit PipelineRunner(SystemConfig config);
  ~PipelineRunner();

  PipelineRunner(const PipelineRunner &) = delete;
  auto operator=(const PipelineRunner &) -> PipelineRunner & = delete;

  [[nodiscard]] auto init() -> Result<void>;

  [[nodiscard]] auto run(const RunRequest &request) -> Result<RunLog>;
  [[nodiscard]] auto retry(const RetryRequest &request) -> Result<RunLog>;

  [[nodiscard]] auto load_run_log(std::string_view run_id) -> Result<RunLog>;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }
  // Human-readable explanation of the last failure, if any.
  [[nodiscard]] auto diagnostic() const noexcept -> const std::string & {
    return diagnostic_;
  }

  // Replaces the environment snapshot handed to tasks (defaults to the
  // process environment). Call before init().
  auto set_environment(std::map<std::string, std::string> environment)
      -> void {
    environment_ = std::move(environment);
  }

private:
  [[nodiscard]] auto execute(const PipelineDefinition &pipeline,
                             RunSettings settings) -> Result<RunLog>;
  [[nodiscard]] auto base_settings(const PipelineDefinition &pipeline) const
      -> RunSettings;

  SystemConfig config_;
  boost::asio::io_context io_;
  std::unique_ptr<IRunLogStore> store_;
  std::unique_ptr<ICatalog> catalog_;
  std::unique_ptr<ISecretsProvider> secrets_;
  std::unique_ptr<ITracker> tracker_;
  std::unique_ptr<IExecutor> executor_;
  std::map<std::string, std::string> environment_;
  std::string diagnostic_;
};

// Current process environment as a key/value snapshot.
[[nodiscard]] auto current_environment() -> std::map<std::string, std::string>;

} // namespace pipeforge
