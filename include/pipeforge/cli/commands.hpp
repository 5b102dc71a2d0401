#pragma once

#include <optional>
#include <string>

namespace pipeforge::cli {

struct RunOptions {
  std::string config_file;
  std::string pipeline_file;
  std::string run_id;
  std::string tag;
  std::string parameters_file;
  std::optional<bool> enable_parallel;
  bool json{false};
};

struct RetryOptions {
  std::string config_file;
  std::string previous_run_id;
  std::string pipeline_file;
  std::string run_id;
  std::string parameters_file;
  bool force{false};
  bool json{false};
};

struct ValidateOptions {
  std::string pipeline_file;
  bool json{false};
};

struct InspectOptions {
  std::string config_file;
  std::string run_id;
  bool json{false};
};

[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;
[[nodiscard]] auto cmd_retry(const RetryOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_inspect(const InspectOptions &opts) -> int;

} // namespace pipeforge::cli
