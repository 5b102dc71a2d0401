#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/run_log/run_log.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pipeforge {

class IRunLogStore {
public:
  virtual ~IRunLogStore() = default;

  virtual auto put_run_log(const RunLog &run_log) -> Result<void> = 0;

  [[nodiscard]] virtual auto get_run_log(std::string_view run_id)
      -> Result<RunLog> = 0;
};

// Keeps run logs in memory for the lifetime of the process.
class BufferedRunLogStore final : public IRunLogStore {
public:
  auto put_run_log(const RunLog &run_log) -> Result<void> override;
  [[nodiscard]] auto get_run_log(std::string_view run_id)
      -> Result<RunLog> override;

private:
  std::mutex mu_;
  std::unordered_map<std::string, RunLog> logs_;
};

// One `<run_id>.json` file per run under a directory.
class FileSystemRunLogStore final : public IRunLogStore {
public:
  explicit FileSystemRunLogStore(std::filesystem::path directory);

  auto put_run_log(const RunLog &run_log) -> Result<void> override;
  [[nodiscard]] auto get_run_log(std::string_view run_id)
      -> Result<RunLog> override;

  [[nodiscard]] auto path_for(std::string_view run_id) const
      -> std::filesystem::path;

private:
  std::filesystem::path directory_;
  std::mutex mu_;
};

} // namespace pipeforge
