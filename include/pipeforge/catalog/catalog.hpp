#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/run_log/run_log.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge {

// Artifact store shared by every node of a run. Artifacts live under the run
// id so that concurrent runs never see each other's data.
class ICatalog {
public:
  virtual ~ICatalog() = default;

  // Copies artifacts of `run_id` matching `pattern` into `compute_folder`.
  // The returned refs name the node that put each artifact.
  // NoComputeFolder if `compute_folder` is missing, EmptyGet if nothing was
  // ever put for the run.
  [[nodiscard]] virtual auto get(std::string_view run_id,
                                 std::string_view pattern,
                                 const std::filesystem::path &compute_folder,
                                 std::string_view node_path)
      -> Result<std::vector<ArtifactRef>> = 0;

  // Copies files of `compute_folder` matching `pattern` into the catalog of
  // `run_id`, tagged with the producing node path.
  [[nodiscard]] virtual auto put(std::string_view run_id,
                                 std::string_view pattern,
                                 const std::filesystem::path &compute_folder,
                                 std::string_view node_path)
      -> Result<std::vector<ArtifactRef>> = 0;

  // Makes every artifact of `previous_run_id` visible to `run_id`.
  virtual auto sync_between_runs(std::string_view previous_run_id,
                                 std::string_view run_id) -> Result<void> = 0;
};

// Artifacts are plain files under `<location>/<run_id>/`; producers are
// recorded in `<location>/<run_id>/.catalog.json`.
class FileSystemCatalog final : public ICatalog {
public:
  explicit FileSystemCatalog(std::filesystem::path location);

  [[nodiscard]] auto get(std::string_view run_id, std::string_view pattern,
                         const std::filesystem::path &compute_folder,
                         std::string_view node_path)
      -> Result<std::vector<ArtifactRef>> override;

  [[nodiscard]] auto put(std::string_view run_id, std::string_view pattern,
                         const std::filesystem::path &compute_folder,
                         std::string_view node_path)
      -> Result<std::vector<ArtifactRef>> override;

  auto sync_between_runs(std::string_view previous_run_id,
                         std::string_view run_id) -> Result<void> override;

  [[nodiscard]] auto run_folder(std::string_view run_id) const
      -> std::filesystem::path {
    return location_ / std::string(run_id);
  }

  [[nodiscard]] auto location() const noexcept
      -> const std::filesystem::path & {
    return location_;
  }

private:
  std::filesystem::path location_;
};

} // namespace pipeforge
