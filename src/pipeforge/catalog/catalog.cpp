#include "pipeforge/catalog/catalog.hpp"

#include "pipeforge/util/log.hpp"

#include <glaze/json.hpp>

#include <fnmatch.h>

#include <fstream>
#include <iterator>
#include <map>
#include <system_error>
#include <utility>

namespace pipeforge {

namespace {

namespace fs = std::filesystem;

// Artifact name -> producing node path, kept at the top of each run folder.
inline constexpr std::string_view kIndexFile = ".catalog.json";
using ProducerIndex = std::map<std::string, std::string>;

[[nodiscard]] auto read_index(const fs::path &run_folder)
    -> Result<ProducerIndex> {
  ProducerIndex index;
  const auto file = run_folder / kIndexFile;
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    return ok(std::move(index));
  }
  const std::string text{std::istreambuf_iterator<char>(in),
                         std::istreambuf_iterator<char>()};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(index, text); ec) {
    log::error("catalog index {} is corrupt: {}", file.string(),
               glz::format_error(ec, text));
    return fail(Error::ParseError);
  }
  return ok(std::move(index));
}

[[nodiscard]] auto write_index(const fs::path &run_folder,
                               const ProducerIndex &index) -> Result<void> {
  std::string text;
  if (auto ec = glz::write<glz::opts{}>(index, text); ec) {
    return fail(Error::ParseError);
  }
  const auto file = run_folder / kIndexFile;
  auto tmp = file;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out << text;
    out.flush();
    if (!out) {
      log::error("cannot write catalog index {}", tmp.string());
      return fail(Error::FileOpenFailed);
    }
  }
  std::error_code ec;
  fs::rename(tmp, file, ec);
  if (ec) {
    log::error("cannot rename {}: {}", tmp.string(), ec.message());
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

// Producer of `name`, or of the enclosing directory that was put whole.
[[nodiscard]] auto producer_of(const ProducerIndex &index,
                               const fs::path &name) -> std::string {
  for (auto p = name; !p.empty(); p = p.parent_path()) {
    if (auto it = index.find(p.generic_string()); it != index.end()) {
      return it->second;
    }
  }
  return {};
}

[[nodiscard]] auto matches(std::string_view pattern, const fs::path &relative)
    -> bool {
  const auto rel = relative.generic_string();
  return ::fnmatch(std::string(pattern).c_str(), rel.c_str(), FNM_PATHNAME) ==
         0;
}

[[nodiscard]] auto size_of(const fs::path &path) -> std::uint64_t {
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
  }
  std::uint64_t total = 0;
  for (const auto &entry : fs::recursive_directory_iterator(path, ec)) {
    if (entry.is_regular_file(ec)) {
      const auto size = entry.file_size(ec);
      total += ec ? 0 : size;
    }
  }
  return total;
}

struct CopyOutcome {
  std::vector<fs::path> copied;
  std::error_code error;
};

// Copies every entry below `from` whose relative path matches `pattern` to
// the same relative location below `to`. A matching directory is copied as a
// whole.
[[nodiscard]] auto copy_matching(const fs::path &from, const fs::path &to,
                                 std::string_view pattern) -> CopyOutcome {
  CopyOutcome outcome;
  std::error_code ec;
  auto it = fs::recursive_directory_iterator(from, ec);
  if (ec) {
    outcome.error = ec;
    return outcome;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      outcome.error = ec;
      return outcome;
    }
    const auto relative = it->path().lexically_relative(from);
    if (relative == kIndexFile || !matches(pattern, relative)) {
      continue;
    }
    const auto target = to / relative;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      outcome.error = ec;
      return outcome;
    }
    if (it->is_directory()) {
      fs::copy(it->path(), target,
               fs::copy_options::recursive |
                   fs::copy_options::overwrite_existing,
               ec);
      it.disable_recursion_pending();
    } else {
      fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing,
                    ec);
    }
    if (ec) {
      outcome.error = ec;
      return outcome;
    }
    outcome.copied.push_back(relative);
  }
  return outcome;
}

} // namespace

FileSystemCatalog::FileSystemCatalog(std::filesystem::path location)
    : location_(std::move(location)) {}

auto FileSystemCatalog::get(std::string_view run_id, std::string_view pattern,
                            const std::filesystem::path &compute_folder,
                            std::string_view node_path)
    -> Result<std::vector<ArtifactRef>> {
  if (!fs::is_directory(compute_folder)) {
    log::error("catalog get for {}: compute folder {} does not exist",
               node_path, compute_folder.string());
    return fail(Error::NoComputeFolder);
  }
  const auto source = run_folder(run_id);
  if (!fs::is_directory(source)) {
    log::error("catalog get for {}: nothing has been put in run {} yet",
               node_path, run_id);
    return fail(Error::EmptyGet);
  }

  auto index = read_index(source);
  if (!index) {
    return fail(index.error());
  }
  auto outcome = copy_matching(source, compute_folder, pattern);
  if (outcome.error) {
    log::error("catalog get '{}' for {} failed: {}", pattern, node_path,
               outcome.error.message());
    return fail(outcome.error);
  }
  if (outcome.copied.empty()) {
    log::warn("catalog get '{}' for {} matched nothing", pattern, node_path);
  }

  std::vector<ArtifactRef> refs;
  refs.reserve(outcome.copied.size());
  for (const auto &rel : outcome.copied) {
    refs.push_back(ArtifactRef{
        .name = rel.generic_string(),
        .produced_by = producer_of(*index, rel),
        .catalog_path = (fs::path(std::string(run_id)) / rel).generic_string(),
        .compute_data_folder = compute_folder.string(),
        .size_bytes = size_of(compute_folder / rel),
        .stage = CatalogStage::Get});
  }
  log::debug("catalog get '{}' for {}: {} artifact(s)", pattern, node_path,
             refs.size());
  return ok(std::move(refs));
}

auto FileSystemCatalog::put(std::string_view run_id, std::string_view pattern,
                            const std::filesystem::path &compute_folder,
                            std::string_view node_path)
    -> Result<std::vector<ArtifactRef>> {
  if (!fs::is_directory(compute_folder)) {
    log::error("catalog put for {}: compute folder {} does not exist",
               node_path, compute_folder.string());
    return fail(Error::NoComputeFolder);
  }
  const auto target = run_folder(run_id);
  std::error_code ec;
  fs::create_directories(target, ec);
  if (ec) {
    log::error("cannot create catalog folder {}: {}", target.string(),
               ec.message());
    return fail(ec);
  }

  auto index = read_index(target);
  if (!index) {
    return fail(index.error());
  }
  auto outcome = copy_matching(compute_folder, target, pattern);
  if (outcome.error) {
    log::error("catalog put '{}' for {} failed: {}", pattern, node_path,
               outcome.error.message());
    return fail(outcome.error);
  }
  if (outcome.copied.empty()) {
    log::warn("catalog put '{}' for {} matched nothing", pattern, node_path);
  } else {
    for (const auto &rel : outcome.copied) {
      index->insert_or_assign(rel.generic_string(), std::string(node_path));
    }
    if (auto r = write_index(target, *index); !r) {
      return fail(r.error());
    }
  }

  std::vector<ArtifactRef> refs;
  refs.reserve(outcome.copied.size());
  for (const auto &rel : outcome.copied) {
    refs.push_back(ArtifactRef{
        .name = rel.generic_string(),
        .produced_by = std::string(node_path),
        .catalog_path = (fs::path(std::string(run_id)) / rel).generic_string(),
        .compute_data_folder = compute_folder.string(),
        .size_bytes = size_of(target / rel),
        .stage = CatalogStage::Put});
  }
  log::debug("catalog put '{}' for {}: {} artifact(s)", pattern, node_path,
             refs.size());
  return ok(std::move(refs));
}

auto FileSystemCatalog::sync_between_runs(std::string_view previous_run_id,
                                          std::string_view run_id)
    -> Result<void> {
  const auto source = run_folder(previous_run_id);
  const auto target = run_folder(run_id);
  std::error_code ec;
  fs::create_directories(target, ec);
  if (ec) {
    return fail(ec);
  }
  if (!fs::is_directory(source)) {
    log::warn("run {} has no catalog to sync into {}", previous_run_id,
              run_id);
    return ok();
  }
  fs::copy(source, target,
           fs::copy_options::recursive | fs::copy_options::overwrite_existing,
           ec);
  if (ec) {
    log::error("catalog sync {} -> {} failed: {}", previous_run_id, run_id,
               ec.message());
    return fail(ec);
  }
  log::info("synced catalog of run {} into run {}", previous_run_id, run_id);
  return ok();
}

} // namespace pipeforge
