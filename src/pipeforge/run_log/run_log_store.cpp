#include "pipeforge/run_log/run_log_store.hpp"

#include "pipeforge/util/log.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace pipeforge {

namespace {

// Run ids become file names; anything that could leave the directory is
// rejected.
[[nodiscard]] auto is_storable_run_id(std::string_view run_id) -> bool {
  return !run_id.empty() && run_id.find('/') == std::string_view::npos &&
         run_id.find('\\') == std::string_view::npos && run_id != "." &&
         run_id != "..";
}

} // namespace

auto BufferedRunLogStore::put_run_log(const RunLog &run_log) -> Result<void> {
  std::scoped_lock lock(mu_);
  logs_.insert_or_assign(run_log.run_id, run_log);
  return ok();
}

auto BufferedRunLogStore::get_run_log(std::string_view run_id)
    -> Result<RunLog> {
  std::scoped_lock lock(mu_);
  auto it = logs_.find(std::string(run_id));
  if (it == logs_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

FileSystemRunLogStore::FileSystemRunLogStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

auto FileSystemRunLogStore::path_for(std::string_view run_id) const
    -> std::filesystem::path {
  return directory_ / (std::string(run_id) + ".json");
}

auto FileSystemRunLogStore::put_run_log(const RunLog &run_log)
    -> Result<void> {
  if (!is_storable_run_id(run_log.run_id)) {
    return fail(Error::InvalidArgument);
  }
  auto text = to_json(run_log);
  if (!text) {
    return fail(text.error());
  }

  std::scoped_lock lock(mu_);
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    log::error("cannot create run log directory {}: {}", directory_.string(),
               ec.message());
    return fail(ec);
  }

  const auto target = path_for(run_log.run_id);
  auto tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      log::error("cannot open {} for writing", tmp.string());
      return fail(Error::FileOpenFailed);
    }
    out << *text;
    out.flush();
    if (!out) {
      return fail(Error::FileOpenFailed);
    }
  }
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    log::error("cannot rename {} to {}: {}", tmp.string(), target.string(),
               ec.message());
    std::filesystem::remove(tmp, ec);
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

auto FileSystemRunLogStore::get_run_log(std::string_view run_id)
    -> Result<RunLog> {
  if (!is_storable_run_id(run_id)) {
    log::error("invalid run id '{}'", run_id);
    return fail(Error::InvalidArgument);
  }
  std::string text;
  {
    std::scoped_lock lock(mu_);
    std::ifstream in(path_for(run_id), std::ios::binary);
    if (!in) {
      return fail(Error::NotFound);
    }
    text.assign(std::istreambuf_iterator<char>(in),
                std::istreambuf_iterator<char>());
  }
  return run_log_from_json(text);
}

} // namespace pipeforge
