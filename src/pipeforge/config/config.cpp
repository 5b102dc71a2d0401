#include "pipeforge/config/config.hpp"
#include "pipeforge/config/toml_util.hpp"

#include "pipeforge/core/error.hpp"
#include "pipeforge/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <string>
#include <string_view>

namespace pipeforge {
namespace detail {

struct RunToml {
  std::string executor{"local"};
  bool enable_parallel{true};
  std::string docker_image;
  std::string working_dir;
};

struct RunLogStoreToml {
  std::string type{"file_system"};
  std::string location{".run_log_store"};
};

struct CatalogToml {
  std::string location{".catalog"};
  std::string compute_data_folder{"data"};
};

struct SecretsToml {
  std::string type{"env"};
  std::string location{".env"};
};

struct TrackerToml {
  std::string type{"none"};
};

struct LoggingToml {
  std::string level{"info"};
  std::string file;
};

struct SystemToml {
  RunToml run{};
  RunLogStoreToml run_log_store{};
  CatalogToml catalog{};
  SecretsToml secrets{};
  TrackerToml tracker{};
  LoggingToml logging{};
};

} // namespace detail
} // namespace pipeforge

namespace glz {
template <> struct meta<pipeforge::detail::RunToml> {
  using T = pipeforge::detail::RunToml;
  static constexpr auto value =
      object("executor", &T::executor, "enable_parallel", &T::enable_parallel,
             "docker_image", &T::docker_image, "working_dir", &T::working_dir);
};

template <> struct meta<pipeforge::detail::RunLogStoreToml> {
  using T = pipeforge::detail::RunLogStoreToml;
  static constexpr auto value =
      object("type", &T::type, "location", &T::location);
};

template <> struct meta<pipeforge::detail::CatalogToml> {
  using T = pipeforge::detail::CatalogToml;
  static constexpr auto value =
      object("location", &T::location, "compute_data_folder",
             &T::compute_data_folder);
};

template <> struct meta<pipeforge::detail::SecretsToml> {
  using T = pipeforge::detail::SecretsToml;
  static constexpr auto value =
      object("type", &T::type, "location", &T::location);
};

template <> struct meta<pipeforge::detail::TrackerToml> {
  using T = pipeforge::detail::TrackerToml;
  static constexpr auto value = object("type", &T::type);
};

template <> struct meta<pipeforge::detail::LoggingToml> {
  using T = pipeforge::detail::LoggingToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<pipeforge::detail::SystemToml> {
  using T = pipeforge::detail::SystemToml;
  static constexpr auto value =
      object("run", &T::run, "run_log_store", &T::run_log_store, "catalog",
             &T::catalog, "secrets", &T::secrets, "tracker", &T::tracker,
             "logging", &T::logging);
};
} // namespace glz

namespace pipeforge {
namespace {

// true/yes/false/no, otherwise an integer; throws bad_lexical_cast on
// anything else.
[[nodiscard]] auto parse_flag(std::string_view v) -> bool {
  if (v == "true" || v == "yes") {
    return true;
  }
  if (v == "false" || v == "no") {
    return false;
  }
  return boost::lexical_cast<int>(v) != 0;
}

// Unknown enum spellings are configuration errors rather than silent
// defaults.
template <typename E>
[[nodiscard]] auto parse_setting(std::string_view section,
                                 std::string_view value) -> Result<E> {
  if (auto parsed = util::try_parse_enum<E>(value)) {
    return ok(*parsed);
  }
  log::error("[{}] unknown value '{}'", section, value);
  return fail(Error::ParseError);
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("PIPEFORGE_LOG_LEVEL"); v != nullptr) {
    cfg.logging.level = v;
  }
  if (const char *v = std::getenv("PIPEFORGE_ENABLE_PARALLEL"); v != nullptr) {
    cfg.run.enable_parallel = parse_flag(v);
  }
  if (const char *v = std::getenv("PIPEFORGE_CATALOG_LOCATION");
      v != nullptr) {
    cfg.catalog.location = v;
  }
  if (const char *v = std::getenv("PIPEFORGE_RUN_LOG_LOCATION");
      v != nullptr) {
    cfg.run_log_store.location = v;
  }
  if (const char *v = std::getenv("PIPEFORGE_DOCKER_IMAGE"); v != nullptr) {
    cfg.run.docker_image = v;
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  SystemConfig cfg{};
  auto executor = parse_setting<ExecutorType>("run", raw.run.executor);
  auto store = parse_setting<RunLogStoreType>("run_log_store",
                                              raw.run_log_store.type);
  auto secrets = parse_setting<SecretsType>("secrets", raw.secrets.type);
  auto tracker = parse_setting<TrackerType>("tracker", raw.tracker.type);
  if (!executor || !store || !secrets || !tracker) {
    return fail(Error::ParseError);
  }

  cfg.run.executor = *executor;
  cfg.run.enable_parallel = raw.run.enable_parallel;
  cfg.run.docker_image = std::move(raw.run.docker_image);
  cfg.run.working_dir = std::move(raw.run.working_dir);

  cfg.run_log_store.type = *store;
  cfg.run_log_store.location = std::move(raw.run_log_store.location);

  cfg.catalog.location = std::move(raw.catalog.location);
  cfg.catalog.compute_data_folder = std::move(raw.catalog.compute_data_folder);

  cfg.secrets.type = *secrets;
  cfg.secrets.location = std::move(raw.secrets.location);

  cfg.tracker.type = *tracker;

  cfg.logging.level = std::move(raw.logging.level);
  cfg.logging.file = std::move(raw.logging.file);

  apply_env_overrides(cfg);

  if (cfg.catalog.location.empty() || cfg.run_log_store.location.empty() ||
      cfg.catalog.compute_data_folder.empty()) {
    return fail(Error::ParseError);
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::defaults() -> Result<SystemConfig> {
  return load_from_string("");
}

} // namespace pipeforge
