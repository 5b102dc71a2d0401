#pragma once

#include "pipeforge/executor/executor.hpp"
#include "pipeforge/secrets/secrets.hpp"
#include "pipeforge/tracking/tracker.hpp"
#include "pipeforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace pipeforge {

struct RunConfig {
  ExecutorType executor{ExecutorType::Local};
  bool enable_parallel{true};
  std::string docker_image;
  // Empty means the current directory.
  std::string working_dir;

  auto operator==(const RunConfig &) const -> bool = default;
};

enum class RunLogStoreType : std::uint8_t { Buffered, FileSystem };
BOOST_DESCRIBE_ENUM(RunLogStoreType, Buffered, FileSystem)
PIPEFORGE_DEFINE_ENUM_SERDE(RunLogStoreType, RunLogStoreType::FileSystem)

struct RunLogStoreConfig {
  RunLogStoreType type{RunLogStoreType::FileSystem};
  std::string location{".run_log_store"};

  auto operator==(const RunLogStoreConfig &) const -> bool = default;
};

struct CatalogConfig {
  std::string location{".catalog"};
  std::string compute_data_folder{"data"};

  auto operator==(const CatalogConfig &) const -> bool = default;
};

struct SecretsConfig {
  SecretsType type{SecretsType::Env};
  // Dotenv file for SecretsType::Dotenv.
  std::string location{".env"};

  auto operator==(const SecretsConfig &) const -> bool = default;
};

struct TrackerConfig {
  TrackerType type{TrackerType::None};

  auto operator==(const TrackerConfig &) const -> bool = default;
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LoggingConfig &) const -> bool = default;
};

struct SystemConfig {
  RunConfig run;
  RunLogStoreConfig run_log_store;
  CatalogConfig catalog;
  SecretsConfig secrets;
  TrackerConfig tracker;
  LoggingConfig logging;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace pipeforge
