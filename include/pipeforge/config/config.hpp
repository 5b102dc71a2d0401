#pragma once

#include "pipeforge/config/system_config.hpp"
#include "pipeforge/core/error.hpp"

#include <string_view>

namespace pipeforge {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
  // Defaults plus environment overrides, for runs without a config file.
  [[nodiscard]] static auto defaults() -> Result<SystemConfig>;
};

} // namespace pipeforge
