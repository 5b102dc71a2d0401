#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace pipeforge {

enum class SecretsType : std::uint8_t { Env, Dotenv };
BOOST_DESCRIBE_ENUM(SecretsType, Env, Dotenv)
PIPEFORGE_DEFINE_ENUM_SERDE(SecretsType, SecretsType::Env)

class ISecretsProvider {
public:
  virtual ~ISecretsProvider() = default;

  // NotFound when the provider does not know `name`.
  [[nodiscard]] virtual auto get(std::string_view name)
      -> Result<std::string> = 0;
};

// Resolves secrets from an environment snapshot.
class EnvSecretsProvider final : public ISecretsProvider {
public:
  explicit EnvSecretsProvider(std::map<std::string, std::string> environment)
      : environment_(std::move(environment)) {}

  [[nodiscard]] auto get(std::string_view name)
      -> Result<std::string> override;

private:
  std::map<std::string, std::string> environment_;
};

// Resolves secrets from a KEY=VALUE file. Blank lines and `#` comments are
// ignored; values may be wrapped in single or double quotes.
class DotenvSecretsProvider final : public ISecretsProvider {
public:
  [[nodiscard]] static auto load(const std::filesystem::path &path)
      -> Result<std::unique_ptr<DotenvSecretsProvider>>;
  [[nodiscard]] static auto from_string(std::string_view text)
      -> std::unique_ptr<DotenvSecretsProvider>;

  [[nodiscard]] auto get(std::string_view name)
      -> Result<std::string> override;

private:
  explicit DotenvSecretsProvider(std::map<std::string, std::string> values)
      : values_(std::move(values)) {}

  std::map<std::string, std::string> values_;
};

} // namespace pipeforge
