#pragma once

#include "pipeforge/core/error.hpp"
#include "pipeforge/dag/declaration.hpp"
#include "pipeforge/dag/graph.hpp"
#include "pipeforge/run_log/run_log.hpp"
#include "pipeforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge {

enum class PipelineFormat : std::uint8_t { Toml, Json };
BOOST_DESCRIBE_ENUM(PipelineFormat, Toml, Json)
PIPEFORGE_DEFINE_ENUM_SERDE(PipelineFormat, PipelineFormat::Toml)

// A pipeline file after parsing and compilation.
struct PipelineDefinition {
  GraphDeclaration declaration;
  GraphPtr graph;
  // Fingerprint of the definition text; a re-run refuses a different one.
  std::string dag_hash;
};

class PipelineLoader {
public:
  // Format follows the extension: `.json` is JSON, anything else TOML.
  // `diagnostic` receives the parse error, `errors` every compile problem.
  // `dag_definition` references are resolved against the file's directory
  // and their text is part of the fingerprint.
  [[nodiscard]] static auto
  load_from_file(std::string_view path, std::string *diagnostic = nullptr,
                 std::vector<std::string> *errors = nullptr)
      -> Result<PipelineDefinition>;

  // References are resolved against `base_dir` (the working directory when
  // empty).
  [[nodiscard]] static auto
  load_from_string(std::string_view text, PipelineFormat format,
                   std::string *diagnostic = nullptr,
                   std::vector<std::string> *errors = nullptr,
                   const std::filesystem::path &base_dir = {})
      -> Result<PipelineDefinition>;

  [[nodiscard]] static auto parse_declaration(std::string_view text,
                                              PipelineFormat format,
                                              std::string *diagnostic = nullptr)
      -> Result<GraphDeclaration>;

  [[nodiscard]] static auto format_for(std::string_view path)
      -> PipelineFormat;
};

// Reads a JSON object of initial pipeline parameters.
[[nodiscard]] auto load_parameters_file(std::string_view path,
                                        std::string *diagnostic = nullptr)
    -> Result<ParameterMap>;

} // namespace pipeforge
