#include "pipeforge/config/pipeline_definition.hpp"
#include "pipeforge/config/toml_util.hpp"

#include "pipeforge/util/hash.hpp"
#include "pipeforge/util/log.hpp"

#include <glaze/json.hpp>
#include <glaze/toml.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <vector>

namespace glz {
template <> struct meta<pipeforge::CatalogSettings> {
  using T = pipeforge::CatalogSettings;
  static constexpr auto value = object("get", &T::get, "put", &T::put,
                                       "compute_data_folder",
                                       &T::compute_data_folder);
};

template <> struct meta<pipeforge::StepDeclaration> {
  using T = pipeforge::StepDeclaration;
  static constexpr auto value = object(
      "name", &T::name, "type", &T::type, "next", &T::next, "on_failure",
      &T::on_failure, "command", &T::command, "image", &T::image, "timeout",
      &T::timeout, "secrets", &T::secrets, "catalog", &T::catalog,
      "iterate_on", &T::iterate_on, "iterate_as", &T::iterate_as,
      "dag_definition", &T::dag_definition, "branches", &T::branches);
};

template <> struct meta<pipeforge::GraphDeclaration> {
  using T = pipeforge::GraphDeclaration;
  static constexpr auto value =
      object("name", &T::name, "description", &T::description, "start_at",
             &T::start_at, "steps", &T::steps);
};
} // namespace glz

namespace pipeforge {

namespace {

namespace fs = std::filesystem;

// Inlines every `dag_definition` reference below a declaration and collects
// the referenced text for the fingerprint.
class ReferenceResolver {
public:
  explicit ReferenceResolver(std::string *diagnostic)
      : diagnostic_(diagnostic) {}

  auto enter(const fs::path &file) -> void { stack_.push_back(key(file)); }

  auto resolve(GraphDeclaration &declaration, const fs::path &base_dir)
      -> Result<void> {
    for (auto &step : declaration.steps) {
      for (auto &branch : step.branches) {
        if (auto r = resolve(branch, base_dir); !r) {
          return r;
        }
      }
      if (step.dag_definition.empty()) {
        continue;
      }
      if (!step.branches.empty()) {
        report(std::format("dag '{}' has both dag_definition and an inline "
                           "body",
                           step.name));
        return fail(Error::InvalidBranch);
      }

      const auto file = (base_dir / step.dag_definition).lexically_normal();
      if (std::ranges::find(stack_, key(file)) != stack_.end()) {
        report(std::format("dag definition {} includes itself",
                           file.string()));
        return fail(Error::CycleDetected);
      }
      auto text = toml_util::read_file(file.string());
      if (!text) {
        report(std::format("cannot read {} referenced by dag '{}'",
                           file.string(), step.name));
        return fail(text.error());
      }
      auto body = PipelineLoader::parse_declaration(
          *text, PipelineLoader::format_for(file.string()), diagnostic_);
      if (!body) {
        return fail(body.error());
      }
      referenced_ += std::format("\n--- {}\n", step.dag_definition);
      referenced_ += *text;

      stack_.push_back(key(file));
      auto r = resolve(*body, file.parent_path());
      stack_.pop_back();
      if (!r) {
        return r;
      }
      step.branches.push_back(std::move(*body));
    }
    return ok();
  }

  [[nodiscard]] auto referenced_text() const -> const std::string & {
    return referenced_;
  }

private:
  [[nodiscard]] static auto key(const fs::path &file) -> fs::path {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(file, ec);
    return ec ? fs::absolute(file).lexically_normal() : canonical;
  }

  auto report(std::string message) -> void {
    log::error("{}", message);
    if (diagnostic_) {
      *diagnostic_ = std::move(message);
    }
  }

  std::string *diagnostic_;
  std::vector<fs::path> stack_;
  std::string referenced_;
};

auto load_definition(std::string_view text, PipelineFormat format,
                     std::string *diagnostic,
                     std::vector<std::string> *errors,
                     const fs::path &base_dir, const fs::path *origin)
    -> Result<PipelineDefinition> {
  auto declaration =
      PipelineLoader::parse_declaration(text, format, diagnostic);
  if (!declaration) {
    return fail(declaration.error());
  }
  ReferenceResolver resolver(diagnostic);
  if (origin) {
    resolver.enter(*origin);
  }
  if (auto r = resolver.resolve(*declaration, base_dir); !r) {
    return fail(r.error());
  }
  auto graph = compile(*declaration, errors);
  if (!graph) {
    if (diagnostic && diagnostic->empty()) {
      *diagnostic = std::format("pipeline '{}' is invalid: {}",
                                declaration->name, graph.error().message());
    }
    return fail(graph.error());
  }
  std::string material(text);
  material += resolver.referenced_text();
  return ok(PipelineDefinition{.declaration = std::move(*declaration),
                               .graph = std::move(*graph),
                               .dag_hash = util::fingerprint(material)});
}

} // namespace

auto PipelineLoader::format_for(std::string_view path) -> PipelineFormat {
  return std::filesystem::path(path).extension() == ".json"
             ? PipelineFormat::Json
             : PipelineFormat::Toml;
}

auto PipelineLoader::parse_declaration(std::string_view text,
                                       PipelineFormat format,
                                       std::string *diagnostic)
    -> Result<GraphDeclaration> {
  try {
    if (format == PipelineFormat::Json) {
      return toml_util::parse_json_as<GraphDeclaration>(text, diagnostic);
    }
    return toml_util::parse_toml<GraphDeclaration>(text, diagnostic);
  } catch (const std::exception &e) {
    log::error("failed to parse pipeline definition: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

auto PipelineLoader::load_from_string(std::string_view text,
                                      PipelineFormat format,
                                      std::string *diagnostic,
                                      std::vector<std::string> *errors,
                                      const std::filesystem::path &base_dir)
    -> Result<PipelineDefinition> {
  return load_definition(text, format, diagnostic, errors, base_dir, nullptr);
}

auto PipelineLoader::load_from_file(std::string_view path,
                                    std::string *diagnostic,
                                    std::vector<std::string> *errors)
    -> Result<PipelineDefinition> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("cannot read {}", path);
    }
    return fail(text.error());
  }
  const fs::path origin(path);
  return load_definition(*text, format_for(path), diagnostic, errors,
                         origin.parent_path(), &origin);
}

auto load_parameters_file(std::string_view path, std::string *diagnostic)
    -> Result<ParameterMap> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("cannot read {}", path);
    }
    return fail(text.error());
  }
  return toml_util::parse_json_as<ParameterMap>(*text, diagnostic);
}

} // namespace pipeforge
