#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pipeforge {

struct CatalogSettings {
  std::vector<std::string> get;
  std::vector<std::string> put;
  // Empty means the catalog's global compute data folder.
  std::string compute_data_folder;

  auto operator==(const CatalogSettings &) const -> bool = default;
};

struct StepDeclaration;

// Uncompiled form of a graph, as read from a pipeline definition file.
struct GraphDeclaration {
  std::string name;
  std::string description;
  std::string start_at;
  std::vector<StepDeclaration> steps;
};

struct StepDeclaration {
  std::string name;
  std::string type{"task"};
  std::string next;
  std::string on_failure;

  // task
  std::string command;
  std::string image;
  int timeout{0};
  std::vector<std::string> secrets;

  std::optional<CatalogSettings> catalog;

  // map
  std::string iterate_on;
  std::string iterate_as;

  // dag: file holding the embedded definition, relative to the file that
  // references it. The loader inlines it into `branches`.
  std::string dag_definition;

  // parallel: one entry per named branch; map and dag: exactly one entry
  std::vector<GraphDeclaration> branches;
};

} // namespace pipeforge
