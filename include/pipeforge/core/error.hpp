#pragma once

#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace pipeforge {

enum class Error : std::uint8_t {
  Success,
  // General
  FileNotFound,
  FileOpenFailed,
  ParseError,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  ProcessForkFailed,
  // Compile
  InvalidNodeName,
  DuplicateNode,
  UnknownNodeKind,
  MissingTerminal,
  MissingStartNode,
  UnknownNeighbour,
  CycleDetected,
  InvalidBranch,
  MissingCommand,
  // Catalog
  NoComputeFolder,
  EmptyGet,
  // Engine invariants
  InvariantViolation,
  DagHashMismatch,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 23> messages = {
      "success",
      "file not found",
      "failed to open file",
      "parse error",
      "invalid argument",
      "not found",
      "already exists",
      "timeout",
      "failed to fork process",
      "invalid node name",
      "duplicate node name",
      "unknown node type",
      "graph must have exactly one success and one fail node",
      "start_at does not name a node of the graph",
      "edge points to a node that does not exist",
      "cycle detected in DAG",
      "malformed composite branch",
      "task node has no command",
      "compute data folder does not exist",
      "catalog get before anything was put in this run",
      "run log does not match the DAG",
      "DAG changed since the previous run",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "pipeforge";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Taxonomy label shown to users for fatal errors.
[[nodiscard]] inline auto error_kind(std::error_code ec) -> std::string_view {
  if (ec.category() != error_category()) {
    return "error";
  }
  const auto e = static_cast<Error>(ec.value());
  if (e >= Error::InvalidNodeName && e <= Error::MissingCommand) {
    return "compile error";
  }
  if (e == Error::NoComputeFolder || e == Error::EmptyGet) {
    return "catalog error";
  }
  if (e == Error::InvariantViolation || e == Error::DagHashMismatch) {
    return "engine invariant error";
  }
  return "error";
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace pipeforge

template <> struct std::is_error_code_enum<pipeforge::Error> : std::true_type {};
