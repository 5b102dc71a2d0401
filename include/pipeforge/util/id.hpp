#pragma once

#include <algorithm>
#include <cctype>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace pipeforge {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

struct RunTag {};
struct InstanceTag {};

// Phantom-typed string id; a RunId cannot be passed where an InstanceId is
// expected.
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using RunId = TypedId<RunTag>;
using InstanceId = TypedId<InstanceTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace pipeforge

template <typename Tag> struct std::hash<pipeforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const pipeforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<pipeforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const pipeforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace pipeforge {

// Fresh run id of the form `YYYYMMDD-HHMMSS-<8 hex>` (UTC).
[[nodiscard]] auto generate_run_id() -> RunId;

// One compute dispatch of a node path; attempts of the same path differ.
inline auto make_instance_id(const RunId &run_id, std::string_view node_path,
                             int attempt) -> InstanceId {
  return InstanceId{std::format("{}:{}#{}", run_id, node_path, attempt)};
}

} // namespace pipeforge
