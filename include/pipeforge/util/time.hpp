#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace pipeforge::util {

[[nodiscard]] inline auto now_millis() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// Formats epoch milliseconds as local "YYYY-MM-DD HH:MM:SS", "-" when unset.
[[nodiscard]] inline auto format_local_timestamp(std::int64_t millis)
    -> std::string {
  if (millis <= 0) {
    return "-";
  }
  const std::chrono::system_clock::time_point tp{
      std::chrono::milliseconds{millis}};
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

} // namespace pipeforge::util
