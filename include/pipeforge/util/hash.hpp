#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace pipeforge::util {

// FNV-1a 64-bit; stable across processes, used for persisted fingerprints.
[[nodiscard]] inline constexpr auto fnv1a64(std::string_view data) noexcept
    -> std::uint64_t {
  std::uint64_t h = 0xcbf29ce484222325ULL;
  for (const char c : data) {
    h ^= static_cast<unsigned char>(c);
    h *= 0x100000001b3ULL;
  }
  return h;
}

[[nodiscard]] inline auto fingerprint(std::string_view data) -> std::string {
  return std::format("{:016x}", fnv1a64(data));
}

} // namespace pipeforge::util
