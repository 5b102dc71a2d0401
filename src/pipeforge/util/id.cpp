#include "pipeforge/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <random>

namespace pipeforge {

auto generate_run_id() -> RunId {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<std::uint32_t> suffix;
  // The suffix separates runs started within the same second.
  const auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  return RunId{std::format("{:%Y%m%d-%H%M%S}-{:08x}", now, suffix(gen))};
}

} // namespace pipeforge
