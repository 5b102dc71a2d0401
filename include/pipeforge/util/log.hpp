#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace pipeforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

// Formatted lines are handed to a single writer thread through a bounded
// channel. Before start() (and after stop()) lines are written inline.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::mutex output_mutex_;
  FILE *output_{stdout};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  auto write_line(std::string_view line) -> void {
    std::lock_guard lock(output_mutex_);
    std::fwrite(line.data(), 1, line.size(), output_);
    std::fflush(output_);
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    for (;;) {
      bool closed = false;
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            if (ec) {
              closed = true;
              return;
            }
            write_line(line);
          });
      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (closed) {
        break;
      }
    }
    while (queue->try_receive(
        [&](const boost::system::error_code &ec, std::string line) {
          if (!ec) {
            write_line(line);
          }
        })) {
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    auto queue = std::make_shared<LogChannel>(queue_ctx_.get_executor(),
                                              kQueueCapacity);
    queue_.store(queue, std::memory_order_release);
    writer_ = std::jthread([this, queue] { writer_loop(queue); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
      queue->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::lock_guard lock(output_mutex_);
    output_ = stderr;
  }

  auto set_output_file(std::string_view path) -> bool {
    std::lock_guard lock(output_mutex_);
    if (path.empty()) {
      output_ = stdout;
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    output_ = f;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    const auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] {}\n", time,
                            level_color(level), level_name(level),
                            "\o{33}[0m",
                            std::format(fmt, std::forward<Args>(args)...));

    auto queue = queue_.load(std::memory_order_acquire);
    if (queue && queue->try_send(boost::system::error_code{}, line)) {
      return;
    }
    write_line(line);
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  const auto *it = std::ranges::find(level_names, name);
  auto level = (it != level_names.end())
                   ? static_cast<Level>(std::distance(level_names.begin(), it))
                   : Level::Info;
  logger().set_level(level);
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace pipeforge::log
