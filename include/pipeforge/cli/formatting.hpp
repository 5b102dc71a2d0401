#pragma once

#include "pipeforge/config/config.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/run_log/run_log.hpp"
#include "pipeforge/util/time.hpp"

#include <cstdint>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace pipeforge::cli::fmt {

namespace ansi {

inline auto is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout));
  return tty;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kDim = "\033[2m";
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";
inline constexpr std::string_view kCyan = "\033[36m";

inline auto colorize(std::string_view text, std::string_view color)
    -> std::string {
  if (!is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto bold(std::string_view text) -> std::string {
  return colorize(text, kBold);
}
inline auto green(std::string_view text) -> std::string {
  return colorize(text, kGreen);
}
inline auto red(std::string_view text) -> std::string {
  return colorize(text, kRed);
}
inline auto yellow(std::string_view text) -> std::string {
  return colorize(text, kYellow);
}
inline auto cyan(std::string_view text) -> std::string {
  return colorize(text, kCyan);
}
inline auto dim(std::string_view text) -> std::string {
  return colorize(text, kDim);
}

inline auto ansi_visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  bool in_escape = false;
  for (char c : s) {
    if (in_escape) {
      if (c == 'm')
        in_escape = false;
    } else if (c == '\033') {
      in_escape = true;
    } else {
      ++width;
    }
  }
  return width;
}

} // namespace ansi

inline auto colorize_status(StepStatus status) -> std::string {
  const auto text = to_string_view(status);
  switch (status) {
  case StepStatus::Success:
    return ansi::green(text);
  case StepStatus::Failed:
    return ansi::red(text);
  case StepStatus::Running:
    return ansi::yellow(text);
  case StepStatus::Pending:
    return ansi::dim(text);
  }
  return std::string(text);
}

class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    std::vector<std::string> headers;
    std::size_t total_width = columns_.size() - 1;
    for (const auto &col : columns_) {
      headers.push_back(ansi::bold(col.header));
      total_width += col.width;
    }
    print_row(headers);
    std::println("{}", std::string(total_width, '-'));
  }

  auto print_row(const std::vector<std::string> &values) const -> void {
    for (std::size_t i = 0; i < columns_.size() && i < values.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      const auto &val = values[i];
      auto visible = ansi::ansi_visible_width(val);
      auto pad = visible < col.width ? col.width - visible : 0;
      if (col.right_align) {
        std::print("{}{}", std::string(pad, ' '), val);
      } else {
        std::print("{}{}", val, std::string(pad, ' '));
      }
    }
    std::println("");
  }

private:
  std::vector<Column> columns_;
};

inline auto format_duration(std::int64_t start_millis, std::int64_t end_millis)
    -> std::string {
  if (start_millis <= 0 || end_millis <= 0)
    return "-";
  auto ms = end_millis - start_millis;
  if (ms < 1000)
    return std::format("{}ms", ms);
  auto dur = ms / 1000;
  if (dur < 60)
    return std::format("{}s", dur);
  if (dur < 3600)
    return std::format("{}m {}s", dur / 60, dur % 60);
  return std::format("{}h {}m", dur / 3600, (dur % 3600) / 60);
}

// Prints the per-path summary of a run log.
inline auto print_run_log(const RunLog &run_log) -> void {
  std::println("{} {}", ansi::bold("Run:"), run_log.run_id);
  if (!run_log.original_run_id.empty()) {
    std::println("{} {}", ansi::bold("Re-run of:"), run_log.original_run_id);
  }
  if (!run_log.tag.empty()) {
    std::println("{} {}", ansi::bold("Tag:"), run_log.tag);
  }
  std::println("{} {}", ansi::bold("Status:"),
               colorize_status(run_log.status));
  std::println("{} {}  {} {}", ansi::bold("Started:"),
               util::format_local_timestamp(run_log.started_at_ms),
               ansi::bold("Duration:"),
               format_duration(run_log.started_at_ms, run_log.finished_at_ms));
  std::println("");

  Table table({{"PATH", 40}, {"KIND", 9}, {"STATUS", 8}, {"ATTEMPT", 7, true},
               {"DURATION", 9, true}, {"MESSAGE", 30}});
  table.print_header();
  for (const auto &record : run_log.steps) {
    if (record.attempts.empty()) {
      continue;
    }
    const auto &latest = record.attempts.back();
    auto status = colorize_status(latest.status);
    if (latest.mock) {
      status += ansi::cyan("*");
    }
    table.print_row({record.path, std::string(to_string_view(latest.kind)),
                     status, std::format("{}", latest.attempt),
                     format_duration(latest.started_at_ms,
                                     latest.finished_at_ms),
                     latest.message});
  }

  const auto failed = run_log.failed_paths();
  if (!failed.empty()) {
    std::println("\n{}", ansi::red("Failed:"));
    for (const auto &path : failed) {
      std::println("  {} (attempt {})", path, run_log.latest(path)->attempt);
    }
  }
}

inline auto print_error(std::string_view what, const std::error_code &ec,
                        std::string_view diagnostic) -> void {
  std::println(stderr, "{} {} ({}): {}", ansi::red("Error:"), what,
               error_kind(ec), diagnostic.empty() ? ec.message() : diagnostic);
}

// Loads the config file, or defaults plus environment overrides when none is
// given.
inline auto load_config(const std::string &config_file) -> Result<Config> {
  if (config_file.empty()) {
    return ConfigLoader::defaults();
  }
  return ConfigLoader::load_from_file(config_file);
}

} // namespace pipeforge::cli::fmt
