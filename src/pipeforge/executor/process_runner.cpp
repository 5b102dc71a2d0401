#include "pipeforge/executor/process_runner.hpp"

#include "pipeforge/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <csignal>
#include <format>
#include <optional>
#include <span>
#include <utility>

namespace pipeforge {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kMaxOutputSize = 10UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;

struct WaitProcessResult {
  int exit_code{-1};
  bool timed_out{false};
};

[[nodiscard]] auto build_process_env(const EnvMap &custom)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64 + custom.size());

  for (const auto &entry : bp::environment::current()) {
    auto key_sv = entry.key();
    if (custom.contains(std::string(key_sv.data(), key_sv.size()))) {
      continue;
    }
    env_vec.emplace_back(entry);
  }
  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }
  return bp::process_environment(std::move(env_vec));
}

[[nodiscard]] auto read_pipe_all(boost::asio::readable_pipe &pipe,
                                 std::string &out,
                                 boost::asio::cancellation_signal &cancel_sig)
    -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()),
        boost::asio::bind_cancellation_slot(cancel_sig.slot(), use_nothrow));
    if (ec) {
      co_return;
    }
    if (bytes > 0 && out.size() < kMaxOutputSize) {
      const auto to_append =
          std::min<std::size_t>(kMaxOutputSize - out.size(), bytes);
      out.append(buffer.data(), to_append);
    }
  }
}

[[nodiscard]] auto
wait_with_timeout(bp::process &proc, std::chrono::seconds timeout,
                  std::span<boost::asio::cancellation_signal> readers)
    -> task<WaitProcessResult> {
  auto [ec, exit_code] =
      co_await proc.async_wait(boost::asio::cancel_after(timeout, use_nothrow));
  if (!ec) {
    co_return WaitProcessResult{.exit_code = exit_code, .timed_out = false};
  }
  if (ec == boost::asio::error::operation_aborted) {
    for (auto &reader : readers) {
      reader.emit(boost::asio::cancellation_type::total);
    }
    boost::system::error_code ignored;
    proc.terminate(ignored);
    auto [wait_ec, reaped] = co_await proc.async_wait(use_nothrow);
    if (wait_ec) {
      log::debug("reaping timed out pid {}: {}", proc.id(), wait_ec.message());
    }
    co_return WaitProcessResult{.exit_code = kExitCodeTimeout,
                                .timed_out = true};
  }
  co_return WaitProcessResult{.exit_code = -1, .timed_out = false};
}

} // namespace

auto ProcessRegistry::kill(const InstanceId &id) -> bool {
  auto it = active_.find(id);
  if (it == active_.end() || it->second <= 0) {
    return false;
  }
  return ::kill(it->second, SIGKILL) == 0;
}

auto run_process(boost::asio::any_io_executor ex, ProcessSpec spec,
                 InstanceId instance_id, ExecutionSink sink,
                 ProcessRegistry &registry) -> spawn_task {
  boost::asio::readable_pipe stdout_pipe(ex);
  boost::asio::readable_pipe stderr_pipe(ex);
  ExecutorResult result;

  std::optional<bp::process> proc;
  try {
    auto stdio = bp::process_stdio{
        .in = nullptr, .out = stdout_pipe, .err = stderr_pipe};
    auto env = build_process_env(spec.env);
    if (spec.working_dir.empty()) {
      proc.emplace(ex, spec.program, spec.args, std::move(stdio),
                   std::move(env));
    } else {
      proc.emplace(ex, spec.program, spec.args, std::move(stdio),
                   bp::process_start_dir{spec.working_dir}, std::move(env));
    }
  } catch (const std::exception &e) {
    log::error("failed to start {} for {}: {}", spec.program, instance_id,
               e.what());
    result.exit_code = -1;
    result.error = e.what();
    if (sink.on_complete) {
      sink.on_complete(instance_id, std::move(result));
    }
    co_return;
  }

  const auto pid = proc->id();
  registry.add(instance_id, pid);
  log::debug("process started pid={} instance_id={}", pid, instance_id);

  // One signal per pipe reader; a slot holds a single handler.
  std::array<boost::asio::cancellation_signal, 2> readers;
  using namespace boost::asio::experimental::awaitable_operators;
  auto wait_result =
      co_await (read_pipe_all(stdout_pipe, result.stdout_output, readers[0]) &&
                read_pipe_all(stderr_pipe, result.stderr_output, readers[1]) &&
                wait_with_timeout(*proc, spec.timeout, readers));

  result.timed_out = wait_result.timed_out;
  result.exit_code = wait_result.exit_code;
  if (result.timed_out) {
    result.error =
        std::format("execution timed out after {}s", spec.timeout.count());
  }

  registry.remove(instance_id);
  log::debug("process finished instance_id={} exit_code={} timed_out={}",
             instance_id, result.exit_code, result.timed_out);
  if (sink.on_complete) {
    sink.on_complete(instance_id, std::move(result));
  }
}

} // namespace pipeforge
