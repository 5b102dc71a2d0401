#include "pipeforge/executor/executor.hpp"
#include "pipeforge/executor/executor_utils.hpp"
#include "pipeforge/executor/process_runner.hpp"
#include "pipeforge/util/log.hpp"

#include <boost/asio/post.hpp>

namespace pipeforge {

// Runs a task command through `/bin/sh -c` on the host.
class ShellExecutor final : public IExecutor {
public:
  explicit ShellExecutor(boost::asio::any_io_executor ex)
      : executor_(std::move(ex)) {}

  ShellExecutor(ShellExecutor &&) noexcept = delete;
  ShellExecutor &operator=(ShellExecutor &&) = delete;
  ShellExecutor(const ShellExecutor &) = delete;
  ShellExecutor &operator=(const ShellExecutor &) = delete;

  auto start(ExecutorRequest req, ExecutionSink sink) -> Result<void> override {
    auto *shell = std::get_if<ShellExecutorConfig>(&req.config);
    if (!shell) {
      return fail(Error::InvalidArgument);
    }
    for (const auto &[key, value] : shell->env) {
      if (!is_valid_env_key(key)) {
        log::error("invalid environment variable key: {}", key);
        return fail(Error::InvalidArgument);
      }
    }

    log::info("shell start: instance_id={} timeout={}s cmd='{}'",
              req.instance_id, shell->execution_timeout.count(),
              cmd_preview(shell->command));

    ProcessSpec spec{.program = "/bin/sh",
                     .args = {"-c", std::move(shell->command)},
                     .working_dir = std::move(shell->working_dir),
                     .env = std::move(shell->env),
                     .timeout = shell->execution_timeout};
    co_spawn(executor_,
             run_process(executor_, std::move(spec), req.instance_id,
                         std::move(sink), registry_),
             detached);
    return ok();
  }

  auto cancel(const InstanceId &instance_id) -> void override {
    boost::asio::post(executor_, [this, instance_id] {
      if (registry_.kill(instance_id)) {
        log::info("cancelled process for instance {}", instance_id);
      }
    });
  }

private:
  boost::asio::any_io_executor executor_;
  ProcessRegistry registry_;
};

auto create_shell_executor(boost::asio::any_io_executor ex)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<ShellExecutor>(std::move(ex));
}

} // namespace pipeforge
