#include "pipeforge/executor/composite_executor.hpp"
#include "pipeforge/util/log.hpp"
#include "pipeforge/util/util.hpp"

namespace pipeforge {

auto CompositeExecutor::register_executor(ExecutorType type,
                                          std::unique_ptr<IExecutor> executor)
    -> void {
  executors_[type] = std::move(executor);
}

auto CompositeExecutor::start(ExecutorRequest req, ExecutionSink sink)
    -> Result<void> {
  auto type = std::visit(
      overloaded{[](const ShellExecutorConfig &) { return ExecutorType::Local; },
                 [](const DockerExecutorConfig &) {
                   return ExecutorType::LocalContainer;
                 }},
      req.config);

  auto it = executors_.find(type);
  if (it == executors_.end()) {
    log::error("no compute backend registered for {}", to_string_view(type));
    return fail(Error::InvalidArgument);
  }
  return it->second->start(std::move(req), std::move(sink));
}

auto CompositeExecutor::cancel(const InstanceId &instance_id) -> void {
  // Backends ignore ids they do not own.
  for (auto &[_, exec] : executors_) {
    exec->cancel(instance_id);
  }
}

auto create_composite_executor(boost::asio::any_io_executor ex)
    -> std::unique_ptr<IExecutor> {
  auto composite = std::make_unique<CompositeExecutor>();
  composite->register_executor(ExecutorType::Local, create_shell_executor(ex));
  composite->register_executor(ExecutorType::LocalContainer,
                               create_container_executor(ex));
  return composite;
}

} // namespace pipeforge
