#pragma once

#include "pipeforge/core/coroutine.hpp"
#include "pipeforge/core/error.hpp"
#include "pipeforge/util/enum.hpp"
#include "pipeforge/util/id.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pipeforge {

enum class ExecutorType : std::uint8_t {
  Local,
  LocalContainer,
};
BOOST_DESCRIBE_ENUM(ExecutorType, Local, LocalContainer)
PIPEFORGE_DEFINE_ENUM_SERDE(ExecutorType, ExecutorType::Local)

using EnvMap = std::map<std::string, std::string>;

struct ShellExecutorConfig {
  std::string command;
  std::string working_dir;
  std::chrono::seconds execution_timeout{std::chrono::seconds(3600)};
  EnvMap env;
};

struct DockerExecutorConfig {
  std::string image;
  std::string command;
  // Working directory inside the container; also mounted from the host.
  std::string working_dir;
  std::chrono::seconds execution_timeout{std::chrono::seconds(3600)};
  EnvMap env;
  // "host_path:container_path" bind mounts.
  std::vector<std::string> mounts;
  std::string docker_binary{"docker"};
};

using ExecutorConfig = std::variant<ShellExecutorConfig, DockerExecutorConfig>;

inline constexpr int kExitCodeTimeout = 124;

struct ExecutorResult {
  int exit_code{0};
  std::string stdout_output;
  std::string stderr_output;
  std::string error;
  bool timed_out{false};
};

struct ExecutorRequest {
  InstanceId instance_id;
  ExecutorConfig config;
};

struct ExecutionSink {
  std::move_only_function<void(const InstanceId &instance_id,
                               ExecutorResult result)>
      on_complete;
};

class IExecutor {
public:
  virtual ~IExecutor() = default;

  virtual auto start(ExecutorRequest req, ExecutionSink sink)
      -> Result<void> = 0;

  virtual auto cancel(const InstanceId &instance_id) -> void = 0;
};

[[nodiscard]] auto create_shell_executor(boost::asio::any_io_executor ex)
    -> std::unique_ptr<IExecutor>;

[[nodiscard]] auto create_container_executor(boost::asio::any_io_executor ex)
    -> std::unique_ptr<IExecutor>;

// Argument vector passed to the docker client for a container task.
[[nodiscard]] auto docker_run_args(const DockerExecutorConfig &config,
                                   const InstanceId &instance_id)
    -> std::vector<std::string>;

// Starts the request and suspends until on_complete fires. A start() failure
// is reported as a failed result, never as an exception.
inline auto execute_async(IExecutor &executor, InstanceId instance_id,
                          ExecutorConfig config) -> task<ExecutorResult> {
  ExecutorRequest req{.instance_id = std::move(instance_id),
                      .config = std::move(config)};

  auto result =
      co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>,
                                           void(ExecutorResult)>(
          [&executor, req = std::move(req)](auto handler) mutable {
            auto shared_h =
                std::make_shared<decltype(handler)>(std::move(handler));
            ExecutionSink sink;
            sink.on_complete = [shared_h](const InstanceId &,
                                          ExecutorResult res) mutable {
              std::move (*shared_h)(std::move(res));
            };

            auto start_res = executor.start(std::move(req), std::move(sink));
            if (!start_res) {
              ExecutorResult err_result;
              err_result.exit_code = 1;
              err_result.error = start_res.error().message();
              std::move (*shared_h)(std::move(err_result));
            }
          },
          boost::asio::use_awaitable);

  co_return result;
}

} // namespace pipeforge
