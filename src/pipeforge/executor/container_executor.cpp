#include "pipeforge/executor/executor.hpp"
#include "pipeforge/executor/executor_utils.hpp"
#include "pipeforge/executor/process_runner.hpp"
#include "pipeforge/util/log.hpp"

#include <boost/asio/post.hpp>
#include <boost/process/v2/environment.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace pipeforge {

namespace {

auto container_name(const InstanceId &id) -> std::string {
  std::string name = "pipeforge_" + id.str();
  std::ranges::replace_if(
      name,
      [](char c) {
        return !(std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
                 c == '-');
      },
      '_');
  return name;
}

} // namespace

// Environment values travel through the docker client's own environment
// (`-e KEY`), so secrets never appear on the command line.
auto docker_run_args(const DockerExecutorConfig &config,
                     const InstanceId &instance_id)
    -> std::vector<std::string> {
  std::vector<std::string> args{"run", "--rm", "--name",
                                container_name(instance_id)};
  for (const auto &mount : config.mounts) {
    args.emplace_back("-v");
    args.push_back(mount);
  }
  if (!config.working_dir.empty()) {
    args.emplace_back("-w");
    args.push_back(config.working_dir);
  }
  for (const auto &[key, _] : config.env) {
    args.emplace_back("-e");
    args.push_back(key);
  }
  args.push_back(config.image);
  args.emplace_back("/bin/sh");
  args.emplace_back("-c");
  args.push_back(config.command);
  return args;
}

// Runs a task command inside a container through the local docker client.
class ContainerExecutor final : public IExecutor {
public:
  explicit ContainerExecutor(boost::asio::any_io_executor ex)
      : executor_(std::move(ex)) {}

  ContainerExecutor(const ContainerExecutor &) = delete;
  ContainerExecutor &operator=(const ContainerExecutor &) = delete;

  auto start(ExecutorRequest req, ExecutionSink sink) -> Result<void> override {
    const auto *docker = std::get_if<DockerExecutorConfig>(&req.config);
    if (!docker) {
      return fail(Error::InvalidArgument);
    }
    if (docker->image.empty()) {
      log::error("container task {} has no image", req.instance_id);
      return fail(Error::InvalidArgument);
    }
    for (const auto &[key, value] : docker->env) {
      if (!is_valid_env_key(key)) {
        log::error("invalid environment variable key: {}", key);
        return fail(Error::InvalidArgument);
      }
    }

    auto program = boost::process::v2::environment::find_executable(
        docker->docker_binary);
    if (program.empty()) {
      log::error("docker client '{}' not found on PATH",
                 docker->docker_binary);
      return fail(Error::ProcessForkFailed);
    }

    log::info("container start: instance_id={} image={} cmd='{}'",
              req.instance_id, docker->image, cmd_preview(docker->command));

    ProcessSpec spec{.program = program.string(),
                     .args = docker_run_args(*docker, req.instance_id),
                     .working_dir = {},
                     .env = docker->env,
                     .timeout = docker->execution_timeout};
    co_spawn(executor_,
             run_process(executor_, std::move(spec), req.instance_id,
                         std::move(sink), registry_),
             detached);
    return ok();
  }

  auto cancel(const InstanceId &instance_id) -> void override {
    boost::asio::post(executor_, [this, instance_id] {
      if (registry_.kill(instance_id)) {
        log::info("cancelled container client for instance {}", instance_id);
      }
    });
  }

private:
  boost::asio::any_io_executor executor_;
  ProcessRegistry registry_;
};

auto create_container_executor(boost::asio::any_io_executor ex)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<ContainerExecutor>(std::move(ex));
}

} // namespace pipeforge
