#pragma once

#include "pipeforge/core/coroutine.hpp"
#include "pipeforge/executor/executor.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <sys/types.h>

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace pipeforge {

// Pids of the processes a backend has running, keyed by instance. Touched
// only from the backend's executor.
class ProcessRegistry {
public:
  auto add(const InstanceId &id, pid_t pid) -> void { active_[id] = pid; }
  auto remove(const InstanceId &id) -> void { active_.erase(id); }
  // Sends SIGKILL to the process of `id`; false when it is not running.
  auto kill(const InstanceId &id) -> bool;

private:
  std::unordered_map<InstanceId, pid_t> active_;
};

struct ProcessSpec {
  std::string program;
  std::vector<std::string> args;
  std::string working_dir;
  // Added to (and overriding) the current process environment.
  EnvMap env;
  std::chrono::seconds timeout{std::chrono::seconds(3600)};
};

// Runs `spec` to completion, capturing stdout/stderr, and reports through
// sink.on_complete. Timeouts kill the process and report kExitCodeTimeout.
auto run_process(boost::asio::any_io_executor ex, ProcessSpec spec,
                 InstanceId instance_id, ExecutionSink sink,
                 ProcessRegistry &registry) -> spawn_task;

} // namespace pipeforge
