#pragma once

#include "ciflow/condition/evaluator.hpp"
#include "ciflow/executor/cancellation.hpp"
#include "ciflow/graph/job_graph.hpp"
#include "ciflow/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace ciflow {

enum class ExecutorType : std::uint8_t {
  Shell,
  Noop,
};

[[nodiscard]] constexpr auto executor_type_name(ExecutorType type) noexcept
    -> std::string_view {
  return type == ExecutorType::Noop ? "noop" : "shell";
}

[[nodiscard]] constexpr auto parse_executor_type(std::string_view name) noexcept
    -> std::optional<ExecutorType> {
  if (name == "shell") {
    return ExecutorType::Shell;
  }
  if (name == "noop") {
    return ExecutorType::Noop;
  }
  return std::nullopt;
}

// Everything a job unit needs to run one instance. `job` aliases the run's
// JobGraph, so it stays valid even if the completion arrives after the run
// was force-cancelled.
struct ExecutionRequest {
  RunId run_id;
  InstanceId instance_id;
  std::shared_ptr<const JobEntry> job;
  EvalContext context;  // frozen at launch
  std::chrono::seconds timeout{kDefaultJobTimeout};
  std::string working_dir;
  CancellationToken cancel;
};

struct ExecutorResult {
  int exit_code{0};
  std::string output;
  // Set when the unit could not be run as asked (fork failure, bad step
  // condition). `error_code` narrows it down, and is Error::Cancelled when
  // the unit stopped because its run was cancelled.
  std::string error;
  std::error_code error_code;
  bool timed_out{false};
  bool cancelled{false};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0 && error.empty() && !timed_out && !cancelled;
  }
};

// Invoked exactly once per start(), from any thread.
using ExecutionSink = std::move_only_function<void(ExecutorResult result)>;

class IJobExecutor {
public:
  virtual ~IJobExecutor() = default;

  // May throw; the scheduler reports that as an executor error.
  virtual auto start(ExecutionRequest request, ExecutionSink sink) -> void = 0;

  // Best effort. The unit still reports through its sink. Instance ids repeat
  // across runs of one workflow, so the run id is part of the key.
  virtual auto cancel(const RunId& run_id, const InstanceId& instance_id)
      -> void = 0;
};

class EventLoop;

[[nodiscard]] auto create_shell_executor(EventLoop& loop,
                                         std::string shell = "/bin/sh")
    -> std::unique_ptr<IJobExecutor>;

[[nodiscard]] auto create_noop_executor() -> std::unique_ptr<IJobExecutor>;

[[nodiscard]] auto create_executor(ExecutorType type, EventLoop& loop,
                                   std::string shell = "/bin/sh")
    -> std::unique_ptr<IJobExecutor>;

// MATRIX_<AXIS> with the axis upper-cased and every other character
// mapped to '_'.
[[nodiscard]] auto matrix_env_name(std::string_view axis) -> std::string;

}  // namespace ciflow
