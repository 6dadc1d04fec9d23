#include "ciflow/executor/executor.hpp"
#include "ciflow/util/log.hpp"

#include <format>

namespace ciflow {

namespace {

// Dry run: every unit succeeds without running anything.
class NoopExecutor : public IJobExecutor {
public:
  auto start(ExecutionRequest request, ExecutionSink sink) -> void override {
    std::size_t steps = request.job ? request.job->definition.steps.size() : 0;
    log::debug("{}: dry run of {} step(s)", request.instance_id, steps);
    sink(ExecutorResult{.exit_code = 0,
                        .output = std::format("dry run: {} step(s)\n", steps)});
  }

  auto cancel(const RunId&, const InstanceId&) -> void override {
  }
};

}  // namespace

auto create_noop_executor() -> std::unique_ptr<IJobExecutor> {
  return std::make_unique<NoopExecutor>();
}

auto create_executor(ExecutorType type, EventLoop& loop, std::string shell)
    -> std::unique_ptr<IJobExecutor> {
  switch (type) {
    case ExecutorType::Noop:
      return create_noop_executor();
    case ExecutorType::Shell:
      break;
  }
  return create_shell_executor(loop, std::move(shell));
}

}  // namespace ciflow
