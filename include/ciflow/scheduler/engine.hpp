#pragma once

#include "ciflow/core/error.hpp"
#include "ciflow/core/event_loop.hpp"
#include "ciflow/executor/executor.hpp"
#include "ciflow/report/report.hpp"
#include "ciflow/run/run_state.hpp"
#include "ciflow/scheduler/scheduler.hpp"
#include "ciflow/util/id.hpp"
#include "ciflow/workflow/job_template.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace ciflow {

struct RunOptions {
  SchedulerOptions scheduler;
  // Called on the loop thread for every status change.
  TransitionListener listener;
};

struct RunHandle {
  RunId id;
};

using ExecutorFactory =
    std::function<std::unique_ptr<IJobExecutor>(EventLoop& loop)>;

// Thread-safe front door: owns the event loop and the job executor and runs
// any number of workflows on them.
class Engine {
public:
  explicit Engine(ExecutorFactory make_executor);
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Builds the graph first; structural errors are returned and nothing runs.
  [[nodiscard]] auto start(const Workflow& workflow, RunOptions options = {})
      -> DetailedResult<RunHandle>;

  [[nodiscard]] auto cancel(const RunHandle& handle) -> Result<void>;

  // Blocks until every instance of the run is terminal.
  [[nodiscard]] auto await_completion(const RunHandle& handle)
      -> Result<RunReport>;
  // Fails with Timeout if the run is still going after `timeout`.
  [[nodiscard]] auto await_completion(const RunHandle& handle,
                                      std::chrono::milliseconds timeout)
      -> Result<RunReport>;

  // Drops a finished run's bookkeeping.
  auto forget(const RunHandle& handle) -> void;

  [[nodiscard]] auto loop() noexcept -> EventLoop& {
    return loop_;
  }

private:
  struct RunSlot {
    std::mutex mutex;
    std::condition_variable done_cv;
    std::optional<RunReport> report;
    // Loop thread only.
    std::shared_ptr<Scheduler> scheduler;
  };

  [[nodiscard]] auto find_slot(const RunHandle& handle) const
      -> std::shared_ptr<RunSlot>;

  EventLoop loop_;
  std::unique_ptr<IJobExecutor> executor_;

  mutable std::mutex runs_mutex_;
  std::unordered_map<std::string, std::shared_ptr<RunSlot>, StringHash,
                     StringEqual>
      runs_;
};

}  // namespace ciflow
