#pragma once

#include "ciflow/core/coroutine.hpp"
#include "ciflow/executor/cancellation.hpp"
#include "ciflow/executor/executor.hpp"
#include "ciflow/graph/job_graph.hpp"
#include "ciflow/run/run_state.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace ciflow {

class EventLoop;

struct SchedulerOptions {
  std::size_t max_concurrency{4};
  // Zero disables the run-level timeout.
  std::chrono::milliseconds run_timeout{0};
  // Applied to jobs without their own timeout.
  std::chrono::seconds default_job_timeout{kDefaultJobTimeout};
  // How long running units get to stop after a cancel before they are
  // force-marked Cancelled.
  std::chrono::milliseconds cancel_grace{5000};
};

using RunCompleteCallback = std::move_only_function<void(const RunState& state)>;

// Drives one run. Lives on the event loop thread: every method must be called
// there, and executor completions are posted back to it.
class Scheduler : public std::enable_shared_from_this<Scheduler> {
  struct PrivateTag {};

public:
  Scheduler(PrivateTag, EventLoop& loop, IJobExecutor& executor,
            std::shared_ptr<const JobGraph> graph, RunId run_id,
            SchedulerOptions options, RunCompleteCallback on_complete);

  [[nodiscard]] static auto create(EventLoop& loop, IJobExecutor& executor,
                                   std::shared_ptr<const JobGraph> graph,
                                   RunId run_id, SchedulerOptions options,
                                   RunCompleteCallback on_complete)
      -> std::shared_ptr<Scheduler>;

  auto set_listener(TransitionListener listener) -> void {
    state_.set_listener(std::move(listener));
  }

  auto begin() -> void;
  // Stops launching, cancels everything not yet started and asks running
  // units to stop. No-op once the run is finished or already cancelling.
  auto request_cancel(CancelReason reason) -> void;

  [[nodiscard]] auto state() const noexcept -> const RunState& {
    return state_;
  }
  [[nodiscard]] auto finished() const noexcept -> bool {
    return finished_;
  }
  [[nodiscard]] auto cancelled() const noexcept -> bool {
    return cancel_.is_cancelled();
  }

private:
  auto pump() -> void;
  auto evaluate_pending() -> bool;
  auto launch_ready() -> bool;
  auto launch(NodeIndex idx) -> void;
  auto on_unit_finished(NodeIndex idx, ExecutorResult result) -> void;
  auto on_grace_expired() -> void;
  auto check_complete() -> void;
  auto apply(Result<void> r, NodeIndex idx) -> void;

  static auto run_timer(std::weak_ptr<Scheduler> weak,
                        std::chrono::milliseconds timeout) -> spawn_task;
  static auto grace_timer(std::weak_ptr<Scheduler> weak,
                          std::chrono::milliseconds grace) -> spawn_task;

  EventLoop* loop_;
  IJobExecutor* executor_;
  std::shared_ptr<const JobGraph> graph_;
  SchedulerOptions options_;
  RunState state_;
  CancellationSource cancel_;
  RunCompleteCallback on_complete_;
  bool started_ = false;
  bool finished_ = false;
};

}  // namespace ciflow
