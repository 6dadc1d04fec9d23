#include "ciflow/scheduler/engine.hpp"

#include "ciflow/graph/job_graph.hpp"
#include "ciflow/util/log.hpp"

namespace ciflow {

Engine::Engine(ExecutorFactory make_executor) {
  loop_.start();
  executor_ = make_executor(loop_);
}

Engine::~Engine() {
  {
    std::lock_guard lock(runs_mutex_);
    for (auto& [id, slot] : runs_) {
      std::lock_guard slot_lock(slot->mutex);
      if (!slot->report) {
        log::warn("Run {} still in progress at shutdown", id);
      }
    }
  }
  // Cancel whatever is left so child processes do not outlive the engine.
  loop_.post([this] {
    std::lock_guard lock(runs_mutex_);
    for (auto& [_, slot] : runs_) {
      if (slot->scheduler) {
        slot->scheduler->request_cancel(CancelReason::Requested);
      }
    }
  });
  loop_.stop();

  std::lock_guard lock(runs_mutex_);
  for (auto& [_, slot] : runs_) {
    slot->scheduler.reset();
  }
}

auto Engine::start(const Workflow& workflow, RunOptions options)
    -> DetailedResult<RunHandle> {
  auto graph = JobGraph::build(workflow);
  if (!graph) {
    log::error("Workflow '{}' rejected: {}", workflow.name,
               graph.error().message);
    return std::unexpected(std::move(graph.error()));
  }

  auto shared_graph = std::make_shared<const JobGraph>(std::move(*graph));
  RunHandle handle{.id = generate_run_id()};
  auto slot = std::make_shared<RunSlot>();

  {
    std::lock_guard lock(runs_mutex_);
    runs_.emplace(handle.id.str(), slot);
  }

  loop_.post([this, slot, graph = std::move(shared_graph), id = handle.id,
              options = std::move(options)]() mutable {
    auto scheduler = Scheduler::create(
        loop_, *executor_, std::move(graph), id, options.scheduler,
        [weak_slot = std::weak_ptr<RunSlot>(slot)](const RunState& state) {
          auto slot = weak_slot.lock();
          if (!slot) {
            return;
          }
          auto report = aggregate(state, slot->scheduler &&
                                             slot->scheduler->cancelled());
          {
            std::lock_guard lock(slot->mutex);
            slot->report = std::move(report);
          }
          slot->done_cv.notify_all();
        });
    if (options.listener) {
      scheduler->set_listener(std::move(options.listener));
    }
    slot->scheduler = scheduler;
    scheduler->begin();
  });

  return handle;
}

auto Engine::find_slot(const RunHandle& handle) const
    -> std::shared_ptr<RunSlot> {
  std::lock_guard lock(runs_mutex_);
  auto it = runs_.find(handle.id.str());
  return it != runs_.end() ? it->second : nullptr;
}

auto Engine::cancel(const RunHandle& handle) -> Result<void> {
  auto slot = find_slot(handle);
  if (!slot) {
    return fail(Error::NotFound);
  }
  loop_.post([slot] {
    if (slot->scheduler) {
      slot->scheduler->request_cancel(CancelReason::Requested);
    }
  });
  return ok();
}

auto Engine::await_completion(const RunHandle& handle) -> Result<RunReport> {
  auto slot = find_slot(handle);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::unique_lock lock(slot->mutex);
  slot->done_cv.wait(lock, [&] { return slot->report.has_value(); });
  return *slot->report;
}

auto Engine::await_completion(const RunHandle& handle,
                              std::chrono::milliseconds timeout)
    -> Result<RunReport> {
  auto slot = find_slot(handle);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::unique_lock lock(slot->mutex);
  if (!slot->done_cv.wait_for(lock, timeout,
                              [&] { return slot->report.has_value(); })) {
    return fail(Error::Timeout);
  }
  return *slot->report;
}

auto Engine::forget(const RunHandle& handle) -> void {
  std::shared_ptr<RunSlot> slot;
  {
    std::lock_guard lock(runs_mutex_);
    auto it = runs_.find(handle.id.str());
    if (it == runs_.end()) {
      return;
    }
    slot = std::move(it->second);
    runs_.erase(it);
  }
  loop_.post([slot = std::move(slot)] { (void)slot; });
}

}  // namespace ciflow
