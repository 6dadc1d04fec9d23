#include "ciflow/scheduler/scheduler.hpp"

#include "ciflow/core/event_loop.hpp"
#include "ciflow/util/log.hpp"

#include <algorithm>
#include <exception>
#include <format>

namespace ciflow {

namespace {

auto cause_of(const ExecutorResult& result) -> FailureCause {
  if (result.error_code == make_error_code(Error::UnresolvedReference) ||
      result.error_code == make_error_code(Error::InvalidCondition)) {
    return FailureCause::UnresolvedReference;
  }
  return FailureCause::ExecutorError;
}

}  // namespace

Scheduler::Scheduler(PrivateTag, EventLoop& loop, IJobExecutor& executor,
                     std::shared_ptr<const JobGraph> graph, RunId run_id,
                     SchedulerOptions options, RunCompleteCallback on_complete)
    : loop_(&loop),
      executor_(&executor),
      graph_(graph),
      options_(options),
      state_(std::move(run_id), std::move(graph)),
      on_complete_(std::move(on_complete)) {
  options_.max_concurrency = std::max<std::size_t>(options_.max_concurrency, 1);
}

auto Scheduler::create(EventLoop& loop, IJobExecutor& executor,
                       std::shared_ptr<const JobGraph> graph, RunId run_id,
                       SchedulerOptions options,
                       RunCompleteCallback on_complete)
    -> std::shared_ptr<Scheduler> {
  return std::make_shared<Scheduler>(PrivateTag{}, loop, executor,
                                     std::move(graph), std::move(run_id),
                                     options, std::move(on_complete));
}

auto Scheduler::begin() -> void {
  if (started_) {
    return;
  }
  started_ = true;
  state_.set_started_at(std::chrono::system_clock::now());
  log::info("Run {} started: {} instance(s), max concurrency {}", state_.id(),
            state_.size(), options_.max_concurrency);

  if (options_.run_timeout.count() > 0) {
    loop_->spawn(run_timer(weak_from_this(), options_.run_timeout));
  }
  pump();
}

auto Scheduler::pump() -> void {
  if (finished_) {
    return;
  }
  bool progressed = true;
  while (progressed) {
    progressed = evaluate_pending();
    progressed |= launch_ready();
  }
  check_complete();
}

auto Scheduler::evaluate_pending() -> bool {
  auto batch = state_.take_evaluable();
  if (batch.empty() || cancelled()) {
    return false;
  }

  for (NodeIndex idx : batch) {
    const auto& entry = graph_->job_of(idx);
    const Expression* compiled =
        entry.predicate ? &*entry.predicate : nullptr;
    auto ctx = state_.eval_context(idx, false);
    auto eligibility = evaluate_condition(entry.definition.condition, compiled, ctx);

    if (!eligibility) {
      log::warn("{}: condition failed: {}", graph_->node(idx).id,
                eligibility.error().message);
      apply(state_.mark_failed(idx, FailureCause::UnresolvedReference,
                               std::nullopt, eligibility.error().message),
            idx);
      continue;
    }

    if (*eligibility == Eligibility::Run) {
      apply(state_.mark_ready(idx), idx);
    } else {
      apply(state_.mark_blocked(idx), idx);
      apply(state_.mark_skipped(idx), idx);
    }
  }
  return true;
}

auto Scheduler::launch_ready() -> bool {
  bool launched = false;
  while (!cancelled() &&
         state_.running_count() < options_.max_concurrency) {
    auto next = state_.next_ready();
    if (!next) {
      break;
    }
    launch(*next);
    launched = true;
  }
  return launched;
}

auto Scheduler::launch(NodeIndex idx) -> void {
  if (auto r = state_.mark_running(idx); !r) {
    // Should not happen for an instance taken from the ready queue; drop it
    // so the loop cannot spin on it.
    apply(state_.mark_cancelled(idx, "could not be started"), idx);
    return;
  }

  const auto& node = graph_->node(idx);
  const auto& entry = graph_->job(node.job);

  ExecutionRequest request{
      .run_id = state_.id(),
      .instance_id = node.id,
      .job = std::shared_ptr<const JobEntry>(graph_, &entry),
      .context = state_.eval_context(idx, false),
      .timeout = entry.definition.timeout.count() > 0 ? entry.definition.timeout
                                                : options_.default_job_timeout,
      .working_dir = entry.definition.working_dir,
      .cancel = cancel_.token(),
  };

  auto sink = [weak = weak_from_this(), loop = loop_,
               idx](ExecutorResult result) mutable {
    loop->post([weak = std::move(weak), idx,
                result = std::move(result)]() mutable {
      if (auto self = weak.lock()) {
        self->on_unit_finished(idx, std::move(result));
      }
    });
  };

  try {
    executor_->start(std::move(request), std::move(sink));
  } catch (const std::exception& e) {
    log::error("{}: executor failed to start: {}", node.id, e.what());
    apply(state_.mark_failed(idx, FailureCause::ExecutorError, std::nullopt,
                             e.what()),
          idx);
  }
}

auto Scheduler::on_unit_finished(NodeIndex idx, ExecutorResult result)
    -> void {
  if (state_.status(idx) != JobStatus::Running) {
    log::debug("{}: ignoring late completion", graph_->node(idx).id);
    return;
  }

  state_.append_output(idx, result.output);
  const auto& id = graph_->node(idx).id;

  if (result.cancelled || (cancelled() && !result.succeeded())) {
    apply(state_.mark_cancelled(idx,
                                std::string(cancel_reason_name(cancel_.reason()))),
          idx);
  } else if (!result.error.empty()) {
    log::warn("{}: {}", id, result.error);
    std::optional<int> exit;
    if (result.exit_code >= 0) {
      exit = result.exit_code;
    }
    apply(state_.mark_failed(idx, cause_of(result), exit,
                             std::move(result.error)),
          idx);
  } else if (result.timed_out) {
    log::warn("{}: timed out", id);
    apply(state_.mark_failed(idx, FailureCause::Timeout, result.exit_code,
                             "job timed out"),
          idx);
  } else if (result.exit_code != 0) {
    apply(state_.mark_failed(idx, FailureCause::ExitCode, result.exit_code,
                             std::format("exited with code {}",
                                         result.exit_code)),
          idx);
  } else {
    apply(state_.mark_succeeded(idx, 0), idx);
  }

  pump();
}

auto Scheduler::request_cancel(CancelReason reason) -> void {
  if (finished_ || !cancel_.cancel(reason)) {
    return;
  }
  log::info("Run {}: {}", state_.id(), cancel_reason_name(reason));

  auto dropped = state_.cancel_unstarted(cancel_reason_name(reason));
  auto running = state_.running();
  log::debug("Run {}: cancelled {} queued instance(s), stopping {} running",
             state_.id(), dropped.size(), running.size());

  for (NodeIndex idx : running) {
    executor_->cancel(state_.id(), graph_->node(idx).id);
  }
  if (!running.empty()) {
    loop_->spawn(grace_timer(weak_from_this(), options_.cancel_grace));
  }
  check_complete();
}

auto Scheduler::on_grace_expired() -> void {
  if (finished_) {
    return;
  }
  for (NodeIndex idx : state_.running()) {
    log::warn("{}: did not stop within {}ms", graph_->node(idx).id,
              options_.cancel_grace.count());
    apply(state_.mark_cancelled(idx, "did not stop after cancel"), idx);
  }
  check_complete();
}

auto Scheduler::check_complete() -> void {
  if (finished_ || !state_.is_complete()) {
    return;
  }
  finished_ = true;
  log::info("Run {} finished", state_.id());
  if (on_complete_) {
    auto self = shared_from_this();
    on_complete_(state_);
  }
}

auto Scheduler::apply(Result<void> r, NodeIndex idx) -> void {
  if (!r) {
    log::error("{}: state update failed: {}", graph_->node(idx).id,
               r.error().message());
  }
}

auto Scheduler::run_timer(std::weak_ptr<Scheduler> weak,
                          std::chrono::milliseconds timeout) -> spawn_task {
  auto slept = co_await async_sleep(timeout);
  if (!slept) {
    co_return;
  }
  if (auto self = weak.lock()) {
    self->request_cancel(CancelReason::RunTimeout);
  }
}

auto Scheduler::grace_timer(std::weak_ptr<Scheduler> weak,
                            std::chrono::milliseconds grace) -> spawn_task {
  auto slept = co_await async_sleep(grace);
  if (!slept) {
    co_return;
  }
  if (auto self = weak.lock()) {
    self->on_grace_expired();
  }
}

}  // namespace ciflow
