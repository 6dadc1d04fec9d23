#include "ciflow/run/run_state.hpp"

#include "ciflow/util/log.hpp"

namespace ciflow {

RunState::RunState(RunId id, std::shared_ptr<const JobGraph> graph)
    : id_(std::move(id)), graph_(std::move(graph)) {
  std::size_t n = graph_->size();
  records_.resize(n);
  terminal_deps_.assign(n, 0);
  handed_out_.assign(n, false);

  for (NodeIndex i = 0; i < n; ++i) {
    records_[i].idx = i;
    if (graph_->get_deps_view(i).empty()) {
      evaluable_.push_back(i);
    }
  }
  started_at_ = std::chrono::system_clock::now();
  if (n == 0) {
    finished_at_ = started_at_;
  }
}

auto RunState::transition_allowed(JobStatus from, JobStatus to) noexcept
    -> bool {
  using enum JobStatus;
  switch (from) {
    case Pending:
      return to == Blocked || to == Ready || to == Skipped || to == Failed ||
             to == Cancelled;
    case Blocked:
      return to == Skipped || to == Cancelled;
    case Ready:
      return to == Running || to == Cancelled;
    case Running:
      return to == Succeeded || to == Failed || to == Cancelled;
    default:
      return false;
  }
}

auto RunState::transition(NodeIndex idx, JobStatus to) -> Result<void> {
  if (idx >= records_.size()) {
    return fail(Error::NotFound);
  }
  auto& rec = records_[idx];
  auto from = rec.status;
  if (!transition_allowed(from, to)) {
    log::warn("Run {}: rejected transition {} -> {} for {}", id_,
              job_status_name(from), job_status_name(to),
              graph_->node(idx).id);
    return fail(Error::InvalidArgument);
  }

  if (from == JobStatus::Ready) {
    ready_.erase({graph_->node(idx).depth, idx});
  }
  if (from == JobStatus::Running) {
    --running_count_;
  }

  rec.status = to;
  auto now = std::chrono::system_clock::now();
  if (to == JobStatus::Ready) {
    ready_.insert({graph_->node(idx).depth, idx});
  } else if (to == JobStatus::Running) {
    ++running_count_;
    rec.started_at = now;
  } else if (is_terminal(to)) {
    rec.finished_at = now;
  }

  log::debug("Run {}: {} {} -> {}", id_, graph_->node(idx).id,
             job_status_name(from), job_status_name(to));
  if (listener_) {
    listener_(idx, from, to);
  }
  if (is_terminal(to)) {
    on_terminal(idx);
  }
  return ok();
}

auto RunState::on_terminal(NodeIndex idx) -> void {
  ++terminal_count_;
  if (terminal_count_ == records_.size()) {
    finished_at_ = records_[idx].finished_at;
  }

  for (NodeIndex dep : graph_->get_dependents_view(idx)) {
    if (++terminal_deps_[dep] == graph_->get_deps_view(dep).size() &&
        records_[dep].status == JobStatus::Pending && !handed_out_[dep]) {
      evaluable_.push_back(dep);
    }
  }
}

auto RunState::take_evaluable() -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  out.reserve(evaluable_.size());
  for (auto idx : evaluable_) {
    if (!handed_out_[idx] && records_[idx].status == JobStatus::Pending) {
      handed_out_[idx] = true;
      out.push_back(idx);
    }
  }
  evaluable_.clear();
  return out;
}

auto RunState::next_ready() const -> std::optional<NodeIndex> {
  if (ready_.empty()) {
    return std::nullopt;
  }
  return ready_.begin()->second;
}

auto RunState::running() const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  out.reserve(running_count_);
  for (const auto& rec : records_) {
    if (rec.status == JobStatus::Running) {
      out.push_back(rec.idx);
    }
  }
  return out;
}

auto RunState::mark_blocked(NodeIndex idx) -> Result<void> {
  return transition(idx, JobStatus::Blocked);
}

auto RunState::mark_skipped(NodeIndex idx) -> Result<void> {
  return transition(idx, JobStatus::Skipped);
}

auto RunState::mark_ready(NodeIndex idx) -> Result<void> {
  return transition(idx, JobStatus::Ready);
}

auto RunState::mark_running(NodeIndex idx) -> Result<void> {
  return transition(idx, JobStatus::Running);
}

auto RunState::mark_succeeded(NodeIndex idx, int exit_code) -> Result<void> {
  if (idx < records_.size()) {
    records_[idx].exit_code = exit_code;
  }
  return transition(idx, JobStatus::Succeeded);
}

auto RunState::mark_failed(NodeIndex idx, FailureCause cause,
                           std::optional<int> exit_code, std::string message)
    -> Result<void> {
  if (idx >= records_.size() ||
      !transition_allowed(records_[idx].status, JobStatus::Failed)) {
    return transition(idx, JobStatus::Failed);
  }
  auto& rec = records_[idx];
  rec.cause = cause;
  rec.exit_code = exit_code;
  rec.error_message = std::move(message);
  return transition(idx, JobStatus::Failed);
}

auto RunState::mark_cancelled(NodeIndex idx, std::string message)
    -> Result<void> {
  if (idx >= records_.size() ||
      !transition_allowed(records_[idx].status, JobStatus::Cancelled)) {
    return transition(idx, JobStatus::Cancelled);
  }
  auto& rec = records_[idx];
  rec.cause = FailureCause::Cancelled;
  rec.error_message = std::move(message);
  return transition(idx, JobStatus::Cancelled);
}

auto RunState::append_output(NodeIndex idx, std::string_view text) -> void {
  if (idx < records_.size()) {
    records_[idx].output.append(text);
  }
}

auto RunState::cancel_unstarted(std::string_view reason)
    -> std::vector<NodeIndex> {
  std::vector<NodeIndex> cancelled;
  for (NodeIndex i = 0; i < records_.size(); ++i) {
    auto s = records_[i].status;
    if (s == JobStatus::Pending || s == JobStatus::Blocked ||
        s == JobStatus::Ready) {
      if (mark_cancelled(i, std::string(reason))) {
        cancelled.push_back(i);
      }
    }
  }
  evaluable_.clear();
  return cancelled;
}

auto RunState::dependency_outcomes(NodeIndex idx) const
    -> std::vector<DependencyOutcome> {
  std::vector<DependencyOutcome> out;
  auto deps = graph_->get_deps_view(idx);
  out.reserve(deps.size());
  for (NodeIndex d : deps) {
    const auto& node = graph_->node(d);
    out.push_back(DependencyOutcome{.job = graph_->job(node.job).definition.id,
                                    .instance = node.id,
                                    .status = records_[d].status,
                                    .exit_code = records_[d].exit_code});
  }
  return out;
}

auto RunState::eval_context(NodeIndex idx, bool cancelled) const
    -> EvalContext {
  const auto& node = graph_->node(idx);
  const auto& entry = graph_->job(node.job);

  EvalContext ctx;
  ctx.needs.reserve(entry.needs.size());
  for (auto t : entry.needs) {
    ctx.needs.push_back(graph_->job(t).definition.id);
  }
  ctx.outcomes = dependency_outcomes(idx);
  ctx.matrix = node.binding;
  ctx.env = graph_->env();
  ctx.cancelled = cancelled;
  return ctx;
}

}  // namespace ciflow
