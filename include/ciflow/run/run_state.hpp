#pragma once

#include "ciflow/condition/evaluator.hpp"
#include "ciflow/core/error.hpp"
#include "ciflow/graph/job_graph.hpp"
#include "ciflow/run/job_status.hpp"
#include "ciflow/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ciflow {

struct InstanceRecord {
  NodeIndex idx{kInvalidNode};
  JobStatus status{JobStatus::Pending};
  FailureCause cause{FailureCause::None};
  std::optional<int> exit_code;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
  std::string error_message;
  std::string output;
};

using TransitionListener =
    std::function<void(NodeIndex idx, JobStatus from, JobStatus to)>;

// Mutable per-run status of every instance of a JobGraph. Not thread-safe;
// the scheduler owns it and touches it from the event loop thread only.
//
// Transitions are checked against the instance state machine:
//   Pending -> Blocked | Ready | Skipped | Failed | Cancelled
//   Blocked -> Skipped | Cancelled
//   Ready   -> Running | Cancelled
//   Running -> Succeeded | Failed | Cancelled
// Anything else is rejected with InvalidArgument.
class RunState {
public:
  RunState(RunId id, std::shared_ptr<const JobGraph> graph);

  [[nodiscard]] auto id() const noexcept -> const RunId& {
    return id_;
  }
  [[nodiscard]] auto graph() const noexcept -> const JobGraph& {
    return *graph_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return records_.size();
  }

  [[nodiscard]] auto status(NodeIndex idx) const -> JobStatus {
    return records_[idx].status;
  }
  [[nodiscard]] auto record(NodeIndex idx) const -> const InstanceRecord& {
    return records_[idx];
  }
  [[nodiscard]] auto records() const noexcept
      -> const std::vector<InstanceRecord>& {
    return records_;
  }

  // Pending instances whose dependencies just became all terminal. Each
  // instance is handed out exactly once.
  [[nodiscard]] auto take_evaluable() -> std::vector<NodeIndex>;

  // Next Ready instance by (depth, declaration order). It leaves the queue
  // once marked Running or Cancelled.
  [[nodiscard]] auto next_ready() const -> std::optional<NodeIndex>;
  [[nodiscard]] auto ready_count() const noexcept -> std::size_t {
    return ready_.size();
  }
  [[nodiscard]] auto running_count() const noexcept -> std::size_t {
    return running_count_;
  }
  [[nodiscard]] auto running() const -> std::vector<NodeIndex>;

  // No instance is Pending, Blocked, Ready or Running.
  [[nodiscard]] auto is_complete() const noexcept -> bool {
    return terminal_count_ == records_.size();
  }

  [[nodiscard]] auto mark_blocked(NodeIndex idx) -> Result<void>;
  [[nodiscard]] auto mark_skipped(NodeIndex idx) -> Result<void>;
  [[nodiscard]] auto mark_ready(NodeIndex idx) -> Result<void>;
  [[nodiscard]] auto mark_running(NodeIndex idx) -> Result<void>;
  [[nodiscard]] auto mark_succeeded(NodeIndex idx, int exit_code)
      -> Result<void>;
  [[nodiscard]] auto mark_failed(NodeIndex idx, FailureCause cause,
                                 std::optional<int> exit_code,
                                 std::string message) -> Result<void>;
  [[nodiscard]] auto mark_cancelled(NodeIndex idx, std::string message)
      -> Result<void>;

  auto append_output(NodeIndex idx, std::string_view text) -> void;

  // Pending, Blocked and Ready instances become Cancelled. Returns them.
  auto cancel_unstarted(std::string_view reason) -> std::vector<NodeIndex>;

  // Snapshot of every dependency instance of `idx`.
  [[nodiscard]] auto dependency_outcomes(NodeIndex idx) const
      -> std::vector<DependencyOutcome>;
  [[nodiscard]] auto eval_context(NodeIndex idx, bool cancelled) const
      -> EvalContext;

  auto set_listener(TransitionListener listener) -> void {
    listener_ = std::move(listener);
  }

  [[nodiscard]] auto started_at() const noexcept
      -> std::chrono::system_clock::time_point {
    return started_at_;
  }
  [[nodiscard]] auto finished_at() const noexcept
      -> std::chrono::system_clock::time_point {
    return finished_at_;
  }
  auto set_started_at(std::chrono::system_clock::time_point t) noexcept
      -> void {
    started_at_ = t;
  }

  [[nodiscard]] static auto transition_allowed(JobStatus from,
                                               JobStatus to) noexcept -> bool;

private:
  auto transition(NodeIndex idx, JobStatus to) -> Result<void>;
  auto on_terminal(NodeIndex idx) -> void;

  RunId id_;
  std::shared_ptr<const JobGraph> graph_;
  std::vector<InstanceRecord> records_;

  std::vector<std::uint32_t> terminal_deps_;
  std::vector<bool> handed_out_;
  std::vector<NodeIndex> evaluable_;
  std::set<std::pair<std::uint32_t, NodeIndex>> ready_;

  std::size_t running_count_{0};
  std::size_t terminal_count_{0};

  std::chrono::system_clock::time_point started_at_{};
  std::chrono::system_clock::time_point finished_at_{};
  TransitionListener listener_;
};

}  // namespace ciflow
