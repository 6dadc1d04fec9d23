#pragma once

#include "ciflow/core/error.hpp"
#include "ciflow/run/job_status.hpp"
#include "ciflow/util/id.hpp"
#include "ciflow/workflow/matrix.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ciflow {

class RunState;

enum class Verdict : std::uint8_t { Success, Failure };

[[nodiscard]] constexpr auto verdict_name(Verdict v) noexcept
    -> std::string_view {
  return v == Verdict::Success ? "success" : "failure";
}

[[nodiscard]] constexpr auto parse_verdict(std::string_view name) noexcept
    -> std::optional<Verdict> {
  if (name == "success") {
    return Verdict::Success;
  }
  if (name == "failure") {
    return Verdict::Failure;
  }
  return std::nullopt;
}

using Timestamp = std::chrono::system_clock::time_point;

struct InstanceReport {
  InstanceId id;
  JobId job;
  MatrixBinding binding;
  JobStatus status{JobStatus::Pending};
  FailureCause cause{FailureCause::None};
  std::optional<int> exit_code;  // absent if the unit never reported one
  std::optional<Timestamp> started_at;
  std::optional<Timestamp> finished_at;
  std::string error;
  std::string output;

  [[nodiscard]] auto duration() const -> std::optional<std::chrono::milliseconds>;
};

struct RunReport {
  RunId run_id;
  std::string workflow;
  Verdict verdict{Verdict::Success};
  std::vector<InstanceReport> instances;  // graph order
  // Failed or Cancelled instances, graph order. Empty on success.
  std::vector<InstanceId> culprits;
  bool cancelled{false};
  Timestamp started_at{};
  Timestamp finished_at{};

  [[nodiscard]] auto find(std::string_view instance_id) const
      -> const InstanceReport*;
  [[nodiscard]] auto count(JobStatus status) const -> std::size_t;
};

// Failure iff any instance is Failed or Cancelled. Skipped never fails a run.
[[nodiscard]] auto compute_verdict(std::span<const InstanceReport> instances)
    -> Verdict;

// Snapshot of a finished (or in-flight) run.
[[nodiscard]] auto aggregate(const RunState& state, bool cancelled)
    -> RunReport;

// Fixed-width table for terminals.
[[nodiscard]] auto render_summary(const RunReport& report) -> std::string;

auto to_json(nlohmann::json& j, const InstanceReport& r) -> void;
auto from_json(const nlohmann::json& j, InstanceReport& r) -> void;
auto to_json(nlohmann::json& j, const RunReport& r) -> void;
auto from_json(const nlohmann::json& j, RunReport& r) -> void;

[[nodiscard]] auto report_to_json(const RunReport& report, int indent = 2)
    -> std::string;
[[nodiscard]] auto report_from_json(std::string_view text) -> Result<RunReport>;

}  // namespace ciflow
