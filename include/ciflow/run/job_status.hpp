#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace ciflow {

enum class JobStatus : std::uint8_t {
  Pending,
  Blocked,
  Ready,
  Running,
  Succeeded,
  Failed,
  Skipped,
  Cancelled,
};

// Why an instance ended Failed or Cancelled.
enum class FailureCause : std::uint8_t {
  None,
  ExitCode,
  ExecutorError,
  UnresolvedReference,
  Timeout,
  Cancelled,
};

namespace detail {

constexpr std::array<std::string_view, 8> kJobStatusNames = {
    "pending", "blocked", "ready",   "running",
    "succeeded", "failed", "skipped", "cancelled",
};

constexpr std::array<std::string_view, 6> kFailureCauseNames = {
    "none",
    "exit_code",
    "executor_error",
    "unresolved_reference",
    "timeout",
    "cancelled",
};

}  // namespace detail

[[nodiscard]] constexpr auto is_terminal(JobStatus s) noexcept -> bool {
  return s == JobStatus::Succeeded || s == JobStatus::Failed ||
         s == JobStatus::Skipped || s == JobStatus::Cancelled;
}

[[nodiscard]] constexpr auto job_status_name(JobStatus s) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(s);
  return idx < detail::kJobStatusNames.size() ? detail::kJobStatusNames[idx]
                                              : "unknown";
}

[[nodiscard]] inline auto parse_job_status(std::string_view name) noexcept
    -> std::optional<JobStatus> {
  auto it = std::ranges::find(detail::kJobStatusNames, name);
  if (it == detail::kJobStatusNames.end()) {
    return std::nullopt;
  }
  return static_cast<JobStatus>(
      std::ranges::distance(detail::kJobStatusNames.begin(), it));
}

[[nodiscard]] constexpr auto failure_cause_name(FailureCause c) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(c);
  return idx < detail::kFailureCauseNames.size()
             ? detail::kFailureCauseNames[idx]
             : "unknown";
}

[[nodiscard]] inline auto parse_failure_cause(std::string_view name) noexcept
    -> FailureCause {
  auto it = std::ranges::find(detail::kFailureCauseNames, name);
  if (it == detail::kFailureCauseNames.end()) {
    return FailureCause::None;
  }
  return static_cast<FailureCause>(
      std::ranges::distance(detail::kFailureCauseNames.begin(), it));
}

// Result string of a finished job as seen from expressions
// (needs.<job>.result).
[[nodiscard]] constexpr auto result_name(JobStatus s) noexcept
    -> std::string_view {
  switch (s) {
    case JobStatus::Succeeded:
      return "success";
    case JobStatus::Failed:
      return "failure";
    case JobStatus::Cancelled:
      return "cancelled";
    case JobStatus::Skipped:
      return "skipped";
    default:
      return "pending";
  }
}

}  // namespace ciflow
