#pragma once

#include "ciflow/condition/expression.hpp"
#include "ciflow/core/error.hpp"
#include "ciflow/run/job_status.hpp"
#include "ciflow/util/id.hpp"
#include "ciflow/workflow/job_template.hpp"
#include "ciflow/workflow/matrix.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace ciflow {

// Terminal state of one dependency instance.
struct DependencyOutcome {
  JobId job;
  InstanceId instance;
  JobStatus status{JobStatus::Pending};
  std::optional<int> exit_code;
};

// Read-only view an expression is evaluated against. The scheduler builds one
// per instance once all of its dependencies are terminal; job executors get a
// copy for step conditions and ${{ }} substitution.
struct EvalContext {
  std::vector<JobId> needs;  // declared dependency templates, in order
  std::vector<DependencyOutcome> outcomes;
  MatrixBinding matrix;
  EnvList env;
  bool cancelled{false};
  // Engaged while running steps: whether an earlier step of the job failed.
  // success()/failure() then describe the job's own steps.
  std::optional<bool> step_failed;
};

enum class Eligibility : std::uint8_t { Run, Skip };

[[nodiscard]] constexpr auto eligibility_name(Eligibility e) noexcept
    -> std::string_view {
  return e == Eligibility::Run ? "run" : "skip";
}

// Aggregated result of all instances of one dependency template:
// "failure" if any Failed, else "cancelled" if any Cancelled, else
// "skipped" if all Skipped, else "success". Empty if `job` is not declared.
[[nodiscard]] auto dependency_result(const EvalContext& ctx, const JobId& job)
    -> std::optional<std::string_view>;

[[nodiscard]] auto all_dependencies_succeeded(const EvalContext& ctx) -> bool;
[[nodiscard]] auto any_dependency_failed(const EvalContext& ctx) -> bool;

// Pure. Unknown names fail with UnresolvedReference.
[[nodiscard]] auto evaluate(const Expression& expression,
                            const EvalContext& ctx) -> DetailedResult<Value>;

// Decides whether an instance whose dependencies are all terminal should run.
// `compiled` is the parsed form of a CustomCondition; when null the
// expression text is parsed here.
[[nodiscard]] auto evaluate_condition(const RunCondition& condition,
                                      const Expression* compiled,
                                      const EvalContext& ctx)
    -> DetailedResult<Eligibility>;

// Step gate: no condition runs the step unless an earlier step failed.
[[nodiscard]] auto evaluate_step_condition(const Expression* condition,
                                           const EvalContext& ctx)
    -> DetailedResult<bool>;

}  // namespace ciflow
