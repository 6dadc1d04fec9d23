#pragma once

#include "ciflow/util/id.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ciflow {

// Ordered name/value list. Order is preserved from the workflow file so that
// instance ids and exported environments are reproducible.
using EnvList = std::vector<std::pair<std::string, std::string>>;

// Opaque to the scheduler; interpreted by the job executor.
struct Step {
  std::string name;
  std::string run;   // shell command, may contain ${{ expr }}
  std::string uses;  // external action reference
  std::string condition;  // step-level `if`, empty = run unless a prior step failed
};

struct MatrixAxis {
  std::string name;
  std::vector<std::string> values;
};

// Run only when every dependency instance Succeeded.
struct DefaultCondition {
  auto operator==(const DefaultCondition&) const -> bool = default;
};

// Run once every dependency instance is terminal, whatever the outcome.
struct AlwaysCondition {
  auto operator==(const AlwaysCondition&) const -> bool = default;
};

// Run when the expression is truthy; see condition/expression.hpp.
struct CustomCondition {
  std::string expression;
  auto operator==(const CustomCondition&) const -> bool = default;
};

using RunCondition =
    std::variant<DefaultCondition, AlwaysCondition, CustomCondition>;

[[nodiscard]] inline auto condition_kind(const RunCondition& c) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"default", "always", "custom"};
  return names[c.index()];
}

// Matches the scheduler.job_timeout_sec config default.
inline constexpr std::chrono::seconds kDefaultJobTimeout{3600};

struct JobTemplate {
  JobId id;
  std::string name;  // display name, defaults to id
  std::vector<Step> steps;
  std::vector<JobId> needs;  // declaration order
  RunCondition condition{DefaultCondition{}};
  std::vector<MatrixAxis> matrix;  // declaration order, may be empty
  // Zero means "use the scheduler default".
  std::chrono::seconds timeout{0};
  std::string working_dir;
};

struct Workflow {
  std::string name;
  EnvList env;
  std::vector<JobTemplate> jobs;  // declaration order
  std::string source_file;
};

}  // namespace ciflow
