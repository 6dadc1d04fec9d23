#pragma once

#include "ciflow/condition/expression.hpp"
#include "ciflow/core/error.hpp"
#include "ciflow/util/id.hpp"
#include "ciflow/workflow/job_template.hpp"
#include "ciflow/workflow/matrix.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ciflow {

using NodeIndex = std::uint32_t;
using TemplateIndex = std::uint32_t;
inline constexpr std::uint32_t kInvalidNode = UINT32_MAX;

// A job template plus everything precomputed for it at construction.
struct JobEntry {
  JobTemplate definition;
  std::optional<Expression> predicate;  // set for CustomCondition
  std::vector<std::optional<Expression>> step_conditions;  // one per step
  std::vector<TemplateIndex> needs;
  std::vector<NodeIndex> instances;  // expansion order
};

struct JobInstance {
  InstanceId id;
  TemplateIndex job{0};
  MatrixBinding binding;
  std::vector<NodeIndex> deps;
  std::vector<NodeIndex> dependents;
  // Longest dependency chain above this instance; roots are 0.
  std::uint32_t depth{0};
};

// Immutable DAG of expanded job instances. Instances are stored in template
// declaration order, each template's instances in expansion order, and an
// instance depends on every instance of each template it needs.
class JobGraph {
public:
  // Fails without building anything on: DuplicateJob, SelfDependency,
  // UnknownDependency, InvalidCondition, InvalidMatrix, DuplicateAxis,
  // CyclicDependency (in that order of checking).
  [[nodiscard]] static auto build(const Workflow& workflow)
      -> DetailedResult<JobGraph>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return nodes_.empty();
  }
  [[nodiscard]] auto template_count() const noexcept -> std::size_t {
    return jobs_.size();
  }

  [[nodiscard]] auto node(NodeIndex idx) const -> const JobInstance& {
    return nodes_[idx];
  }
  [[nodiscard]] auto job(TemplateIndex idx) const -> const JobEntry& {
    return jobs_[idx];
  }
  [[nodiscard]] auto job_of(NodeIndex idx) const -> const JobEntry& {
    return jobs_[nodes_[idx].job];
  }

  [[nodiscard]] auto get_deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto get_dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto instances_of(TemplateIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto find_job(std::string_view job_id) const noexcept
      -> TemplateIndex;
  [[nodiscard]] auto get_index(std::string_view instance_id) const noexcept
      -> NodeIndex;

  // Kahn order; ties keep declaration order.
  [[nodiscard]] auto get_topological_order() const -> std::vector<NodeIndex>;

  [[nodiscard]] auto workflow_name() const noexcept -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto env() const noexcept -> const EnvList& {
    return env_;
  }

private:
  JobGraph() = default;

  [[nodiscard]] auto find_template_cycle() const -> std::vector<std::string>;
  auto compute_depths() -> void;

  std::string name_;
  EnvList env_;
  std::vector<JobEntry> jobs_;
  std::vector<JobInstance> nodes_;
  std::unordered_map<std::string, TemplateIndex, StringHash, StringEqual>
      job_index_;
  std::unordered_map<std::string, NodeIndex, StringHash, StringEqual>
      instance_index_;
};

}  // namespace ciflow
