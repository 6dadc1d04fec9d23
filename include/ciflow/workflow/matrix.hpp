#pragma once

#include "ciflow/core/error.hpp"
#include "ciflow/util/id.hpp"
#include "ciflow/workflow/job_template.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace ciflow {

// One point of a matrix: axis name to value, in declared axis order.
using MatrixBinding = EnvList;

inline constexpr std::size_t kMaxMatrixInstances = 256;

struct ExpandedInstance {
  InstanceId id;
  MatrixBinding binding;
};

// Cartesian product of the template's axes. The first declared axis varies
// slowest and each axis walks its values in declared order, so repeated
// calls give the same ids in the same order. No axes gives one instance
// whose id is the template id.
[[nodiscard]] auto expand_matrix(const JobTemplate& job)
    -> DetailedResult<std::vector<ExpandedInstance>>;

// "job" or "job[a=1,b=x]".
[[nodiscard]] auto format_instance_id(const JobId& job,
                                      const MatrixBinding& binding)
    -> InstanceId;

[[nodiscard]] auto lookup_binding(const MatrixBinding& binding,
                                  std::string_view axis)
    -> std::optional<std::string_view>;

}  // namespace ciflow
