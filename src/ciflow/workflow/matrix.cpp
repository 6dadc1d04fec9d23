#include "ciflow/workflow/matrix.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace ciflow {

auto format_instance_id(const JobId& job, const MatrixBinding& binding)
    -> InstanceId {
  if (binding.empty()) {
    return InstanceId{job.str()};
  }
  std::string id = job.str();
  id.push_back('[');
  for (std::size_t i = 0; i < binding.size(); ++i) {
    if (i > 0) {
      id.push_back(',');
    }
    std::format_to(std::back_inserter(id), "{}={}", binding[i].first,
                   binding[i].second);
  }
  id.push_back(']');
  return InstanceId{std::move(id)};
}

auto lookup_binding(const MatrixBinding& binding, std::string_view axis)
    -> std::optional<std::string_view> {
  auto it = std::ranges::find(binding, axis,
                              [](const auto& kv) -> std::string_view {
                                return kv.first;
                              });
  if (it == binding.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto expand_matrix(const JobTemplate& job)
    -> DetailedResult<std::vector<ExpandedInstance>> {
  const auto& axes = job.matrix;

  std::unordered_set<std::string_view> seen;
  std::size_t total = 1;
  for (const auto& axis : axes) {
    if (axis.name.empty()) {
      return fail_with(Error::InvalidMatrix,
                       std::format("job '{}': matrix axis with empty name",
                                   job.id));
    }
    if (!seen.insert(axis.name).second) {
      return fail_with(Error::DuplicateAxis,
                       std::format("job '{}': matrix axis '{}' declared twice",
                                   job.id, axis.name));
    }
    if (axis.values.empty()) {
      return fail_with(Error::InvalidMatrix,
                       std::format("job '{}': matrix axis '{}' has no values",
                                   job.id, axis.name));
    }
    total *= axis.values.size();
    if (total > kMaxMatrixInstances) {
      return fail_with(Error::InvalidMatrix,
                       std::format("job '{}': matrix expands to more than {} "
                                   "instances",
                                   job.id, kMaxMatrixInstances));
    }
  }

  std::vector<ExpandedInstance> out;
  out.reserve(total);

  // Odometer over axis positions; the last axis is the fastest digit.
  std::vector<std::size_t> pos(axes.size(), 0);
  for (std::size_t n = 0; n < total; ++n) {
    MatrixBinding binding;
    binding.reserve(axes.size());
    for (std::size_t a = 0; a < axes.size(); ++a) {
      binding.emplace_back(axes[a].name, axes[a].values[pos[a]]);
    }
    auto id = format_instance_id(job.id, binding);
    out.push_back(ExpandedInstance{std::move(id), std::move(binding)});

    for (std::size_t a = axes.size(); a-- > 0;) {
      if (++pos[a] < axes[a].values.size()) {
        break;
      }
      pos[a] = 0;
    }
  }
  return out;
}

}  // namespace ciflow
