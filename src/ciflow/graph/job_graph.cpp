#include "ciflow/graph/job_graph.hpp"

#include "ciflow/util/log.hpp"

#include <algorithm>
#include <format>
#include <queue>

namespace ciflow {

auto JobGraph::build(const Workflow& workflow) -> DetailedResult<JobGraph> {
  JobGraph g;
  g.name_ = workflow.name;
  g.env_ = workflow.env;
  g.jobs_.reserve(workflow.jobs.size());

  for (const auto& job : workflow.jobs) {
    if (job.id.empty()) {
      return fail_with(Error::InvalidArgument, "job with empty identifier");
    }
    auto idx = static_cast<TemplateIndex>(g.jobs_.size());
    if (!g.job_index_.emplace(job.id.str(), idx).second) {
      return fail_with(Error::DuplicateJob,
                       std::format("job '{}' is defined more than once",
                                   job.id));
    }
    g.jobs_.push_back(JobEntry{.definition = job});
  }

  for (auto& entry : g.jobs_) {
    const auto& def = entry.definition;
    for (const auto& need : def.needs) {
      if (need == def.id) {
        return fail_with(Error::SelfDependency,
                         std::format("job '{}' depends on itself", def.id));
      }
      auto dep = g.find_job(need.value());
      if (dep == kInvalidNode) {
        return fail_with(Error::UnknownDependency,
                         std::format("job '{}' depends on unknown job '{}'",
                                     def.id, need));
      }
      if (std::ranges::find(entry.needs, dep) == entry.needs.end()) {
        entry.needs.push_back(dep);
      }
    }
  }

  for (auto& entry : g.jobs_) {
    const auto& def = entry.definition;
    if (const auto* custom = std::get_if<CustomCondition>(&def.condition)) {
      auto parsed = Expression::parse(custom->expression);
      if (!parsed) {
        auto err = std::move(parsed.error());
        err.message = std::format("job '{}': {}", def.id, err.message);
        return std::unexpected(std::move(err));
      }
      entry.predicate = std::move(*parsed);
    }
    entry.step_conditions.reserve(def.steps.size());
    for (const auto& step : def.steps) {
      if (step.condition.empty()) {
        entry.step_conditions.emplace_back(std::nullopt);
        continue;
      }
      auto parsed = Expression::parse(step.condition);
      if (!parsed) {
        auto err = std::move(parsed.error());
        err.message = std::format("job '{}' step '{}': {}", def.id,
                                  step.name, err.message);
        return std::unexpected(std::move(err));
      }
      entry.step_conditions.emplace_back(std::move(*parsed));
    }
  }

  for (TemplateIndex t = 0; t < g.jobs_.size(); ++t) {
    auto expanded = expand_matrix(g.jobs_[t].definition);
    if (!expanded) {
      return std::unexpected(std::move(expanded.error()));
    }
    for (auto& inst : *expanded) {
      auto idx = static_cast<NodeIndex>(g.nodes_.size());
      if (!g.instance_index_.emplace(inst.id.str(), idx).second) {
        return fail_with(Error::DuplicateJob,
                         std::format("instance id '{}' is not unique",
                                     inst.id));
      }
      g.jobs_[t].instances.push_back(idx);
      g.nodes_.push_back(JobInstance{.id = std::move(inst.id),
                                     .job = t,
                                     .binding = std::move(inst.binding)});
    }
  }

  if (auto cycle = g.find_template_cycle(); !cycle.empty()) {
    std::string path;
    for (const auto& id : cycle) {
      path += path.empty() ? id : " -> " + id;
    }
    return fail_with(Error::CyclicDependency,
                     std::format("dependency cycle: {}", path),
                     std::move(cycle));
  }

  for (auto& node : g.nodes_) {
    for (auto dep_t : g.jobs_[node.job].needs) {
      const auto& deps = g.jobs_[dep_t].instances;
      node.deps.insert(node.deps.end(), deps.begin(), deps.end());
    }
  }
  for (NodeIndex i = 0; i < g.nodes_.size(); ++i) {
    for (auto dep : g.nodes_[i].deps) {
      g.nodes_[dep].dependents.push_back(i);
    }
  }

  g.compute_depths();

  log::debug("Built job graph '{}': {} templates, {} instances", g.name_,
             g.jobs_.size(), g.nodes_.size());
  return g;
}

auto JobGraph::find_template_cycle() const -> std::vector<std::string> {
  // 0 = unvisited, 1 = on the DFS stack, 2 = done.
  std::vector<std::uint8_t> state(jobs_.size(), 0);
  std::vector<std::pair<TemplateIndex, std::size_t>> stack;

  for (TemplateIndex start = 0; start < jobs_.size(); ++start) {
    if (state[start] != 0) {
      continue;
    }
    stack.push_back({start, 0});
    state[start] = 1;

    while (!stack.empty()) {
      auto& [t, child_idx] = stack.back();
      const auto& needs = jobs_[t].needs;

      if (child_idx >= needs.size()) {
        state[t] = 2;
        stack.pop_back();
        continue;
      }

      TemplateIndex child = needs[child_idx++];
      if (state[child] == 1) {
        auto from = std::ranges::find(stack, child,
                                      &std::pair<TemplateIndex, std::size_t>::first);
        std::vector<std::string> cycle;
        for (auto it = from; it != stack.end(); ++it) {
          cycle.push_back(jobs_[it->first].definition.id.str());
        }
        cycle.push_back(jobs_[child].definition.id.str());
        return cycle;
      }
      if (state[child] == 0) {
        state[child] = 1;
        stack.push_back({child, 0});
      }
    }
  }
  return {};
}

auto JobGraph::compute_depths() -> void {
  for (auto idx : get_topological_order()) {
    auto& node = nodes_[idx];
    for (auto dep : node.deps) {
      node.depth = std::max(node.depth, nodes_[dep].depth + 1);
    }
  }
}

auto JobGraph::get_topological_order() const -> std::vector<NodeIndex> {
  std::vector<std::size_t> in_degree(nodes_.size());
  std::queue<NodeIndex> ready;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    in_degree[i] = nodes_[i].deps.size();
    if (in_degree[i] == 0) {
      ready.push(i);
    }
  }

  std::vector<NodeIndex> result;
  result.reserve(nodes_.size());
  while (!ready.empty()) {
    NodeIndex current = ready.front();
    ready.pop();
    result.push_back(current);

    for (NodeIndex dep : nodes_[current].dependents) {
      if (--in_degree[dep] == 0) {
        ready.push(dep);
      }
    }
  }
  return result;
}

auto JobGraph::get_deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto JobGraph::get_dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto JobGraph::instances_of(TemplateIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= jobs_.size()) {
    return {};
  }
  return jobs_[idx].instances;
}

auto JobGraph::find_job(std::string_view job_id) const noexcept
    -> TemplateIndex {
  auto it = job_index_.find(job_id);
  return it != job_index_.end() ? it->second : kInvalidNode;
}

auto JobGraph::get_index(std::string_view instance_id) const noexcept
    -> NodeIndex {
  auto it = instance_index_.find(instance_id);
  return it != instance_index_.end() ? it->second : kInvalidNode;
}

}  // namespace ciflow
