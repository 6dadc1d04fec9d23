#include "ciflow/cli/commands.hpp"
#include "ciflow/config/workflow_loader.hpp"
#include "ciflow/graph/job_graph.hpp"

#include <print>

namespace ciflow::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto workflow = WorkflowLoader::load_from_file(opts.workflow_file);
  if (!workflow) {
    std::println(stderr, "\u2717 {}: {}", opts.workflow_file,
                 workflow.error().message);
    return kExitUsage;
  }

  auto graph = JobGraph::build(*workflow);
  if (!graph) {
    std::println(stderr, "\u2717 {}: {}", opts.workflow_file,
                 graph.error().message);
    return kExitUsage;
  }

  std::println("\u2713 {} ({} job(s), {} instance(s))", opts.workflow_file,
               graph->template_count(), graph->size());

  for (NodeIndex idx : graph->get_topological_order()) {
    const auto& node = graph->node(idx);
    const auto& job = graph->job(node.job);
    std::print("  {:>2}  {}", node.depth, node.id);
    if (!job.needs.empty()) {
      std::print("  <-");
      for (auto t : job.needs) {
        std::print(" {}", graph->job(t).definition.id);
      }
    }
    if (!std::holds_alternative<DefaultCondition>(job.definition.condition)) {
      std::print("  [{}]", condition_kind(job.definition.condition));
    }
    std::println("");
  }
  return kExitSuccess;
}

}  // namespace ciflow::cli
