#pragma once

#include "ciflow/core/error.hpp"
#include "ciflow/workflow/job_template.hpp"

#include <string_view>

namespace ciflow {

// Reads the GitHub-Actions-shaped subset of a workflow file:
//
//   name: CI
//   env: {KEY: value}
//   jobs:
//     <id>:
//       needs: [a, b]            # or a single id
//       if: ${{ always() }}
//       timeout-minutes: 30
//       working-directory: sub/dir
//       strategy: {matrix: {axis: [v1, v2]}}
//       steps: [{name, run, uses, if}]
//
// runs-on and with are accepted and ignored. Structural checks (cycles,
// unknown needs, bad matrices) are left to JobGraph::build.
class WorkflowLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> DetailedResult<Workflow>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> DetailedResult<Workflow>;
};

// `if` text to a run condition: empty or success() is the default rule,
// always() the override, anything else a custom predicate.
[[nodiscard]] auto parse_run_condition(std::string_view text) -> RunCondition;

}  // namespace ciflow
