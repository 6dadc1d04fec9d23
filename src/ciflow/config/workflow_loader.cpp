#include "ciflow/config/workflow_loader.hpp"

#include "ciflow/condition/expression.hpp"
#include "ciflow/config/yaml_utils.hpp"
#include "ciflow/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <format>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<ciflow::Step> {
  static bool decode(const Node& node, ciflow::Step& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.name = ciflow::yaml_get_or<std::string>(node, "name", "");
    s.run = ciflow::yaml_get_or<std::string>(node, "run", "");
    s.uses = ciflow::yaml_get_or<std::string>(node, "uses", "");
    s.condition = std::string(ciflow::strip_expression_braces(
        ciflow::yaml_get_or<std::string>(node, "if", "")));
    return true;
  }
};

}  // namespace YAML

namespace ciflow {

namespace {

auto trim(std::string_view s) -> std::string_view {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

auto decode_matrix(const JobId& job, const YAML::Node& strategy)
    -> DetailedResult<std::vector<MatrixAxis>> {
  std::vector<MatrixAxis> axes;
  if (!strategy || !strategy.IsMap()) {
    return axes;
  }
  auto matrix = strategy["matrix"];
  if (!matrix) {
    return axes;
  }
  if (!matrix.IsMap()) {
    return fail_with(Error::InvalidMatrix,
                     std::format("job '{}': strategy.matrix must be a mapping",
                                 job));
  }

  for (const auto& kv : matrix) {
    auto name = kv.first.as<std::string>();
    if (name == "include" || name == "exclude") {
      log::warn("job '{}': matrix {} is not supported, ignored", job, name);
      continue;
    }
    if (!kv.second.IsSequence()) {
      return fail_with(
          Error::InvalidMatrix,
          std::format("job '{}': matrix axis '{}' must be a list", job, name));
    }
    MatrixAxis axis{.name = std::move(name), .values = {}};
    for (const auto& v : kv.second) {
      if (!v.IsScalar()) {
        return fail_with(Error::InvalidMatrix,
                         std::format("job '{}': matrix axis '{}' has a "
                                     "non-scalar value",
                                     job, axis.name));
      }
      axis.values.push_back(v.as<std::string>());
    }
    axes.push_back(std::move(axis));
  }
  return axes;
}

auto decode_job(JobId id, const YAML::Node& node)
    -> DetailedResult<JobTemplate> {
  if (!node.IsMap()) {
    return fail_with(Error::ParseError,
                     std::format("job '{}' must be a mapping", id));
  }

  JobTemplate job;
  job.id = std::move(id);
  job.name = yaml_get_or<std::string>(node, "name", std::string(job.id.str()));
  job.needs = yaml_scalar_or_list<JobId>(node["needs"]);
  job.condition = parse_run_condition(yaml_get_or<std::string>(node, "if", ""));
  job.working_dir = yaml_get_or<std::string>(node, "working-directory", "");

  int minutes = yaml_get_or(node, "timeout-minutes", 0);
  if (minutes < 0) {
    return fail_with(Error::InvalidArgument,
                     std::format("job '{}': negative timeout-minutes", job.id));
  }
  job.timeout = std::chrono::minutes(minutes);

  auto matrix = decode_matrix(job.id, node["strategy"]);
  if (!matrix) {
    return std::unexpected(std::move(matrix.error()));
  }
  job.matrix = std::move(*matrix);

  if (auto steps = node["steps"]) {
    job.steps = steps.as<std::vector<Step>>();
  }
  return job;
}

}  // namespace

auto parse_run_condition(std::string_view text) -> RunCondition {
  auto expr = trim(strip_expression_braces(text));
  if (expr.empty() || expr == "success()") {
    return DefaultCondition{};
  }
  if (expr == "always()") {
    return AlwaysCondition{};
  }
  return CustomCondition{std::string(expr)};
}

auto WorkflowLoader::load_from_file(std::string_view path)
    -> DetailedResult<Workflow> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open workflow file: {}", path);
    return fail_with(Error::FileNotFound,
                     std::format("cannot open '{}'", path));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto result = load_from_string(buffer.str());
  if (result) {
    result->source_file = path_str;
  }
  return result;
}

auto WorkflowLoader::load_from_string(std::string_view yaml_str)
    -> DetailedResult<Workflow> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsMap()) {
      return fail_with(Error::ParseError, "workflow must be a mapping");
    }

    Workflow wf;
    wf.name = yaml_get_or<std::string>(root, "name", "");
    wf.env = yaml_ordered_pairs(root["env"]);

    auto jobs = root["jobs"];
    if (!jobs || !jobs.IsMap() || jobs.size() == 0) {
      return fail_with(Error::ParseError, "workflow has no jobs");
    }

    wf.jobs.reserve(jobs.size());
    for (const auto& kv : jobs) {
      auto job = decode_job(kv.first.as<JobId>(), kv.second);
      if (!job) {
        log::error("{}", job.error().message);
        return std::unexpected(std::move(job.error()));
      }
      wf.jobs.push_back(std::move(*job));
    }

    log::debug("Loaded workflow '{}' with {} job(s)", wf.name, wf.jobs.size());
    return wf;
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail_with(Error::ParseError, e.what());
  }
}

}  // namespace ciflow
