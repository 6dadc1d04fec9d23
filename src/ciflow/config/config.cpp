#include "ciflow/config/config.hpp"

#include "ciflow/config/yaml_utils.hpp"
#include "ciflow/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<ciflow::SchedulerSection> {
  static bool decode(const Node& node, ciflow::SchedulerSection& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.max_concurrency = ciflow::yaml_get_or(node, "max_concurrency", 4);
    s.log_level = ciflow::yaml_get_or<std::string>(node, "log_level", "info");
    s.job_timeout_sec =
        ciflow::yaml_get_or(node, "job_timeout_sec", s.job_timeout_sec);
    s.run_timeout_sec = ciflow::yaml_get_or(node, "run_timeout_sec", 0);
    s.cancel_grace_ms = ciflow::yaml_get_or(node, "cancel_grace_ms", 5000);
    return true;
  }
};

template <>
struct convert<ciflow::ExecutorSection> {
  static bool decode(const Node& node, ciflow::ExecutorSection& e) {
    if (!node.IsMap()) {
      return false;
    }
    auto type = ciflow::parse_executor_type(
        ciflow::yaml_get_or<std::string>(node, "type", "shell"));
    if (!type) {
      return false;
    }
    e.type = *type;
    e.shell = ciflow::yaml_get_or<std::string>(node, "shell", "/bin/sh");
    e.working_dir = ciflow::yaml_get_or<std::string>(node, "working_dir", "");
    return true;
  }
};

template <>
struct convert<ciflow::StorageConfig> {
  static bool decode(const Node& node, ciflow::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.enabled = ciflow::yaml_get_or(node, "enabled", true);
    s.db_file = ciflow::yaml_get_or<std::string>(node, "db_file", "ciflow.db");
    return true;
  }
};

template <>
struct convert<ciflow::SystemConfig> {
  static bool decode(const Node& node, ciflow::SystemConfig& c) {
    if (node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      return false;
    }
    if (auto scheduler = node["scheduler"]) {
      c.scheduler = scheduler.as<ciflow::SchedulerSection>();
    }
    if (auto executor = node["executor"]) {
      c.executor = executor.as<ciflow::ExecutorSection>();
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<ciflow::StorageConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace ciflow {

namespace {

auto validate(const SystemConfig& c) -> Result<void> {
  if (c.scheduler.max_concurrency <= 0) {
    log::error("scheduler.max_concurrency must be positive, got {}",
               c.scheduler.max_concurrency);
    return fail(Error::InvalidArgument);
  }
  if (!log::parse_level(c.scheduler.log_level)) {
    log::error("Unknown log level '{}'", c.scheduler.log_level);
    return fail(Error::InvalidArgument);
  }
  if (c.scheduler.job_timeout_sec <= 0 || c.scheduler.run_timeout_sec < 0 ||
      c.scheduler.cancel_grace_ms < 0) {
    log::error("Timeouts must not be negative and job_timeout_sec must be "
               "positive");
    return fail(Error::InvalidArgument);
  }
  if (c.storage.enabled && c.storage.db_file.empty()) {
    log::error("storage.db_file is empty");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

void to_yaml(YAML::Emitter& out, const SchedulerSection& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "max_concurrency", s.max_concurrency);
  yaml_emit(out, "log_level", s.log_level);
  yaml_emit(out, "job_timeout_sec", s.job_timeout_sec);
  if (s.run_timeout_sec != 0) {
    yaml_emit(out, "run_timeout_sec", s.run_timeout_sec);
  }
  if (s.cancel_grace_ms != 5000) {
    yaml_emit(out, "cancel_grace_ms", s.cancel_grace_ms);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ExecutorSection& e) {
  out << YAML::BeginMap;
  yaml_emit(out, "type", std::string(executor_type_name(e.type)));
  if (e.shell != "/bin/sh") {
    yaml_emit(out, "shell", e.shell);
  }
  yaml_emit_if_not_empty(out, "working_dir", e.working_dir);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "enabled", s.enabled);
  if (s.db_file != "ciflow.db") {
    yaml_emit(out, "db_file", s.db_file);
  }
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    auto config = root.as<SystemConfig>();
    if (auto r = validate(config); !r) {
      return fail(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "scheduler" << YAML::Value;
  to_yaml(out, config.scheduler);
  out << YAML::Key << "executor" << YAML::Value;
  to_yaml(out, config.executor);
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::EndMap;
  return out.c_str();
}

auto scheduler_options(const SystemConfig& config) -> SchedulerOptions {
  return SchedulerOptions{
      .max_concurrency =
          static_cast<std::size_t>(std::max(config.scheduler.max_concurrency, 1)),
      .run_timeout = std::chrono::seconds(config.scheduler.run_timeout_sec),
      .default_job_timeout =
          std::chrono::seconds(config.scheduler.job_timeout_sec),
      .cancel_grace = std::chrono::milliseconds(config.scheduler.cancel_grace_ms),
  };
}

}  // namespace ciflow
