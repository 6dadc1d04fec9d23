#pragma once

#include "ciflow/config/system_config.hpp"
#include "ciflow/core/error.hpp"
#include "ciflow/scheduler/scheduler.hpp"

#include <string>
#include <string_view>

namespace ciflow {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

[[nodiscard]] auto scheduler_options(const SystemConfig& config)
    -> SchedulerOptions;

}  // namespace ciflow
