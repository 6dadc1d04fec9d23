#pragma once

#include "ciflow/executor/executor.hpp"

#include <cstdint>
#include <string>

namespace ciflow {

struct SchedulerSection {
  int max_concurrency{4};
  std::string log_level{"info"};
  int job_timeout_sec{static_cast<int>(kDefaultJobTimeout.count())};
  int run_timeout_sec{0};
  int cancel_grace_ms{5000};
};

struct ExecutorSection {
  ExecutorType type{ExecutorType::Shell};
  std::string shell{"/bin/sh"};
  std::string working_dir;
};

struct StorageConfig {
  bool enabled{true};
  std::string db_file{"ciflow.db"};
};

struct SystemConfig {
  SchedulerSection scheduler;
  ExecutorSection executor;
  StorageConfig storage;
};

}  // namespace ciflow
