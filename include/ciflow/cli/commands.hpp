#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace ciflow::cli {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

struct RunOptions {
  std::string workflow_file;
  std::string config_file;
  std::string db_file;
  std::string json_file;
  std::string log_level;
  std::optional<int> max_concurrency;
  std::optional<int> timeout_sec;
  bool dry_run{false};
};

struct ValidateOptions {
  std::string workflow_file;
};

struct HistoryOptions {
  std::string config_file;
  std::string db_file;
  std::string run_id;
  std::string workflow;
  std::size_t limit{20};
  bool json{false};
};

[[nodiscard]] auto cmd_run(const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;
[[nodiscard]] auto cmd_history(const HistoryOptions& opts) -> int;

}  // namespace ciflow::cli
