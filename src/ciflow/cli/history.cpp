#include "ciflow/cli/commands.hpp"
#include "ciflow/config/config.hpp"
#include "ciflow/report/report.hpp"
#include "ciflow/storage/run_store.hpp"

#include <chrono>
#include <format>
#include <print>

namespace ciflow::cli {

namespace {

auto format_time(std::int64_t ms) -> std::string {
  auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

}  // namespace

auto cmd_history(const HistoryOptions& opts) -> int {
  std::string db_file = opts.db_file;
  if (db_file.empty()) {
    SystemConfig config;
    if (!opts.config_file.empty()) {
      auto loaded = ConfigLoader::load_from_file(opts.config_file);
      if (!loaded) {
        std::println(stderr, "Error: failed to load config: {}",
                     loaded.error().message());
        return kExitUsage;
      }
      config = std::move(*loaded);
    }
    db_file = config.storage.db_file;
  }

  RunStore store(db_file);
  if (auto r = store.open(); !r) {
    std::println(stderr, "Error: {}: {}", db_file, r.error().message());
    return kExitUsage;
  }

  if (!opts.run_id.empty()) {
    auto report = store.get_report(opts.run_id);
    if (!report) {
      std::println(stderr, "Error: run {}: {}", opts.run_id,
                   report.error().message());
      return kExitUsage;
    }
    if (opts.json) {
      std::println("{}", report_to_json(*report));
    } else {
      std::print("{}", render_summary(*report));
    }
    return kExitSuccess;
  }

  auto runs = store.list_runs(opts.workflow, opts.limit);
  if (!runs) {
    std::println(stderr, "Error: {}", runs.error().message());
    return kExitUsage;
  }
  if (runs->empty()) {
    std::println("No runs recorded in {}", db_file);
    return kExitSuccess;
  }

  std::println("{:<14}  {:<20}  {:<8}  {:>9}  {:>8}  {}", "RUN", "STARTED",
               "VERDICT", "INSTANCES", "CULPRITS", "WORKFLOW");
  for (const auto& run : *runs) {
    std::println("{:<14}  {:<20}  {:<8}  {:>9}  {:>8}  {}{}", run.run_id,
                 format_time(run.started_at), verdict_name(run.verdict),
                 run.instance_count, run.culprit_count, run.workflow,
                 run.cancelled ? " (cancelled)" : "");
  }
  return kExitSuccess;
}

}  // namespace ciflow::cli
