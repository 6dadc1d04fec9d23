#include "ciflow/cli/commands.hpp"
#include "ciflow/config/config.hpp"
#include "ciflow/config/workflow_loader.hpp"
#include "ciflow/report/report.hpp"
#include "ciflow/scheduler/engine.hpp"
#include "ciflow/storage/run_store.hpp"
#include "ciflow/util/log.hpp"

#include <atomic>
#include <csignal>
#include <fstream>
#include <print>

namespace ciflow::cli {

namespace {

std::atomic<bool> g_cancel_requested{false};

void signal_handler(int) {
  g_cancel_requested.store(true, std::memory_order_release);
}

auto load_config(const RunOptions& opts) -> Result<SystemConfig> {
  if (opts.config_file.empty()) {
    return SystemConfig{};
  }
  return ConfigLoader::load_from_file(opts.config_file);
}

auto write_json(const std::string& path, const RunReport& report) -> bool {
  std::ofstream out(path);
  if (!out.is_open()) {
    return false;
  }
  out << report_to_json(report) << '\n';
  return out.good();
}

}  // namespace

auto cmd_run(const RunOptions& opts) -> int {
  auto config = load_config(opts);
  if (!config) {
    std::println(stderr, "Error: failed to load config: {}",
                 config.error().message());
    return kExitUsage;
  }

  if (opts.max_concurrency) {
    if (*opts.max_concurrency <= 0) {
      std::println(stderr, "Error: -j must be positive");
      return kExitUsage;
    }
    config->scheduler.max_concurrency = *opts.max_concurrency;
  }
  if (opts.timeout_sec) {
    if (*opts.timeout_sec < 0) {
      std::println(stderr, "Error: --timeout must not be negative");
      return kExitUsage;
    }
    config->scheduler.run_timeout_sec = *opts.timeout_sec;
  }
  if (!opts.db_file.empty()) {
    config->storage.enabled = true;
    config->storage.db_file = opts.db_file;
  }
  if (opts.dry_run) {
    config->executor.type = ExecutorType::Noop;
  }
  const auto& level =
      opts.log_level.empty() ? config->scheduler.log_level : opts.log_level;
  if (!log::set_level(level)) {
    std::println(stderr, "Error: unknown log level '{}'", level);
    return kExitUsage;
  }
  log::start();

  auto workflow = WorkflowLoader::load_from_file(opts.workflow_file);
  if (!workflow) {
    std::println(stderr, "Error: {}", workflow.error().message);
    log::stop();
    return kExitUsage;
  }
  for (auto& job : workflow->jobs) {
    if (job.working_dir.empty()) {
      job.working_dir = config->executor.working_dir;
    }
  }

  int exit_code = kExitFailure;
  {
    Engine engine([&](EventLoop& loop) {
      return create_executor(config->executor.type, loop,
                             config->executor.shell);
    });

    auto handle = engine.start(
        *workflow, ciflow::RunOptions{.scheduler = scheduler_options(*config)});
    if (!handle) {
      std::println(stderr, "Error: {}", handle.error().message);
      log::stop();
      return kExitUsage;
    }
    std::println("Run {} started ({})", handle->id,
                 workflow->name.empty() ? opts.workflow_file : workflow->name);

    g_cancel_requested.store(false, std::memory_order_release);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    bool cancel_sent = false;
    Result<RunReport> report = fail(Error::Timeout);
    while (true) {
      report = engine.await_completion(*handle, std::chrono::milliseconds(100));
      if (report || report.error() != make_error_code(Error::Timeout)) {
        break;
      }
      if (!cancel_sent && g_cancel_requested.load(std::memory_order_acquire)) {
        log::info("Received signal, cancelling run {}", handle->id);
        if (auto r = engine.cancel(*handle); !r) {
          log::error("Cancel failed: {}", r.error().message());
        }
        cancel_sent = true;
      }
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (!report) {
      std::println(stderr, "Error: {}", report.error().message());
      log::stop();
      return kExitUsage;
    }

    std::print("{}", render_summary(*report));

    if (!opts.json_file.empty() && !write_json(opts.json_file, *report)) {
      log::error("Failed to write report to {}", opts.json_file);
    }

    if (config->storage.enabled) {
      RunStore store(config->storage.db_file);
      if (auto r = store.open(); !r) {
        log::warn("Run history not saved: {}", r.error().message());
      } else if (auto s = store.save_report(*report); !s) {
        log::warn("Run history not saved: {}", s.error().message());
      }
    }

    exit_code =
        report->verdict == Verdict::Success ? kExitSuccess : kExitFailure;
  }

  log::stop();
  return exit_code;
}

}  // namespace ciflow::cli
