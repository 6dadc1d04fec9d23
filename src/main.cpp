#include "ciflow/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("ciflow - CI pipeline orchestrator");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  run        Run a workflow and print the verdict");
  std::println("  validate   Check a workflow and print its instances");
  std::println("  history    List stored runs or show one");
  std::println("");
  std::println("run options:");
  std::println("  -w, --workflow <file>   Workflow file (required)");
  std::println("  -c, --config <file>     System config (YAML)");
  std::println("  -j, --jobs <n>          Maximum concurrent jobs");
  std::println("  --dry-run               Do not execute steps");
  std::println("  --json <file>           Write the report as JSON");
  std::println("  --db <file>             Run history database");
  std::println("  --timeout <sec>         Cancel the run after <sec> seconds");
  std::println("  --log-level <level>     debug|info|warn|error|off");
  std::println("");
  std::println("validate options:");
  std::println("  -w, --workflow <file>   Workflow file (required)");
  std::println("");
  std::println("history options:");
  std::println("  -c, --config <file>     System config (YAML)");
  std::println("  --db <file>             Run history database");
  std::println("  --run <run_id>          Show one run");
  std::println("  --workflow-name <name>  Only runs of this workflow");
  std::println("  --limit <n>             Number of runs (default: 20)");
  std::println("  --json                  Print the stored report as JSON");
  std::println("");
  std::println("Exit status: 0 success, 1 pipeline failure, 2 usage or "
               "workflow error.");
}

void print_version() {
  std::println("ciflow v0.1.0");
}

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  std::println(stderr, "Error: {}", message);
  std::println(stderr, "Try '{} --help'.", prog);
  std::exit(ciflow::cli::kExitUsage);
}

auto require_value(int argc, char* argv[], int& i) -> std::string {
  if (++i >= argc) {
    usage_error(argv[0], std::string(argv[i - 1]) + " requires an argument");
  }
  return argv[i];
}

auto parse_int(const char* prog, std::string_view flag, std::string_view text)
    -> int {
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    usage_error(prog, std::string(flag) + " expects an integer");
  }
  return value;
}

auto parse_run(int argc, char* argv[]) -> ciflow::cli::RunOptions {
  ciflow::cli::RunOptions opts;
  for (int i = 2; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-w" || arg == "--workflow") {
      opts.workflow_file = require_value(argc, argv, i);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(argc, argv, i);
    } else if (arg == "-j" || arg == "--jobs") {
      opts.max_concurrency =
          parse_int(argv[0], arg, require_value(argc, argv, i));
    } else if (arg == "--dry-run") {
      opts.dry_run = true;
    } else if (arg == "--json") {
      opts.json_file = require_value(argc, argv, i);
    } else if (arg == "--db") {
      opts.db_file = require_value(argc, argv, i);
    } else if (arg == "--timeout") {
      opts.timeout_sec = parse_int(argv[0], arg, require_value(argc, argv, i));
    } else if (arg == "--log-level") {
      opts.log_level = require_value(argc, argv, i);
    } else {
      usage_error(argv[0], std::string("unknown option ") + std::string(arg));
    }
  }
  if (opts.workflow_file.empty()) {
    usage_error(argv[0], "run needs --workflow <file>");
  }
  return opts;
}

auto parse_validate(int argc, char* argv[]) -> ciflow::cli::ValidateOptions {
  ciflow::cli::ValidateOptions opts;
  for (int i = 2; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-w" || arg == "--workflow") {
      opts.workflow_file = require_value(argc, argv, i);
    } else if (opts.workflow_file.empty() && !arg.starts_with('-')) {
      opts.workflow_file = arg;
    } else {
      usage_error(argv[0], std::string("unknown option ") + std::string(arg));
    }
  }
  if (opts.workflow_file.empty()) {
    usage_error(argv[0], "validate needs --workflow <file>");
  }
  return opts;
}

auto parse_history(int argc, char* argv[]) -> ciflow::cli::HistoryOptions {
  ciflow::cli::HistoryOptions opts;
  for (int i = 2; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(argc, argv, i);
    } else if (arg == "--db") {
      opts.db_file = require_value(argc, argv, i);
    } else if (arg == "--run") {
      opts.run_id = require_value(argc, argv, i);
    } else if (arg == "--workflow-name") {
      opts.workflow = require_value(argc, argv, i);
    } else if (arg == "--limit") {
      int limit = parse_int(argv[0], arg, require_value(argc, argv, i));
      if (limit <= 0) {
        usage_error(argv[0], "--limit must be positive");
      }
      opts.limit = static_cast<std::size_t>(limit);
    } else if (arg == "--json") {
      opts.json = true;
    } else {
      usage_error(argv[0], std::string("unknown option ") + std::string(arg));
    }
  }
  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return ciflow::cli::kExitUsage;
  }

  std::string_view command = argv[1];
  if (command == "-h" || command == "--help" || command == "help") {
    print_usage(argv[0]);
    return ciflow::cli::kExitSuccess;
  }
  if (command == "-v" || command == "--version") {
    print_version();
    return ciflow::cli::kExitSuccess;
  }

  if (command == "run") {
    return ciflow::cli::cmd_run(parse_run(argc, argv));
  }
  if (command == "validate") {
    return ciflow::cli::cmd_validate(parse_validate(argc, argv));
  }
  if (command == "history") {
    return ciflow::cli::cmd_history(parse_history(argc, argv));
  }

  usage_error(argv[0], std::string("unknown command ") + std::string(command));
}
