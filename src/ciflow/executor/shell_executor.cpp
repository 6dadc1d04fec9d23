#include "ciflow/condition/interpolate.hpp"
#include "ciflow/core/coroutine.hpp"
#include "ciflow/core/error.hpp"
#include "ciflow/core/event_loop.hpp"
#include "ciflow/executor/executor.hpp"
#include "ciflow/util/log.hpp"

#include <sys/syscall.h>
#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <map>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <unordered_set>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace ciflow {

namespace {

inline constexpr std::size_t kMaxOutputSize = 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kInitialOutputReserve = 8192;
inline constexpr std::string_view kTruncatedMarker = "\n[output truncated]\n";

auto pidfd_open(pid_t pid, unsigned int flags) -> int {
  return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

auto create_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

// Holds the argv/envp arrays for one exec. Built before vfork because the
// child may only call async-signal-safe functions.
struct ExecImage {
  std::string shell;
  std::string command;
  std::vector<std::string> env;

  std::vector<char*> argv;
  std::vector<char*> envp;

  auto finalize() -> void {
    argv = {shell.data(), const_cast<char*>("-c"), command.data(), nullptr};
    envp.clear();
    envp.reserve(env.size() + 1);
    for (auto& e : env) {
      envp.push_back(e.data());
    }
    envp.push_back(nullptr);
  }
};

auto fork_and_exec(ExecImage& image, const std::string& working_dir,
                   int output_write_fd) -> pid_t {
  image.finalize();

  pid_t pid = vfork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    setpgid(0, 0);

    dup2(output_write_fd, STDOUT_FILENO);
    dup2(output_write_fd, STDERR_FILENO);
    close(output_write_fd);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }

    if (!working_dir.empty()) {
      if (chdir(working_dir.c_str()) < 0) {
        _exit(127);
      }
    }

    execve(image.shell.c_str(), image.argv.data(), image.envp.data());
    _exit(127);
  }

  close(output_write_fd);
  setpgid(pid, pid);
  return pid;
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto build_environment(const ExecutionRequest& req) -> std::vector<std::string> {
  EnvList overrides = req.context.env;
  for (const auto& [axis, value] : req.context.matrix) {
    overrides.emplace_back(matrix_env_name(axis), value);
  }
  overrides.emplace_back("CIFLOW_RUN_ID", std::string(req.run_id.str()));
  overrides.emplace_back("CIFLOW_JOB",
                         std::string(req.job->definition.id.str()));
  overrides.emplace_back("CIFLOW_INSTANCE",
                         std::string(req.instance_id.str()));

  std::unordered_set<std::string_view> replaced;
  for (const auto& [name, _] : overrides) {
    replaced.insert(name);
  }

  std::vector<std::string> env;
  for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
    std::string_view entry{*e};
    auto eq = entry.find('=');
    if (eq != std::string_view::npos && replaced.contains(entry.substr(0, eq))) {
      continue;
    }
    env.emplace_back(entry);
  }
  for (const auto& [name, value] : overrides) {
    env.push_back(name + "=" + value);
  }
  return env;
}

// Largest cut <= limit that does not split a UTF-8 sequence.
auto utf8_prefix(std::string_view s, std::size_t limit) -> std::size_t {
  if (limit >= s.size()) {
    return s.size();
  }
  auto cut = limit;
  // Step back over at most three continuation bytes (10xxxxxx).
  for (int i = 0; i < 3 && cut > 0; ++i) {
    if ((static_cast<unsigned char>(s[cut]) & 0xC0) != 0x80) {
      break;
    }
    --cut;
  }
  return (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80 ? limit : cut;
}

class OutputBuffer {
public:
  OutputBuffer() {
    data_.reserve(kInitialOutputReserve);
  }

  auto append(std::string_view chunk) -> void {
    if (truncated_) {
      return;
    }
    auto room = kMaxOutputSize - data_.size();
    if (chunk.size() > room) {
      data_.append(chunk.substr(0, utf8_prefix(chunk, room)));
      truncated_ = true;
      return;
    }
    data_.append(chunk);
  }

  [[nodiscard]] auto take() -> std::string {
    if (truncated_) {
      data_.append(kTruncatedMarker);
    }
    return std::move(data_);
  }

private:
  std::string data_;
  bool truncated_ = false;
};

// Reads until EOF or the deadline. Past the size cap output is drained and
// dropped so the child never blocks on a full pipe. Returns true on timeout.
auto read_output(int fd, std::chrono::steady_clock::time_point deadline,
                 OutputBuffer& out) -> task<bool> {
  std::array<char, kReadBufferSize> buffer;

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      co_return true;
    }

    auto poll_result = co_await async_poll_timeout(fd, POLLIN, remaining);
    if (poll_result.timed_out) {
      co_return true;
    }
    if (poll_result.has_error()) {
      break;
    }

    ssize_t bytes_read = read(fd, buffer.data(), buffer.size());
    if (bytes_read < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;
      }
      break;
    }
    if (bytes_read == 0) {
      break;
    }
    out.append({buffer.data(), static_cast<std::size_t>(bytes_read)});
  }

  co_return false;
}

struct WaitOutcome {
  int exit_code = -1;
  bool timed_out = false;
};

// Reaps the step's shell. The deadline still applies after the child closed
// its output: on expiry the whole process group is killed.
auto wait_process(int pidfd, pid_t pid,
                  std::chrono::steady_clock::time_point deadline)
    -> task<WaitOutcome> {
  WaitOutcome outcome;
  int status = 0;

  for (;;) {
    int rc = waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
      outcome.exit_code = get_exit_code(status);
      co_return outcome;
    }
    if (rc < 0 && errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, strerror(errno));
      co_return outcome;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }
    // An IO error here means the loop is shutting down: stop waiting.
    if (pidfd >= 0) {
      auto polled = co_await async_poll_timeout(pidfd, POLLIN, remaining);
      if (polled.has_error()) {
        break;
      }
    } else if (!co_await async_sleep(
                   std::min(remaining, std::chrono::milliseconds(50)))) {
      break;
    }
  }

  outcome.timed_out = true;
  kill(-pid, SIGKILL);
  if (pidfd >= 0) {
    (void)co_await async_poll(pidfd, POLLIN);
  }
  if (waitpid(pid, &status, 0) == pid) {
    outcome.exit_code = get_exit_code(status);
  }
  co_return outcome;
}

class ProcessTable {
public:
  // Registers the step's process group. If the run was cancelled while the
  // step was being forked the group is killed straight away.
  auto add(const ExecutionRequest& req, pid_t pid) -> void {
    std::lock_guard lock(mutex_);
    active_[Key{req.run_id, req.instance_id}] = pid;
    if (req.cancel.is_cancelled()) {
      kill(-pid, SIGKILL);
    }
  }

  // Only drops the entry if it still belongs to `pid`.
  auto remove(const ExecutionRequest& req, pid_t pid) -> void {
    std::lock_guard lock(mutex_);
    auto it = active_.find(Key{req.run_id, req.instance_id});
    if (it != active_.end() && it->second == pid) {
      active_.erase(it);
    }
  }

  auto kill_group(const RunId& run_id, const InstanceId& instance_id) -> bool {
    std::lock_guard lock(mutex_);
    auto it = active_.find(Key{run_id, instance_id});
    if (it == active_.end() || it->second <= 0) {
      return false;
    }
    kill(-it->second, SIGKILL);
    return true;
  }

private:
  using Key = std::pair<RunId, InstanceId>;

  std::mutex mutex_;
  std::map<Key, pid_t> active_;
};

struct StepOutcome {
  int exit_code = 0;
  bool timed_out = false;
  std::string error;
};

auto run_step(const ExecutionRequest& req, std::string shell,
              std::string command, std::chrono::steady_clock::time_point deadline,
              OutputBuffer& out, ProcessTable& processes) -> task<StepOutcome> {
  StepOutcome outcome;

  auto [read_fd, write_fd] = create_pipe();
  if (read_fd < 0) {
    outcome.error = std::format("failed to create pipe: {}", strerror(errno));
    outcome.exit_code = -1;
    co_return outcome;
  }

  ExecImage image{.shell = std::move(shell),
                  .command = std::move(command),
                  .env = build_environment(req)};
  pid_t pid = fork_and_exec(image, req.working_dir, write_fd);
  if (pid < 0) {
    close(read_fd);
    outcome.error = std::format("failed to fork: {}", strerror(errno));
    outcome.exit_code = -1;
    co_return outcome;
  }

  processes.add(req, pid);

  int pidfd = pidfd_open(pid, 0);
  if (pidfd < 0) {
    log::warn("pidfd_open failed for pid {}", pid);
  }

  outcome.timed_out = co_await read_output(read_fd, deadline, out);
  close(read_fd);

  if (outcome.timed_out) {
    kill(-pid, SIGKILL);
  }

  auto waited = co_await wait_process(pidfd, pid, deadline);
  if (pidfd >= 0) {
    close(pidfd);
  }
  outcome.exit_code = waited.exit_code;
  outcome.timed_out = outcome.timed_out || waited.timed_out;

  processes.remove(req, pid);
  co_return outcome;
}

auto execute_job(ExecutionRequest req, ExecutionSink sink, std::string shell,
                 ProcessTable* processes) -> spawn_task {
  ExecutorResult result;
  OutputBuffer out;
  const auto& steps = req.job->definition.steps;
  const auto& conditions = req.job->step_conditions;
  auto deadline = std::chrono::steady_clock::now() + req.timeout;

  EvalContext ctx = req.context;
  ctx.step_failed = false;

  for (std::size_t i = 0; i < steps.size(); ++i) {
    if (req.cancel.is_cancelled()) {
      result.cancelled = true;
      break;
    }

    const auto& step = steps[i];
    std::string label = step.name.empty() ? std::format("step {}", i + 1)
                                          : step.name;

    const Expression* condition =
        i < conditions.size() && conditions[i] ? &*conditions[i] : nullptr;
    auto should_run = evaluate_step_condition(condition, ctx);
    if (!should_run) {
      result.error = std::format("{}: {}", label, should_run.error().message);
      result.error_code = should_run.error().code;
      result.exit_code = -1;
      break;
    }
    if (!*should_run) {
      log::debug("{}: skipping {}", req.instance_id, label);
      continue;
    }

    if (!step.uses.empty() && step.run.empty()) {
      log::info("{}: {} uses {} (external action, not run)", req.instance_id,
                label, step.uses);
      continue;
    }
    if (step.run.empty()) {
      continue;
    }

    auto command = interpolate(step.run, ctx);
    if (!command) {
      result.error = std::format("{}: {}", label, command.error().message);
      result.error_code = command.error().code;
      result.exit_code = -1;
      break;
    }

    log::debug("{}: running {}", req.instance_id, label);
    auto step_result =
        co_await run_step(req, shell, std::move(*command), deadline, out,
                          *processes);

    if (!step_result.error.empty()) {
      result.error = std::format("{}: {}", label, step_result.error);
      result.error_code = make_error_code(Error::ExecutorError);
      result.exit_code = step_result.exit_code;
      break;
    }
    if (step_result.timed_out) {
      result.timed_out = true;
      result.exit_code = step_result.exit_code;
      break;
    }
    if (step_result.exit_code != 0) {
      log::debug("{}: {} exited with {}", req.instance_id, label,
                 step_result.exit_code);
      if (result.exit_code == 0) {
        result.exit_code = step_result.exit_code;
      }
      ctx.step_failed = true;
    }
  }

  if (req.cancel.is_cancelled()) {
    result.cancelled = true;
    if (!result.error_code) {
      result.error_code = make_error_code(Error::Cancelled);
    }
  }
  result.output = out.take();
  sink(std::move(result));
}

class ShellExecutor : public IJobExecutor {
public:
  ShellExecutor(EventLoop& loop, std::string shell)
      : loop_{&loop}, shell_{std::move(shell)} {
  }

  auto start(ExecutionRequest request, ExecutionSink sink) -> void override {
    if (!request.job) {
      throw std::invalid_argument("execution request without a job");
    }
    loop_->spawn(execute_job(std::move(request), std::move(sink), shell_,
                             &processes_));
  }

  auto cancel(const RunId& run_id, const InstanceId& instance_id)
      -> void override {
    if (processes_.kill_group(run_id, instance_id)) {
      log::info("Run {}: killed process group of {}", run_id, instance_id);
    }
  }

private:
  EventLoop* loop_;
  std::string shell_;
  ProcessTable processes_;
};

}  // namespace

auto matrix_env_name(std::string_view axis) -> std::string {
  std::string name = "MATRIX_";
  name.reserve(name.size() + axis.size());
  for (char c : axis) {
    auto u = static_cast<unsigned char>(c);
    name.push_back(std::isalnum(u) ? static_cast<char>(std::toupper(u)) : '_');
  }
  return name;
}

auto create_shell_executor(EventLoop& loop, std::string shell)
    -> std::unique_ptr<IJobExecutor> {
  return std::make_unique<ShellExecutor>(loop, std::move(shell));
}

}  // namespace ciflow
