#include "ciflow/core/event_loop.hpp"

#include "ciflow/util/log.hpp"

#include <sys/eventfd.h>

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <utility>

namespace ciflow {

namespace {

auto to_timespec(std::chrono::milliseconds d) noexcept -> __kernel_timespec {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(d - secs);
  return {.tv_sec = secs.count(), .tv_nsec = nsecs.count()};
}

auto to_duration(const __kernel_timespec& ts) noexcept
    -> std::chrono::steady_clock::duration {
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec));
}

}  // namespace

EventLoop::EventLoop() {
  wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    log::error("Failed to create eventfd for event loop");
  }
}

EventLoop::~EventLoop() {
  stop();
  if (wake_fd_ >= 0) {
    close(wake_fd_);
  }
}

auto EventLoop::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  stop_requested_.store(false, std::memory_order_release);
  thread_ = std::thread([this] { run(); });
}

auto EventLoop::stop() -> void {
  if (in_loop_thread()) {
    log::error("EventLoop::stop() called from the loop thread");
    stop_requested_.store(true, std::memory_order_release);
    return;
  }
  if (!running_.exchange(false)) {
    return;
  }
  stop_requested_.store(true, std::memory_order_release);
  wake();
  if (thread_.joinable()) {
    thread_.join();
  }
}

auto EventLoop::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto EventLoop::in_loop_thread() const noexcept -> bool {
  return detail::current_loop == this;
}

auto EventLoop::post(std::move_only_function<void()> fn) -> void {
  if (in_loop_thread()) {
    while (!posted_.try_push(fn)) {
      drain_posted();
    }
    return;
  }
  if (!is_running()) {
    log::warn("EventLoop::post() on a stopped loop, callback dropped");
    return;
  }
  while (!posted_.try_push(fn)) {
    wake();
    std::this_thread::yield();
  }
  wake();
}

auto EventLoop::spawn(spawn_task t) -> void {
  auto root = make_root(std::move(t));
  if (in_loop_thread()) {
    ready_.push_back(root);
    return;
  }
  if (!is_running()) {
    log::warn("EventLoop::spawn() on a stopped loop, task dropped");
    root.destroy();
    return;
  }
  post([this, root] { ready_.push_back(root); });
}

auto EventLoop::submit_io(const IoRequest& req) -> bool {
  if (!accepting_io_) {
    return false;
  }
  if (req.slot) {
    pending_io_.insert(req.slot);
  }

  if (ring_.valid()) {
    io_queue_.push_back(req);
    return true;
  }

  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (req.timeout) {
    deadline = std::chrono::steady_clock::now() + to_duration(*req.timeout);
  }
  fallback_ops_.push_back(FallbackOp{.data = req.slot,
                                     .op = req.op,
                                     .fd = req.op == IoOp::Sleep ? -1 : req.fd,
                                     .mask = req.events,
                                     .deadline = deadline});
  return true;
}

auto EventLoop::alloc_slot() -> IoSlot* {
  auto* p = io_pool_.allocate(sizeof(IoSlot), alignof(IoSlot));
  return std::construct_at(static_cast<IoSlot*>(p));
}

auto EventLoop::free_slot(IoSlot* data) -> void {
  if (data == nullptr) {
    return;
  }
  std::destroy_at(data);
  io_pool_.deallocate(data, sizeof(IoSlot), alignof(IoSlot));
}

auto EventLoop::run() -> void {
  detail::current_loop = this;
  accepting_io_ = true;

  if (ring_.valid()) {
    ring_.arm_wake(wake_fd_);
  } else {
    log::warn("io_uring unavailable, event loop falling back to poll(2)");
  }

  while (!stop_requested_.load(std::memory_order_acquire)) {
    bool did_work = false;
    did_work |= drain_posted();
    did_work |= run_ready();
    flush_io();
    did_work |= reap_completions();

    if (!did_work && ready_.empty() && posted_.empty()) {
      wait_for_work();
    }
  }

  // Let everything that is still suspended observe the shutdown and unwind.
  accepting_io_ = false;
  for (int round = 0; round < 64; ++round) {
    bool did_work = drain_posted();
    did_work |= run_ready();
    if (!pending_io_.empty()) {
      cancel_pending();
      did_work = true;
    }
    if (!did_work) {
      break;
    }
  }

  detail::current_loop = nullptr;
}

auto EventLoop::drain_posted() -> bool {
  return posted_.drain([](std::move_only_function<void()> fn) { fn(); }) > 0;
}

auto EventLoop::run_ready() -> bool {
  if (ready_.empty()) {
    return false;
  }
  std::deque<std::coroutine_handle<>> batch;
  batch.swap(ready_);
  for (auto handle : batch) {
    // Root frames free themselves on completion; never touch one after
    // resume().
    if (handle && !handle.done()) {
      handle.resume();
    }
  }
  return true;
}

auto EventLoop::flush_io() -> void {
  if (!ring_.valid() || io_queue_.empty()) {
    return;
  }
  while (!io_queue_.empty()) {
    if (!ring_.enqueue(io_queue_.front())) {
      break;
    }
    io_queue_.pop_front();
  }
  ring_.flush();
}

auto EventLoop::reap_completions() -> bool {
  if (!ring_.valid()) {
    return poll_fallback(std::chrono::milliseconds(0));
  }

  unsigned count = ring_.reap(
      [this](void* raw, std::int32_t res, std::uint32_t flags) {
        if (raw == reinterpret_cast<void*>(IoRing::kWakeToken)) {
          drain_wake_fd();
          if (!(flags & IORING_CQE_F_MORE)) {
            ring_.arm_wake(wake_fd_);
          }
          return;
        }
        if (raw != nullptr) {
          complete(static_cast<IoSlot*>(raw), res, flags);
        }
      });
  return count > 0;
}

auto EventLoop::wait_for_work() -> void {
  constexpr auto max_wait = std::chrono::milliseconds(1000);
  if (ring_.valid()) {
    flush_io();
    ring_.wait_for(max_wait);
    return;
  }
  poll_fallback(max_wait);
}

auto EventLoop::poll_fallback(std::chrono::milliseconds max_wait) -> bool {
  auto now = std::chrono::steady_clock::now();
  auto wait = max_wait;

  std::vector<pollfd> fds;
  fds.reserve(fallback_ops_.size() + 1);
  fds.push_back(pollfd{.fd = wake_fd_, .events = POLLIN, .revents = 0});

  std::vector<int> slot(fallback_ops_.size(), -1);
  for (std::size_t i = 0; i < fallback_ops_.size(); ++i) {
    const auto& op = fallback_ops_[i];
    if (op.fd >= 0) {
      slot[i] = static_cast<int>(fds.size());
      fds.push_back(pollfd{
          .fd = op.fd, .events = static_cast<short>(op.mask), .revents = 0});
    }
    if (op.deadline) {
      auto left = std::chrono::ceil<std::chrono::milliseconds>(*op.deadline - now);
      wait = std::clamp(left, std::chrono::milliseconds(0), wait);
    }
  }

  int n = ::poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
  if (n < 0 && errno != EINTR) {
    log::warn("poll() failed in event loop: errno {}", errno);
  }
  if (n > 0 && fds[0].revents != 0) {
    drain_wake_fd();
  }

  now = std::chrono::steady_clock::now();
  std::vector<std::pair<IoSlot*, std::int32_t>> done;
  std::vector<FallbackOp> remaining;
  remaining.reserve(fallback_ops_.size());

  for (std::size_t i = 0; i < fallback_ops_.size(); ++i) {
    const auto& op = fallback_ops_[i];
    short revents = (n > 0 && slot[i] >= 0) ? fds[slot[i]].revents : 0;
    if (revents != 0) {
      done.emplace_back(op.data, static_cast<std::int32_t>(revents));
    } else if (op.deadline && now >= *op.deadline) {
      // Same codes io_uring reports for an expired timer or linked timeout.
      std::int32_t res = 0;
      if (op.op == IoOp::Sleep) {
        res = -ETIME;
      } else if (op.op == IoOp::PollWithTimeout) {
        res = -ECANCELED;
      }
      done.emplace_back(op.data, res);
    } else {
      remaining.push_back(op);
    }
  }
  fallback_ops_ = std::move(remaining);

  for (auto [data, res] : done) {
    complete(data, res, 0);
  }
  return !done.empty();
}

auto EventLoop::complete(IoSlot* data, std::int32_t res, std::uint32_t flags)
    -> void {
  pending_io_.erase(data);
  data->result = res;
  data->flags = flags;
  if (data->coroutine != nullptr) {
    auto handle = std::coroutine_handle<>::from_address(data->coroutine);
    if (!handle.done()) {
      handle.resume();
    }
  }
}

auto EventLoop::cancel_pending() -> void {
  auto pending = std::exchange(pending_io_, {});
  io_queue_.clear();
  fallback_ops_.clear();
  for (auto* data : pending) {
    complete(data, -ESHUTDOWN, 0);
  }
}

auto EventLoop::drain_wake_fd() -> void {
  std::uint64_t val = 0;
  while (read(wake_fd_, &val, sizeof(val)) > 0) {
  }
}

auto EventLoop::wake() -> void {
  if (wake_fd_ < 0) {
    return;
  }
  std::uint64_t val = 1;
  for (;;) {
    auto ret = write(wake_fd_, &val, sizeof(val));
    if (ret < 0 && errno == EINTR) {
      continue;
    }
    // EAGAIN means the counter is saturated, which already wakes the loop.
    break;
  }
}

namespace detail {

auto io_wait::await_suspend(std::coroutine_handle<> handle) noexcept -> bool {
  loop_ = ciflow::current_loop();
  if (loop_ == nullptr) {
    return false;
  }
  slot_ = loop_->alloc_slot();
  slot_->coroutine = handle.address();
  IoRequest req{.op = op_, .slot = slot_, .fd = fd_, .events = events_};
  if (op_ != IoOp::Poll) {
    slot_->timeout = to_timespec(timeout_);
    req.timeout = &slot_->timeout;
  }
  if (!loop_->submit_io(req)) {
    loop_->free_slot(std::exchange(slot_, nullptr));
    return false;
  }
  return true;
}

auto io_wait::take_result() noexcept -> std::int32_t {
  if (slot_ != nullptr) {
    result_ = slot_->result;
    loop_->free_slot(std::exchange(slot_, nullptr));
  }
  return result_;
}

auto decode_poll(std::int32_t res) noexcept
    -> std::expected<std::uint32_t, std::errc> {
  if (res < 0) {
    return std::unexpected{static_cast<std::errc>(-res)};
  }
  return static_cast<std::uint32_t>(res);
}

auto decode_poll_timeout(std::int32_t res) noexcept -> PollResult {
  if (res > 0) {
    return {.ready = true};
  }
  // -ECANCELED: the linked timeout fired first. -ETIME: fallback timer.
  if (res == -ECANCELED || res == -ETIME) {
    return {.timed_out = true};
  }
  if (res < 0) {
    return {.error = static_cast<std::errc>(-res)};
  }
  return {};
}

auto decode_sleep(std::int32_t res) noexcept -> std::expected<void, std::errc> {
  if (res == -ETIME || res >= 0) {
    return {};
  }
  return std::unexpected{static_cast<std::errc>(-res)};
}

}  // namespace detail

}  // namespace ciflow
