#pragma once

#include "ciflow/core/coroutine.hpp"
#include "ciflow/core/io_ring.hpp"
#include "ciflow/core/lockfree_queue.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory_resource>
#include <optional>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <vector>

namespace ciflow {

// Single-threaded reactor. Everything that touches run state executes on the
// loop thread; other threads hand work over with post() or spawn().
//
// IO goes through io_uring when the kernel allows it. Otherwise the loop
// services polls and timers itself with poll(2), so awaiters behave the same
// on both backends.
class EventLoop {
public:
  EventLoop();
  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  auto start() -> void;
  // Joins the loop thread. Outstanding IO is completed with -ESHUTDOWN and
  // the suspended coroutines are resumed so they can unwind.
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Thread-safe.
  auto post(std::move_only_function<void()> fn) -> void;
  auto spawn(spawn_task t) -> void;

  [[nodiscard]] auto in_loop_thread() const noexcept -> bool;
  [[nodiscard]] auto uses_io_uring() const noexcept -> bool {
    return ring_.valid();
  }

  // Loop thread only. Returns false once the loop is shutting down.
  auto submit_io(const IoRequest& req) -> bool;

  [[nodiscard]] auto alloc_slot() -> IoSlot*;
  auto free_slot(IoSlot* data) -> void;

private:
  struct FallbackOp {
    IoSlot* data;
    IoOp op;
    int fd;
    std::uint32_t mask;
    std::optional<std::chrono::steady_clock::time_point> deadline;
  };

  auto run() -> void;
  auto run_ready() -> bool;
  auto drain_posted() -> bool;
  auto flush_io() -> void;
  auto reap_completions() -> bool;
  auto poll_fallback(std::chrono::milliseconds max_wait) -> bool;
  auto wait_for_work() -> void;
  auto complete(IoSlot* data, std::int32_t res, std::uint32_t flags) -> void;
  auto cancel_pending() -> void;
  auto drain_wake_fd() -> void;
  auto wake() -> void;

  IoRing ring_;
  int wake_fd_ = -1;

  std::pmr::unsynchronized_pool_resource io_pool_;
  std::deque<std::coroutine_handle<>> ready_;
  BoundedMPSCQueue<std::move_only_function<void()>> posted_{4096};
  std::deque<IoRequest> io_queue_;
  std::unordered_set<IoSlot*> pending_io_;
  std::vector<FallbackOp> fallback_ops_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  bool accepting_io_ = false;
};

namespace detail {
inline thread_local EventLoop* current_loop = nullptr;
}  // namespace detail

// Loop the calling coroutine runs on; null outside the loop thread.
[[nodiscard]] inline auto current_loop() noexcept -> EventLoop* {
  return detail::current_loop;
}

struct PollResult {
  bool ready = false;
  bool timed_out = false;
  std::errc error{};

  [[nodiscard]] explicit operator bool() const noexcept {
    return ready;
  }
  [[nodiscard]] auto has_error() const noexcept -> bool {
    return !ready && !timed_out && error != std::errc{};
  }
};

namespace detail {

// Parks the awaiting coroutine on one IoSlot until its request completes.
// Never suspends when there is no loop on this thread or the loop is shutting
// down; the raw result is then -ESHUTDOWN.
class io_wait {
public:
  io_wait(IoOp op, int fd, std::uint32_t events,
          std::chrono::milliseconds timeout) noexcept
      : op_{op}, fd_{fd}, events_{events}, timeout_{timeout} {
  }
  io_wait(const io_wait&) = delete;
  io_wait& operator=(const io_wait&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }
  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;

protected:
  // Raw completion result; frees the slot.
  auto take_result() noexcept -> std::int32_t;

private:
  IoOp op_;
  int fd_;
  std::uint32_t events_;
  std::chrono::milliseconds timeout_;
  EventLoop* loop_{nullptr};
  IoSlot* slot_{nullptr};
  std::int32_t result_{-ESHUTDOWN};
};

[[nodiscard]] auto decode_poll(std::int32_t res) noexcept
    -> std::expected<std::uint32_t, std::errc>;
[[nodiscard]] auto decode_poll_timeout(std::int32_t res) noexcept
    -> PollResult;
[[nodiscard]] auto decode_sleep(std::int32_t res) noexcept
    -> std::expected<void, std::errc>;

template <auto Decode>
class io_awaiter : public io_wait {
public:
  using io_wait::io_wait;

  [[nodiscard]] auto await_resume() noexcept {
    return Decode(take_result());
  }
};

}  // namespace detail

// Resolves with the ready event mask.
[[nodiscard]] inline auto async_poll(int fd, std::uint32_t mask) noexcept
    -> detail::io_awaiter<&detail::decode_poll> {
  return {IoOp::Poll, fd, mask, std::chrono::milliseconds{0}};
}

[[nodiscard]] inline auto
async_poll_timeout(int fd, std::uint32_t mask,
                   std::chrono::milliseconds timeout) noexcept
    -> detail::io_awaiter<&detail::decode_poll_timeout> {
  return {IoOp::PollWithTimeout, fd, mask, timeout};
}

// Resolves with an error only when the loop shuts down before the timer fires.
[[nodiscard]] inline auto
async_sleep(std::chrono::milliseconds duration) noexcept
    -> detail::io_awaiter<&detail::decode_sleep> {
  return {IoOp::Sleep, -1, 0, duration};
}

}  // namespace ciflow
