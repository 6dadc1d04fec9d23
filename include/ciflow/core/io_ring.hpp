#pragma once

#include <chrono>
#include <cstdint>

#include <liburing.h>

namespace ciflow {

// Completion slot owned by one suspended awaiter. The loop fills in `result`
// and resumes `coroutine`. `timeout` is kept here because the kernel reads it
// after submission.
struct IoSlot {
  void* coroutine = nullptr;
  std::int32_t result = 0;
  std::uint32_t flags = 0;
  __kernel_timespec timeout{};
};

enum class IoOp : std::uint8_t {
  Poll,             // fd readiness
  PollWithTimeout,  // poll + linked timeout, -ECANCELED on expiry
  Sleep,            // plain timer, -ETIME on expiry
};

struct IoRequest {
  IoOp op{IoOp::Sleep};
  IoSlot* slot{nullptr};
  int fd{-1};
  std::uint32_t events{0};
  __kernel_timespec* timeout{nullptr};
};

// Thin io_uring wrapper for EventLoop. The loop flushes once per turn, so
// requests are only queued here and reach the kernel on flush().
class IoRing {
public:
  static constexpr unsigned kEntries = 256;
  // user_data of the multishot poll on the loop's wake eventfd.
  static constexpr std::uintptr_t kWakeToken = 0x1;

  IoRing();
  ~IoRing();

  IoRing(const IoRing&) = delete;
  IoRing& operator=(const IoRing&) = delete;

  // False when the kernel refuses io_uring (old kernel, seccomp policy).
  [[nodiscard]] auto valid() const noexcept -> bool {
    return ready_;
  }

  // False if the submission queue stays full after a flush.
  [[nodiscard]] auto enqueue(const IoRequest& req) -> bool;
  auto flush() -> void;
  auto wait_for(std::chrono::milliseconds timeout) -> void;
  // (Re)arms the multishot poll that wakes the loop on cross-thread posts.
  auto arm_wake(int fd) -> void;

  // Calls on_cqe(user_data, res, flags) for every ready completion.
  template <typename OnCompletion>
  auto reap(OnCompletion&& on_cqe) -> unsigned {
    if (!ready_) {
      return 0;
    }
    io_uring_cqe* cqe = nullptr;
    unsigned head = 0;
    unsigned seen = 0;
    io_uring_for_each_cqe(&ring_, head, cqe) {
      on_cqe(io_uring_cqe_get_data(cqe), cqe->res, cqe->flags);
      ++seen;
    }
    io_uring_cq_advance(&ring_, seen);
    return seen;
  }

private:
  [[nodiscard]] auto reserve(unsigned sqes) -> bool;

  io_uring ring_{};
  bool ready_ = false;
};

}  // namespace ciflow
