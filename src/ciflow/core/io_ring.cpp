#include "ciflow/core/io_ring.hpp"

#include "ciflow/util/log.hpp"

#include <poll.h>

#include <cerrno>
#include <cstring>

namespace ciflow {

IoRing::IoRing() {
  int rc = io_uring_queue_init(kEntries, &ring_, 0);
  if (rc < 0) {
    log::debug("io_uring_queue_init failed: {}", std::strerror(-rc));
    return;
  }
  ready_ = true;
}

IoRing::~IoRing() {
  if (ready_) {
    io_uring_queue_exit(&ring_);
  }
}

auto IoRing::reserve(unsigned sqes) -> bool {
  if (io_uring_sq_space_left(&ring_) >= sqes) {
    return true;
  }
  flush();
  return io_uring_sq_space_left(&ring_) >= sqes;
}

auto IoRing::enqueue(const IoRequest& req) -> bool {
  if (!ready_) {
    return false;
  }

  if (req.op == IoOp::PollWithTimeout) {
    // The poll and its linked timeout must be adjacent in the queue.
    if (!reserve(2)) {
      return false;
    }
    auto* poll = io_uring_get_sqe(&ring_);
    io_uring_prep_poll_add(poll, req.fd, req.events);
    io_uring_sqe_set_data(poll, req.slot);
    poll->flags |= IOSQE_IO_LINK;

    auto* timer = io_uring_get_sqe(&ring_);
    io_uring_prep_link_timeout(timer, req.timeout, 0);
    io_uring_sqe_set_data(timer, nullptr);
    return true;
  }

  if (!reserve(1)) {
    return false;
  }
  auto* sqe = io_uring_get_sqe(&ring_);
  if (req.op == IoOp::Poll) {
    io_uring_prep_poll_add(sqe, req.fd, req.events);
  } else {
    io_uring_prep_timeout(sqe, req.timeout, 0, 0);
  }
  io_uring_sqe_set_data(sqe, req.slot);
  return true;
}

auto IoRing::flush() -> void {
  if (!ready_) {
    return;
  }
  int rc = io_uring_submit(&ring_);
  if (rc < 0 && rc != -EINTR && rc != -EBUSY) {
    log::warn("io_uring_submit failed: {}", std::strerror(-rc));
  }
}

auto IoRing::wait_for(std::chrono::milliseconds timeout) -> void {
  if (!ready_) {
    return;
  }
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  __kernel_timespec ts{
      .tv_sec = secs.count(),
      .tv_nsec = std::chrono::duration_cast<std::chrono::nanoseconds>(
                     timeout - secs)
                     .count()};
  io_uring_cqe* cqe = nullptr;
  // -ETIME and -EINTR both just mean another loop turn.
  (void)io_uring_wait_cqe_timeout(&ring_, &cqe, &ts);
}

auto IoRing::arm_wake(int fd) -> void {
  if (!ready_ || fd < 0 || !reserve(1)) {
    return;
  }
  auto* sqe = io_uring_get_sqe(&ring_);
  io_uring_prep_poll_multishot(sqe, fd, POLLIN);
  io_uring_sqe_set_data(sqe, reinterpret_cast<void*>(kWakeToken));
  flush();
}

}  // namespace ciflow
