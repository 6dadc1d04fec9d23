#pragma once

#include <atomic>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <new>
#include <optional>

namespace ciflow {

#ifdef __cpp_lib_hardware_interference_size
inline constexpr std::size_t kCacheLineSize =
    std::hardware_destructive_interference_size;
#else
inline constexpr std::size_t kCacheLineSize = 64;
#endif

// Bounded multi-producer single-consumer ring for cross-thread handoff
// (EventLoop::post, log lines). Each cell carries a turn counter: a producer
// may fill cell i when turn == ticket, the consumer may take it when
// turn == ticket + 1. Producers never block; a full ring makes try_push fail.
template <std::movable T>
class BoundedMPSCQueue {
public:
  // Capacity is rounded up to a power of two, minimum 2.
  explicit BoundedMPSCQueue(std::size_t min_capacity)
      : cells_(std::make_unique<Cell[]>(round_capacity(min_capacity))),
        mask_(round_capacity(min_capacity) - 1) {
    for (std::size_t i = 0; i <= mask_; ++i) {
      cells_[i].turn.store(i, std::memory_order_relaxed);
    }
  }

  BoundedMPSCQueue(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue& operator=(const BoundedMPSCQueue&) = delete;

  // Moves from `value` only on success.
  [[nodiscard]] auto try_push(T& value) noexcept -> bool {
    auto ticket = enqueue_pos_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& cell = cells_[ticket & mask_];
      auto turn = cell.turn.load(std::memory_order_acquire);
      if (turn == ticket) {
        if (enqueue_pos_.compare_exchange_weak(ticket, ticket + 1,
                                               std::memory_order_relaxed)) {
          cell.value.emplace(std::move(value));
          cell.turn.store(ticket + 1, std::memory_order_release);
          return true;
        }
        continue;  // ticket was reloaded by the failed CAS
      }
      if (turn < ticket) {
        return false;  // consumer has not freed this cell yet
      }
      ticket = enqueue_pos_.load(std::memory_order_relaxed);
    }
  }

  [[nodiscard]] auto push(T value) noexcept -> bool {
    return try_push(value);
  }

  // Consumer thread only.
  [[nodiscard]] auto try_pop() noexcept -> std::optional<T> {
    auto ticket = dequeue_pos_.load(std::memory_order_relaxed);
    Cell& cell = cells_[ticket & mask_];
    if (cell.turn.load(std::memory_order_acquire) != ticket + 1) {
      return std::nullopt;
    }
    std::optional<T> out{std::move(cell.value)};
    cell.value.reset();
    cell.turn.store(ticket + mask_ + 1, std::memory_order_release);
    dequeue_pos_.store(ticket + 1, std::memory_order_release);
    return out;
  }

  // Consumer thread only. Hands up to `max` queued items to `fn` in FIFO
  // order and returns how many were taken.
  template <typename Fn>
  auto drain(Fn&& fn,
             std::size_t max = std::numeric_limits<std::size_t>::max())
      -> std::size_t {
    std::size_t taken = 0;
    while (taken < max) {
      auto item = try_pop();
      if (!item) {
        break;
      }
      fn(std::move(*item));
      ++taken;
    }
    return taken;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return enqueue_pos_.load(std::memory_order_acquire) ==
           dequeue_pos_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return mask_ + 1;
  }

private:
  struct Cell {
    std::atomic<std::size_t> turn{0};
    std::optional<T> value;
  };

  static constexpr auto round_capacity(std::size_t n) noexcept -> std::size_t {
    return std::bit_ceil(n < 2 ? std::size_t{2} : n);
  }

  std::unique_ptr<Cell[]> cells_;
  std::size_t mask_;
  alignas(kCacheLineSize) std::atomic<std::size_t> enqueue_pos_{0};
  alignas(kCacheLineSize) std::atomic<std::size_t> dequeue_pos_{0};
};

}  // namespace ciflow
