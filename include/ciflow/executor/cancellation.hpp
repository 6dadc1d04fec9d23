#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

namespace ciflow {

// Why a run stopped early. Shown in the summary of every job it skipped.
enum class CancelReason : std::uint8_t {
  None,
  Requested,
  RunTimeout,
};

[[nodiscard]] constexpr auto cancel_reason_name(CancelReason r) noexcept
    -> std::string_view {
  if (r == CancelReason::Requested) {
    return "cancelled by request";
  }
  if (r == CancelReason::RunTimeout) {
    return "run timed out";
  }
  return "";
}

// Read side handed to executors. A default token is never cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return flag_ && flag_->load(std::memory_order_acquire) != CancelReason::None;
  }

private:
  friend class CancellationSource;
  explicit CancellationToken(
      std::shared_ptr<const std::atomic<CancelReason>> flag) noexcept
      : flag_(std::move(flag)) {}

  std::shared_ptr<const std::atomic<CancelReason>> flag_;
};

// Owned by the scheduler of one run. Only the first cancel() is recorded.
class CancellationSource {
public:
  // Returns false if the run was already cancelled.
  auto cancel(CancelReason reason = CancelReason::Requested) noexcept -> bool {
    auto none = CancelReason::None;
    return flag_->compare_exchange_strong(none, reason,
                                          std::memory_order_acq_rel);
  }

  [[nodiscard]] auto reason() const noexcept -> CancelReason {
    return flag_->load(std::memory_order_acquire);
  }
  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return reason() != CancelReason::None;
  }
  [[nodiscard]] auto token() const -> CancellationToken {
    return CancellationToken{flag_};
  }

private:
  std::shared_ptr<std::atomic<CancelReason>> flag_ =
      std::make_shared<std::atomic<CancelReason>>(CancelReason::None);
};

}  // namespace ciflow
