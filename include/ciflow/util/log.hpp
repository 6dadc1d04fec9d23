#pragma once

#include "ciflow/core/lockfree_queue.hpp"

#include <unistd.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <optional>
#include <string>
#include <stop_token>
#include <string_view>
#include <thread>

namespace ciflow::log {

enum class Level : std::uint8_t { Debug, Info, Warn, Error, Off };

namespace detail {
inline constexpr std::array<std::string_view, 5> kLevelNames{
    "debug", "info", "warn", "error", "off"};
inline constexpr std::array<std::string_view, 5> kLevelTags{
    "DEBUG", "INFO ", "WARN ", "ERROR", ""};
inline constexpr std::array<std::string_view, 5> kLevelColors{
    "\033[36m", "\033[32m", "\033[33m", "\033[31m", ""};
inline constexpr std::string_view kReset = "\033[0m";
}  // namespace detail

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  return detail::kLevelNames[static_cast<std::size_t>(level)];
}

// Accepts the names level_name() produces, plus "warning".
[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  if (name == "warning") {
    return Level::Warn;
  }
  for (std::size_t i = 0; i < detail::kLevelNames.size(); ++i) {
    if (detail::kLevelNames[i] == name) {
      return static_cast<Level>(i);
    }
  }
  return std::nullopt;
}

// Writes "<utc time> <LEVEL> <message>" lines to stderr; stdout is reserved
// for reports. Between start() and stop() a writer thread owns stderr and
// callers only enqueue. Outside that window, or with a full queue, the
// caller writes the line itself.
class Logger {
public:
  Logger() = default;
  ~Logger() { stop(); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (writer_.joinable()) {
      return;
    }
    color_ = ::isatty(STDERR_FILENO) == 1;
    async_.store(true, std::memory_order_release);
    writer_ = std::jthread([this](std::stop_token st) { write_until(st); });
  }

  // Flushes everything queued before returning.
  auto stop() -> void {
    if (!writer_.joinable()) {
      return;
    }
    async_.store(false, std::memory_order_release);
    writer_.request_stop();
    wake_writer();
    writer_.join();
    // Lines enqueued while the writer was finishing.
    queue_.drain(&Logger::emit);
  }

  auto set_level(Level level) noexcept -> void {
    threshold_.store(level, std::memory_order_relaxed);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return threshold_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level != Level::Off && level >= this->level();
  }

  template <typename... Args>
  auto write(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    std::string line = prefix(level);
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');

    if (async_.load(std::memory_order_acquire) && queue_.try_push(line)) {
      wake_writer();
      return;
    }
    emit(line);
  }

private:
  static constexpr std::size_t kQueueCapacity = 8192;

  [[nodiscard]] auto prefix(Level level) const -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto idx = static_cast<std::size_t>(level);
    if (color_) {
      return std::format("{:%FT%T}Z {}{}{} ", now, detail::kLevelColors[idx],
                         detail::kLevelTags[idx], detail::kReset);
    }
    return std::format("{:%FT%T}Z {} ", now, detail::kLevelTags[idx]);
  }

  static auto emit(const std::string& line) -> void {
    std::fputs(line.c_str(), stderr);
  }

  auto wake_writer() noexcept -> void {
    pending_.fetch_add(1, std::memory_order_release);
    pending_.notify_one();
  }

  auto write_until(std::stop_token st) -> void {
    for (;;) {
      auto seen = pending_.load(std::memory_order_acquire);
      queue_.drain(&Logger::emit);
      if (st.stop_requested()) {
        break;
      }
      pending_.wait(seen, std::memory_order_acquire);
    }
    queue_.drain(&Logger::emit);
    std::fflush(stderr);
  }

  std::atomic<Level> threshold_{Level::Info};
  std::atomic<bool> async_{false};
  std::atomic<std::uint64_t> pending_{0};
  bool color_ = false;
  BoundedMPSCQueue<std::string> queue_{kQueueCapacity};
  std::jthread writer_;
};

inline auto logger() -> Logger& {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

// Unknown names leave the level unchanged and return false.
inline auto set_level(std::string_view name) noexcept -> bool {
  auto level = parse_level(name);
  if (level) {
    logger().set_level(*level);
  }
  return level.has_value();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().write(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().write(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().write(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().write(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace ciflow::log
