#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace ciflow {

template <typename T = void>
class task;

namespace detail {

// State every task frame carries: who to resume when the body finishes.
class task_frame {
public:
  struct resume_continuation {
    auto await_ready() const noexcept -> bool { return false; }
    template <typename Promise>
    auto await_suspend(std::coroutine_handle<Promise> self) const noexcept
        -> std::coroutine_handle<> {
      auto next = self.promise().continuation_;
      return next ? next : std::noop_coroutine();
    }
    auto await_resume() const noexcept -> void {}
  };

  auto initial_suspend() const noexcept -> std::suspend_always { return {}; }
  auto final_suspend() const noexcept -> resume_continuation { return {}; }

  std::coroutine_handle<> continuation_;
};

// Holds either the returned value or the exception that escaped the body.
template <typename T>
class task_result {
public:
  template <typename U>
    requires std::convertible_to<U&&, T>
  auto return_value(U&& value) -> void {
    state_.template emplace<1>(std::forward<U>(value));
  }
  auto unhandled_exception() noexcept -> void {
    state_.template emplace<2>(std::current_exception());
  }
  auto take() -> T {
    if (state_.index() == 2) {
      std::rethrow_exception(std::get<2>(state_));
    }
    return std::move(std::get<1>(state_));
  }

private:
  std::variant<std::monostate, T, std::exception_ptr> state_;
};

template <>
class task_result<void> {
public:
  auto return_void() const noexcept -> void {}
  auto unhandled_exception() noexcept -> void {
    error_ = std::current_exception();
  }
  auto take() -> void {
    if (error_) {
      std::rethrow_exception(error_);
    }
  }

private:
  std::exception_ptr error_;
};

}  // namespace detail

// Lazy coroutine: nothing runs until the task is co_awaited. The awaiting
// frame is resumed by symmetric transfer when the body returns. An exception
// escaping the body is rethrown from the co_await.
template <typename T>
class [[nodiscard]] task {
public:
  struct promise_type : detail::task_frame, detail::task_result<T> {
    auto get_return_object() noexcept -> task {
      return task{std::coroutine_handle<promise_type>::from_promise(*this)};
    }
  };
  using handle_type = std::coroutine_handle<promise_type>;

  task() noexcept = default;
  task(task&& other) noexcept : frame_(std::exchange(other.frame_, {})) {}
  task& operator=(task other) noexcept {
    std::swap(frame_, other.frame_);
    return *this;
  }
  ~task() {
    if (frame_) {
      frame_.destroy();
    }
  }

  [[nodiscard]] auto done() const noexcept -> bool {
    return !frame_ || frame_.done();
  }

  auto operator co_await() && noexcept {
    struct awaiter {
      task owned;
      auto await_ready() const noexcept -> bool { return owned.done(); }
      auto await_suspend(std::coroutine_handle<> caller) noexcept
          -> std::coroutine_handle<> {
        owned.frame_.promise().continuation_ = caller;
        return owned.frame_;
      }
      auto await_resume() -> T { return owned.frame_.promise().take(); }
    };
    return awaiter{std::move(*this)};
  }

private:
  explicit task(handle_type frame) noexcept : frame_(frame) {}

  handle_type frame_;
};

using spawn_task = task<void>;

namespace detail {

// Outermost frame of a spawned task. It is created suspended so the event
// loop chooses when it first runs, and it frees itself on completion. Nothing
// awaits it, so an escaping exception has nowhere to go.
struct root_frame {
  struct promise_type {
    auto get_return_object() noexcept -> root_frame {
      return {std::coroutine_handle<promise_type>::from_promise(*this)};
    }
    auto initial_suspend() const noexcept -> std::suspend_always { return {}; }
    auto final_suspend() const noexcept -> std::suspend_never { return {}; }
    auto return_void() const noexcept -> void {}
    [[noreturn]] auto unhandled_exception() const noexcept -> void {
      std::terminate();
    }
  };

  std::coroutine_handle<promise_type> handle;
};

inline auto wrap_root(spawn_task body) -> root_frame {
  co_await std::move(body);
}

}  // namespace detail

// Suspended, self-destroying frame that runs `body` when resumed.
[[nodiscard]] inline auto make_root(spawn_task body)
    -> std::coroutine_handle<> {
  return detail::wrap_root(std::move(body)).handle;
}

}  // namespace ciflow
