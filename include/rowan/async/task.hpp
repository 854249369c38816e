#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace rowan::async {

// NOLINTBEGIN(readability-identifier-naming)
// Coroutine promise_type requires specific naming convention from C++ standard

namespace detail {

// On completion control passes to whoever awaited the task, or back to the
// caller of Resume() when nobody did.
struct FinalAwaiter {
  static auto await_ready() noexcept -> bool {
    return false;
  }
  template <typename Promise>
  static auto await_suspend(std::coroutine_handle<Promise> handle) noexcept
      -> std::coroutine_handle<> {
    auto continuation = handle.promise().continuation;
    if (continuation) {
      return continuation;
    }
    return std::noop_coroutine();
  }
  static void await_resume() noexcept {
  }
};

struct PromiseBase {
  std::coroutine_handle<> continuation;
  std::exception_ptr exception;

  static auto initial_suspend() noexcept -> std::suspend_always {
    return {};
  }
  static auto final_suspend() noexcept -> FinalAwaiter {
    return {};
  }
  void unhandled_exception() noexcept {
    exception = std::current_exception();
  }
};

template <typename T>
struct TaskPromise : PromiseBase {
  std::optional<T> value;

  template <typename U = T>
  void return_value(U&& result) {
    value.emplace(std::forward<U>(result));
  }

  auto TakeResult() -> T {
    if (exception) {
      std::rethrow_exception(std::exchange(exception, nullptr));
    }
    return std::move(*value);
  }
};

template <>
struct TaskPromise<void> : PromiseBase {
  static void return_void() {
  }

  void TakeResult() {
    if (exception) {
      std::rethrow_exception(std::exchange(exception, nullptr));
    }
  }
};

}  // namespace detail

// Deferred value: a lazily started coroutine producing one T.
// Nothing runs until the task is awaited or Resume()d. Failures are stored
// and rethrown to the awaiter.
template <typename T = void>
class Task {
 public:
  struct promise_type : detail::TaskPromise<T> {
    auto get_return_object() -> Task {
      return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
    }
  };

  // NOLINTEND(readability-identifier-naming)

  using Handle = std::coroutine_handle<promise_type>;

  explicit Task(Handle handle) : handle_(handle) {
  }
  ~Task() {
    if (handle_) {
      handle_.destroy();
    }
  }

  Task(const Task&) = delete;
  auto operator=(const Task&) -> Task& = delete;
  Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {
  }
  auto operator=(Task&& other) noexcept -> Task& {
    if (this != &other) {
      if (handle_) {
        handle_.destroy();
      }
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  [[nodiscard]] auto Done() const -> bool {
    return !handle_ || handle_.done();
  }

  // Runs the coroutine up to its next suspension point.
  void Resume() {
    handle_.resume();
  }

  // Result of a completed task. Rethrows the failure, if any.
  auto Result() -> T {
    return handle_.promise().TakeResult();
  }

  auto operator co_await() && noexcept {
    struct Awaiter {
      Handle handle;

      [[nodiscard]] auto await_ready() const noexcept -> bool {
        return handle.done();
      }
      auto await_suspend(std::coroutine_handle<> awaiting) noexcept
          -> std::coroutine_handle<> {
        handle.promise().continuation = awaiting;
        return handle;
      }
      auto await_resume() -> T {
        return handle.promise().TakeResult();
      }
    };
    return Awaiter{handle_};
  }

 private:
  Handle handle_;
};

}  // namespace rowan::async
