#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace rowan::async {

// Asynchronous sequence. The producer may co_await between items (event
// loop yields, tasks); the consumer pulls items with `co_await Next()`.
//
// Control flow: Next() transfers to the producer, which runs until its next
// co_yield (or its end) and transfers straight back to the consumer. When
// the producer suspends on something else, the consumer stays suspended
// until the event loop resumes the producer.
template <typename T>
class AsyncGenerator {
 public:
  // NOLINTBEGIN(readability-identifier-naming)
  struct promise_type {
    std::optional<T> current;
    std::exception_ptr exception;
    std::coroutine_handle<> consumer;

    struct ReturnToConsumer {
      static auto await_ready() noexcept -> bool {
        return false;
      }
      template <typename Promise>
      static auto await_suspend(std::coroutine_handle<Promise> handle) noexcept
          -> std::coroutine_handle<> {
        auto consumer = handle.promise().consumer;
        if (consumer) {
          return consumer;
        }
        return std::noop_coroutine();
      }
      static void await_resume() noexcept {
      }
    };

    auto get_return_object() -> AsyncGenerator {
      return AsyncGenerator{
          std::coroutine_handle<promise_type>::from_promise(*this)};
    }
    static auto initial_suspend() noexcept -> std::suspend_always {
      return {};
    }
    static auto final_suspend() noexcept -> ReturnToConsumer {
      return {};
    }
    auto yield_value(T value) -> ReturnToConsumer {
      current.emplace(std::move(value));
      return {};
    }
    static void return_void() {
    }
    void unhandled_exception() noexcept {
      exception = std::current_exception();
    }
  };
  // NOLINTEND(readability-identifier-naming)

  using Handle = std::coroutine_handle<promise_type>;

  class NextAwaiter {
   public:
    explicit NextAwaiter(Handle handle) : handle_(handle) {
    }

    [[nodiscard]] auto await_ready() const noexcept -> bool {
      return !handle_ || handle_.done();
    }
    auto await_suspend(std::coroutine_handle<> consumer) noexcept
        -> std::coroutine_handle<> {
      handle_.promise().consumer = consumer;
      handle_.promise().current.reset();
      return handle_;
    }
    auto await_resume() -> std::optional<T> {
      if (!handle_) {
        return std::nullopt;
      }
      auto& promise = handle_.promise();
      if (promise.exception) {
        std::rethrow_exception(std::exchange(promise.exception, nullptr));
      }
      if (handle_.done()) {
        return std::nullopt;
      }
      return std::exchange(promise.current, std::nullopt);
    }

   private:
    Handle handle_;
  };

  explicit AsyncGenerator(Handle handle) : handle_(handle) {
  }
  ~AsyncGenerator() {
    if (handle_) {
      handle_.destroy();
    }
  }

  AsyncGenerator(const AsyncGenerator&) = delete;
  auto operator=(const AsyncGenerator&) -> AsyncGenerator& = delete;
  AsyncGenerator(AsyncGenerator&& other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)) {
  }
  auto operator=(AsyncGenerator&& other) noexcept -> AsyncGenerator& {
    if (this != &other) {
      if (handle_) {
        handle_.destroy();
      }
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  // Awaitable producing the next item, or nullopt at the end.
  [[nodiscard]] auto Next() -> NextAwaiter {
    return NextAwaiter{handle_};
  }

 private:
  Handle handle_;
};

}  // namespace rowan::async
