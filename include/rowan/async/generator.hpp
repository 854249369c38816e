#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

namespace rowan::async {

// Single-pass synchronous sequence. Items are produced on demand by Next();
// once the coroutine has returned the generator stays exhausted.
template <typename T>
class Generator {
 public:
  // NOLINTBEGIN(readability-identifier-naming)
  struct promise_type {
    std::optional<T> current;
    std::exception_ptr exception;

    auto get_return_object() -> Generator {
      return Generator{
          std::coroutine_handle<promise_type>::from_promise(*this)};
    }
    static auto initial_suspend() noexcept -> std::suspend_always {
      return {};
    }
    static auto final_suspend() noexcept -> std::suspend_always {
      return {};
    }
    auto yield_value(T value) -> std::suspend_always {
      current.emplace(std::move(value));
      return {};
    }
    static void return_void() {
    }
    void unhandled_exception() noexcept {
      exception = std::current_exception();
    }

    // A synchronous sequence has no event loop to come back to.
    template <typename U>
    auto await_transform(U&& value) -> std::suspend_never = delete;
  };
  // NOLINTEND(readability-identifier-naming)

  using Handle = std::coroutine_handle<promise_type>;

  explicit Generator(Handle handle) : handle_(handle) {
  }
  ~Generator() {
    if (handle_) {
      handle_.destroy();
    }
  }

  Generator(const Generator&) = delete;
  auto operator=(const Generator&) -> Generator& = delete;
  Generator(Generator&& other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)) {
  }
  auto operator=(Generator&& other) noexcept -> Generator& {
    if (this != &other) {
      if (handle_) {
        handle_.destroy();
      }
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  // Produces the next item, or nullopt once the sequence is exhausted.
  auto Next() -> std::optional<T> {
    if (!handle_ || handle_.done()) {
      return std::nullopt;
    }
    auto& promise = handle_.promise();
    promise.current.reset();
    handle_.resume();
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

// Yields the items of a materialized list in order.
template <typename T>
auto FromItems(std::vector<T> items) -> Generator<T> {
  for (auto& item : items) {
    co_yield std::move(item);
  }
}

}  // namespace rowan::async
