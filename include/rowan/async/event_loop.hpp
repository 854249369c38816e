#pragma once

#include <coroutine>
#include <cstddef>
#include <deque>

#include "rowan/async/task.hpp"

namespace rowan::async {

// Single-threaded run queue for coroutines suspended on Yield().
//
// The loop only ever resumes handles posted to it; it owns no coroutine
// frames. Awaitables find the loop through EventLoop::Current(), which is
// set while the loop is running (or explicitly activated).
class EventLoop {
 public:
  // Makes a loop current for the lifetime of the activation.
  class Activation {
   public:
    explicit Activation(EventLoop& loop);
    ~Activation();

    Activation(const Activation&) = delete;
    auto operator=(const Activation&) -> Activation& = delete;
    Activation(Activation&&) = delete;
    auto operator=(Activation&&) -> Activation& = delete;

   private:
    EventLoop* previous_;
  };

  EventLoop() = default;
  ~EventLoop() = default;

  EventLoop(const EventLoop&) = delete;
  auto operator=(const EventLoop&) -> EventLoop& = delete;
  EventLoop(EventLoop&&) = delete;
  auto operator=(EventLoop&&) -> EventLoop& = delete;

  static auto Current() -> EventLoop*;

  void Post(std::coroutine_handle<> handle);

  // Resumes the oldest ready coroutine. Returns false if none was ready.
  auto RunOne() -> bool;

  [[nodiscard]] auto Pending() const -> size_t {
    return ready_.size();
  }

  // Starts the task and drives the loop until it completes. Rethrows the
  // task's failure. A task left suspended with an empty queue has nothing
  // that could ever resume it; that is reported as an InternalError.
  template <typename T>
  auto RunUntilComplete(Task<T> task) -> T {
    {
      Activation active(*this);
      task.Resume();
    }
    while (!task.Done()) {
      if (!RunOne()) {
        ThrowStalled();
      }
    }
    return task.Result();
  }

 private:
  [[noreturn]] static void ThrowStalled();

  std::deque<std::coroutine_handle<>> ready_;
};

// Suspends the calling coroutine and requeues it at the back of the current
// loop, letting other ready coroutines run first.
struct YieldAwaiter {
  static auto await_ready() noexcept -> bool {
    return false;
  }
  static void await_suspend(std::coroutine_handle<> handle);
  static void await_resume() noexcept {
  }
};

inline auto Yield() -> YieldAwaiter {
  return {};
}

}  // namespace rowan::async
