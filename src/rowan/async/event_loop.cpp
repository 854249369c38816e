#include "rowan/async/event_loop.hpp"

#include <coroutine>
#include <utility>

#include "rowan/common/internal_error.hpp"

namespace rowan::async {

namespace {

thread_local EventLoop* current_loop = nullptr;

}  // namespace

EventLoop::Activation::Activation(EventLoop& loop)
    : previous_(std::exchange(current_loop, &loop)) {
}

EventLoop::Activation::~Activation() {
  current_loop = previous_;
}

auto EventLoop::Current() -> EventLoop* {
  return current_loop;
}

void EventLoop::Post(std::coroutine_handle<> handle) {
  ready_.push_back(handle);
}

auto EventLoop::RunOne() -> bool {
  if (ready_.empty()) {
    return false;
  }
  auto handle = ready_.front();
  ready_.pop_front();

  Activation active(*this);
  if (!handle.done()) {
    handle.resume();
  }
  return true;
}

void EventLoop::ThrowStalled() {
  common::ThrowInternalError(
      "EventLoop::RunUntilComplete",
      "task is suspended but no coroutine is ready to run; an asynchronous "
      "data source awaited something that is not driven by the event loop");
}

void YieldAwaiter::await_suspend(std::coroutine_handle<> handle) {
  auto* loop = EventLoop::Current();
  if (loop == nullptr) {
    common::ThrowInternalError(
        "async::Yield", "awaited outside of a running EventLoop");
  }
  loop->Post(handle);
}

}  // namespace rowan::async
