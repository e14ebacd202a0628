#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace shopstore::util {

/*
  Cancellation context passed through every blocking call.

  Copies share state: cancelling one copy cancels all of them. A deadline
  is treated as an implicit cancellation once it passes. This layer never
  imposes timeouts of its own; callers attach a deadline when they want one.
*/
class Context {
 public:
  using SteadyClock = std::chrono::steady_clock;

  Context() : state_(std::make_shared<State>()) {
  }

  static Context Background() {
    return Context{};
  }

  static Context WithDeadline(SteadyClock::time_point deadline) {
    Context ctx;
    ctx.state_->deadline = deadline;
    return ctx;
  }

  static Context WithTimeout(SteadyClock::duration timeout) {
    return WithDeadline(SteadyClock::now() + timeout);
  }

  void Cancel() const {
    state_->cancelled.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    if (state_->cancelled.load(std::memory_order_acquire)) return true;
    return state_->deadline && SteadyClock::now() >= *state_->deadline;
  }

 private:
  struct State {
    std::atomic<bool>                      cancelled{false};
    std::optional<SteadyClock::time_point> deadline;
  };

  std::shared_ptr<State> state_;
};

} // namespace shopstore::util
