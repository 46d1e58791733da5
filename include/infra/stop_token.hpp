#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

/*
    StopToken / StopSource is a small utility for cooperative thread shutdown.

    The StopSource owns the stop state. A StopToken is a read-only view into it, handed to worker loops so they
    can observe when a stop has been requested.

    A token can observe two sources at once: its own (usually the local stop of one ThreadRunner) and a parent
    (usually the global stop owned by the app). stop_requested() is true when either is.

    wait_for() replaces a plain sleep in worker loops: it returns as soon as the token's own source is stopped,
    so a stop request doesn't have to wait out the poll interval. A parent stop is noticed at the timeout.
*/

namespace fwp {

struct StopState {
  std::atomic_bool stopped{false};
  std::mutex mu;
  std::condition_variable cv;
};

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(std::shared_ptr<StopState> own, std::shared_ptr<StopState> parent = nullptr)
      : own_(std::move(own)), parent_(std::move(parent)) {}

  bool stop_requested() const {
    return Stopped(own_) || Stopped(parent_);
  }

  // Sleeps up to timeout. Returns true if a stop was requested
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
    const std::shared_ptr<StopState>& s = own_ ? own_ : parent_;
    if (!s) {
      std::this_thread::sleep_for(timeout);
      return false;
    }
    std::unique_lock<std::mutex> lock(s->mu);
    s->cv.wait_for(lock, timeout, [this] { return stop_requested(); });
    return stop_requested();
  }

private:
  friend class StopSource;

  static bool Stopped(const std::shared_ptr<StopState>& s) {
    return s && s->stopped.load(std::memory_order_acquire);
  }

  std::shared_ptr<StopState> own_;
  std::shared_ptr<StopState> parent_;
};

class StopSource {
public:
  StopSource() : state_(std::make_shared<StopState>()) {}

  StopToken token() const { return StopToken(state_); }

  // Token that also stops when parent does. Only the parent's own source is linked
  StopToken token(const StopToken& parent) const { return StopToken(state_, parent.own_); }

  void request_stop() {
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      state_->stopped.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
  }

  // Flag only, safe to call from a signal handler. Waiters notice at their next timeout
  void request_stop_from_signal() { state_->stopped.store(true, std::memory_order_release); }

  bool stop_requested() const { return state_->stopped.load(std::memory_order_acquire); }

private:
  std::shared_ptr<StopState> state_;
};

} // namespace fwp
