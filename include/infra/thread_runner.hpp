#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one worker thread. It provides:
        - Consistent start/stop/join behavior
        - A local stop source for stopping this one thread
        - Linking of that local stop to a global stop token, so the worker sees a single token
        - A running flag that drops when the worker function returns, whatever the reason
*/

namespace fwp {

class ThreadRunner {
public:
  // Worker body. The token reports stop when either the global or the local stop is requested
  using Fn = std::function<void(const StopToken&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  ~ThreadRunner();

  // Throws if the previous thread has not been joined yet
  void start(StopToken global_stop, Fn fn);

  // Request this specific thread to stop. Does NOT affect other threads
  void request_stop();
  bool stop_requested() const;

  // Throws std::logic_error when called from the worker thread itself
  void join();
  bool joinable() const;

  // True from start() until the worker function returns
  bool running() const { return running_.load(std::memory_order_acquire); }

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  StopSource local_stop_;
  StopToken token_;
  std::atomic_bool running_{false};
  std::string name_{"thread"};
};

} // namespace fwp
