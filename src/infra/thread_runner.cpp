#include "infra/thread_runner.hpp"

#include <stdexcept>
#include <utility>

namespace fwp {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

// Destructor safely stops thread on death
ThreadRunner::~ThreadRunner() {
  request_stop();
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  // Fresh local stop per run, so a runner can be restarted after join()
  local_stop_ = StopSource();
  token_ = local_stop_.token(global_stop);
  running_.store(true, std::memory_order_release);

  thread_ = std::thread([this, fn = std::move(fn)]() {
    fn(token_);
    running_.store(false, std::memory_order_release);
  });
}

void ThreadRunner::request_stop() {
  local_stop_.request_stop();
}

bool ThreadRunner::stop_requested() const {
  return token_.stop_requested();
}

void ThreadRunner::join() {
  if (!thread_.joinable()) return;
  if (thread_.get_id() == std::this_thread::get_id()) {
    throw std::logic_error("ThreadRunner '" + name_ + "' cannot join itself");
  }
  thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

} // namespace fwp
