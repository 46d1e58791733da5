#pragma once

#include <string>

#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

/*
    A Stage is one long-running worker with its own thread. Subclasses implement run(); the base class owns the
    thread and its start/stop/join lifecycle.

    stop() is idempotent and safe on a stage that was never started. Subclasses must call stop() in their own
    destructor, since run() can't be allowed to outlive the derived part of the object.
*/

namespace fwp {

class Stage {
public:
  explicit Stage(std::string name);
  virtual ~Stage();

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;

  // Throws if the stage is already running, or if on_start() refuses. A stage whose run() returned may be started again
  void start(StopToken global_stop = {});

  // Requests stop and blocks until run() has returned
  void stop();

  // True while run() is executing
  bool running() const { return runner_.running(); }

  const std::string& name() const { return name_; }

protected:
  virtual void run(const StopToken& stop) = 0;

  // Called on the caller's thread before the worker thread is spawned
  virtual void on_start() {}

  // Called after the local stop was requested, before joining. Wake anything run() may be blocked on
  virtual void on_stop_requested() {}

private:
  std::string name_;
  ThreadRunner runner_;
};

} // namespace fwp
