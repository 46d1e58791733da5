#include "stages/stage.hpp"

#include <stdexcept>
#include <utility>

#include "infra/log.hpp"

namespace fwp {

Stage::Stage(std::string name)
    : name_(std::move(name)), runner_(name_) {}

Stage::~Stage() = default;

void Stage::start(StopToken global_stop) {
  if (runner_.running()) throw std::runtime_error("stage '" + name_ + "' already running");
  // Reap a worker that returned on its own
  runner_.join();

  on_start();

  runner_.start(std::move(global_stop), [this](const StopToken& token) {
    run(token);
  });

  LogInfo(name_, "started");
}

void Stage::stop() {
  if (!runner_.joinable()) return;

  runner_.request_stop();
  on_stop_requested();
  runner_.join();

  LogInfo(name_, "stopped");
}

} // namespace fwp
