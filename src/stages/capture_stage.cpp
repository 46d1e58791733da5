#include "stages/capture_stage.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "infra/log.hpp"

namespace fwp {

CaptureStage::CaptureStage(std::unique_ptr<FrameSource> source, std::shared_ptr<FrameBuffer> out, double pace_fps)
    : Stage("capture_stage"), source_(std::move(source)), out_(std::move(out)), pace_fps_(pace_fps) {
  if (!source_) throw std::invalid_argument("CaptureStage: null source");
  if (!out_) throw std::invalid_argument("CaptureStage: null buffer");
}

CaptureStage::~CaptureStage() {
  stop();
}

void CaptureStage::run(const StopToken& stop) {
  using Clock = std::chrono::steady_clock;

  const auto period = pace_fps_ > 0.0
      ? std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / pace_fps_))
      : Clock::duration::zero();
  auto next_due = Clock::now();

  LogInfo(name(), "reading from " + source_->describe());

  while (!stop.stop_requested()) {
    Frame f;
    if (!source_->read(f)) {
      LogInfo(name(), "source exhausted after " + std::to_string(written_.load()) + " frames");
      exhausted_.store(true, std::memory_order_release);
      // Wake watchers so they can notice they're caught up for good
      out_->notify_consumers();
      break;
    }

    out_->write(f.capture_time, std::move(f.image));
    written_.fetch_add(1, std::memory_order_relaxed);

    if (period > Clock::duration::zero()) {
      next_due += period;
      const auto now = Clock::now();
      if (next_due > now) {
        if (stop.wait_for(next_due - now)) break;
      } else {
        next_due = now;  // Fell behind, don't try to catch up with a burst
      }
    }
  }
}

} // namespace fwp
