#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "infra/frame_buffer.hpp"
#include "stages/frame_source.hpp"
#include "stages/stage.hpp"

namespace fwp {

// Producer thread: reads a FrameSource into a FrameBuffer until the source runs dry or a stop is requested.
// pace_fps > 0 throttles reading, for files that would otherwise be read as fast as they decode
class CaptureStage final : public Stage {
public:
  CaptureStage(std::unique_ptr<FrameSource> source, std::shared_ptr<FrameBuffer> out, double pace_fps = 0.0);
  ~CaptureStage() override;

  // True once the source reported end of stream
  bool exhausted() const { return exhausted_.load(std::memory_order_acquire); }

  std::uint64_t frames_written() const { return written_.load(std::memory_order_relaxed); }

protected:
  void run(const StopToken& stop) override;

private:
  std::unique_ptr<FrameSource> source_;
  std::shared_ptr<FrameBuffer> out_;
  double pace_fps_;

  std::atomic_bool exhausted_{false};
  std::atomic<std::uint64_t> written_{0};
};

} // namespace fwp
