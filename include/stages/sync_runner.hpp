#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "detectors/frame_processor.hpp"
#include "infra/stop_token.hpp"
#include "stages/frame_source.hpp"

/*
    SyncRunner drives a FrameProcessor from a finite FrameSource on the caller's thread, no buffer involved.
    Used for offline replay of recordings, where every frame is available and nothing has to be dropped for
    latency.

    Per frame read:
        skip filter -> optional rescale -> process_frame -> tracker -> capture (frames with events) -> render
        -> optional sleep
    The skip filter keeps one frame out of every skip_count + 1, discarding before any processing.
*/

namespace fwp {

class Tracker;
class RenderSink;
class CaptureWriter;

struct SyncOptions {
  int skip_count = 0;
  float scale_factor = 1.0f;
  std::chrono::milliseconds sleep{0};
  std::string window_name = "WatcherProcess";
};

struct SyncRunStats {
  std::uint64_t frames_read{0};
  std::uint64_t frames_kept{0};
  std::uint64_t frames_with_events{0};
  std::uint64_t render_failures{0};
};

class SyncRunner {
public:
  // Throws std::invalid_argument on negative skip_count or non-positive scale_factor
  SyncRunner(FrameSource& source, FrameProcessor& processor, SyncOptions opts = {});

  // Optional collaborators, not owned. nullptr disables
  void set_tracker(Tracker* tracker) { tracker_ = tracker; }
  void set_render_sink(RenderSink* sink) { sink_ = sink; }
  void set_capture(CaptureWriter* capture) { capture_ = capture; }

  // Runs until the source is exhausted or stop is requested. Processor, tracker and capture exceptions propagate,
  // render sink exceptions are logged and counted
  SyncRunStats run(const StopToken& stop = {});

  // Skip filter, one call per frame read. True if the frame should be processed
  bool admit();

  const SyncRunStats& stats() const { return stats_; }

private:
  FrameSource& source_;
  FrameProcessor& processor_;
  SyncOptions opts_;

  Tracker* tracker_{nullptr};
  RenderSink* sink_{nullptr};
  CaptureWriter* capture_{nullptr};

  int skip_counter_{0};
  SyncRunStats stats_;
};

} // namespace fwp
