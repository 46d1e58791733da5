#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "detectors/frame_processor.hpp"
#include "infra/frame_buffer.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

/*
    A Watcher follows one FrameBuffer on its own thread and feeds every new frame, oldest first, through a
    FrameProcessor.

    Loop, per tick:
        - walk the cursor forward one slot at a time until it reaches the buffer's write cursor, skipping slots
          that are empty (buffer warming up) or already seen (producer lapped us), dispatching the rest
        - once caught up, wait briefly for the next write
        - every heartbeat_interval, report liveness whether or not anything was processed

    Dispatch is process_frame(), then the tracker (update, detect) if one is set, then the render sink if one
    is set. An exception out of the processor or the tracker ends the watcher for good: it is logged, kept as
    failure() and start() refuses to run again. A render sink exception is only logged.

    Watchers never coordinate with each other. Any number may follow the same buffer.
*/

namespace fwp {

class Tracker;
class RenderSink;

// A watcher ended by a failure reports Stopped; failure() tells the two apart
enum class WatcherState { Stopped, Running };

struct WatcherOptions {
  std::string name = "WatcherProcess";
  std::string window_name = "";  // Empty uses name
  std::chrono::milliseconds idle_wait{5};
  std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(60)};
  std::optional<std::size_t> start_cursor;  // Unset aligns to the write cursor at start()
};

// Maps the watcher config section, window_name from the visualization section
WatcherOptions MakeWatcherOptions(const WatcherConfig& cfg, const std::string& window_name = "");

class Watcher final : public Stage {
public:
  // Called with the watcher name and the buffer's cumulative frame count
  using HeartbeatFn = std::function<void(const std::string& name, std::uint64_t frame_count)>;

  Watcher(std::shared_ptr<FrameBuffer> buffer,
          std::shared_ptr<FrameProcessor> processor,
          WatcherOptions opts = {});
  ~Watcher() override;

  // Setters throw std::logic_error while the watcher is running
  void set_tracker(std::shared_ptr<Tracker> tracker);
  void set_render_sink(std::shared_ptr<RenderSink> sink);
  void set_heartbeat(HeartbeatFn fn);

  WatcherState state() const;

  // Slot the watcher last looked at
  std::size_t cursor() const { return cursor_.load(std::memory_order_acquire); }

  // Message of the failure that ended the watcher, if any
  std::optional<std::string> failure() const;

  const WatcherMetrics& metrics() const { return metrics_; }
  const WatcherOptions& options() const { return opts_; }

protected:
  void on_start() override;
  void on_stop_requested() override;
  void run(const StopToken& stop) override;

private:
  void Dispatch(const Frame& frame);
  void Render(const cv::Mat& image);
  void Fail(const std::string& what, std::size_t slot, std::uint64_t sequence_id);
  void MaybeHeartbeat(TimePoint& next_heartbeat);

  std::shared_ptr<FrameBuffer> buffer_;
  std::shared_ptr<FrameProcessor> processor_;
  std::shared_ptr<Tracker> tracker_;
  std::shared_ptr<RenderSink> sink_;
  HeartbeatFn heartbeat_;
  WatcherOptions opts_;

  std::optional<FrameCursor> frame_cursor_;
  std::atomic<std::size_t> cursor_{0};

  mutable std::mutex failure_mu_;
  std::optional<std::string> failure_;

  WatcherMetrics metrics_;
};

} // namespace fwp
