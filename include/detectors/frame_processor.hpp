#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

#include "core/detections.hpp"
#include "core/frame.hpp"
#include "infra/fps_counter.hpp"

/*
    The per-frame processing contract.

    FrameProcessor is the only thing the Watcher and the SyncRunner know about: give it a timestamped frame, get
    back a processed frame and the frame's detection events. events is always a vector, empty when nothing was
    detected.

    Detector is the algorithm-specific step (motion, neural net, replayed log). AnnotatingProcessor wraps one and
    does the work every variant shares:
        - time since the previous processed frame (telemetry only)
        - the rolling FPS counter, driven by frame timestamps
        - the diagnostic overlay, drawn on a copy so the caller's frame is never touched
    then hands the copy to the detector.
*/

namespace fwp {

struct ProcessResult {
  cv::Mat frame;
  Detections events;
};

class FrameProcessor {
public:
  virtual ~FrameProcessor() = default;

  // Any exception means the processor's state can no longer be trusted
  virtual ProcessResult process_frame(TimePoint timestamp, const cv::Mat& frame) = 0;
};

class Detector {
public:
  virtual ~Detector() = default;

  // 'frame' is the untouched input. 'canvas' is the annotated copy that becomes the processed frame; a detector
  // may draw on it or replace it entirely
  virtual Detections detect(TimePoint timestamp, const cv::Mat& frame, cv::Mat& canvas) = 0;

  virtual const char* kind() const = 0;
};

class AnnotatingProcessor final : public FrameProcessor {
public:
  AnnotatingProcessor(std::string name,
                      std::unique_ptr<Detector> detector,
                      std::size_t fps_window = FpsCounter::kDefaultWindow,
                      TimePoint clock_start = std::chrono::steady_clock::now());

  ProcessResult process_frame(TimePoint timestamp, const cv::Mat& frame) override;

  // Safe to read from any thread
  double fps() const { return fps_.load(std::memory_order_relaxed); }
  double last_interval_s() const { return last_interval_s_.load(std::memory_order_relaxed); }
  std::uint64_t frames_processed() const { return processed_.load(std::memory_order_relaxed); }

  const std::string& name() const { return name_; }
  const Detector& detector() const { return *detector_; }

private:
  std::string name_;
  std::unique_ptr<Detector> detector_;

  FpsCounter counter_;
  std::optional<TimePoint> prev_timestamp_;

  std::atomic<double> fps_{0.0};
  std::atomic<double> last_interval_s_{0.0};
  std::atomic<std::uint64_t> processed_{0};
};

} // namespace fwp
