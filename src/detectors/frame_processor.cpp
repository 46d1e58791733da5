#include "detectors/frame_processor.hpp"

#include <stdexcept>
#include <utility>

#include "apps/overlay.hpp"

namespace fwp {

AnnotatingProcessor::AnnotatingProcessor(std::string name,
                                         std::unique_ptr<Detector> detector,
                                         std::size_t fps_window,
                                         TimePoint clock_start)
    : name_(std::move(name)), detector_(std::move(detector)), counter_(fps_window, clock_start) {
  if (!detector_) throw std::invalid_argument("AnnotatingProcessor '" + name_ + "' needs a detector");
}

ProcessResult AnnotatingProcessor::process_frame(TimePoint timestamp, const cv::Mat& frame) {
  if (frame.empty()) throw std::invalid_argument(name_ + ": empty frame");

  if (prev_timestamp_) {
    last_interval_s_.store(std::chrono::duration<double>(timestamp - *prev_timestamp_).count(),
                           std::memory_order_relaxed);
  }
  prev_timestamp_ = timestamp;

  const double fps = counter_.tick(timestamp);
  fps_.store(fps, std::memory_order_relaxed);

  ProcessResult out;
  out.frame = frame.clone();
  DrawDiagnosticOverlay(out.frame, name_, fps);

  out.events = detector_->detect(timestamp, frame, out.frame);

  processed_.fetch_add(1, std::memory_order_relaxed);
  return out;
}

} // namespace fwp
