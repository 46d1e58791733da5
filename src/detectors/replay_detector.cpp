#include "detectors/replay_detector.hpp"

#include <utility>

#include "apps/overlay.hpp"

namespace fwp {

ReplayDetector::ReplayDetector(EventLog log, ClassMetadata classes)
    : log_(std::move(log)), classes_(std::move(classes)) {}

Detections ReplayDetector::detect(TimePoint, const cv::Mat&, cv::Mat& canvas) {
  ++frame_index_;

  const auto it = log_.find(frame_index_);
  if (it == log_.end()) return {};

  Detections events = it->second;
  DrawDetections(canvas, events, classes_);
  return events;
}

} // namespace fwp
