#pragma once

#include <opencv2/core.hpp>

#include "core/detections.hpp"

namespace fwp {

// Downstream consumer of detection events. Both calls receive the processed frame; detect() may draw on it.
// An exception from either call is treated by the watcher like a processor failure
class Tracker {
public:
  virtual ~Tracker() = default;

  virtual void update(const cv::Mat& frame, const Detections& events) = 0;
  virtual void detect(cv::Mat& frame) = 0;
};

} // namespace fwp
