#pragma once

#include <opencv2/core.hpp>

#include "core/class_metadata.hpp"
#include "core/config.hpp"
#include "detectors/frame_processor.hpp"

namespace fwp {

// Frame differencing against a running-average background. The first frame only primes the background
class MotionDetector final : public Detector {
public:
  MotionDetector(MotionConfig cfg, ClassMetadata classes);

  Detections detect(TimePoint timestamp, const cv::Mat& frame, cv::Mat& canvas) override;
  const char* kind() const override { return "motion"; }

private:
  MotionConfig cfg_;
  ClassMetadata classes_;
  cv::Mat kernel_;
  cv::Mat background_;  // CV_32F, at working scale
};

} // namespace fwp
