#include "detectors/motion_detector.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <utility>
#include <vector>

#include "apps/overlay.hpp"

namespace fwp {

MotionDetector::MotionDetector(MotionConfig cfg, ClassMetadata classes)
    : cfg_(std::move(cfg)), classes_(std::move(classes)) {
  kernel_ = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(cfg_.dilation_kernel_size, cfg_.dilation_kernel_size));
}

static cv::Mat ToGray(const cv::Mat& frame) {
  cv::Mat gray;
  if (frame.channels() == 3) {
    cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
  } else if (frame.channels() == 4) {
    cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = frame.clone();
  }
  return gray;
}

Detections MotionDetector::detect(TimePoint, const cv::Mat& frame, cv::Mat& canvas) {
  Detections events;

  cv::Mat gray = ToGray(frame);
  const double s = cfg_.scale_factor;
  if (s != 1.0) cv::resize(gray, gray, cv::Size(), s, s, cv::INTER_AREA);
  cv::GaussianBlur(gray, gray, cv::Size(cfg_.gaussian_blur_size, cfg_.gaussian_blur_size), 0);

  // Resolution changed (or first frame): restart the background model
  if (background_.empty() || background_.size() != gray.size()) {
    gray.convertTo(background_, CV_32F);
    return events;
  }

  cv::Mat bg8;
  cv::convertScaleAbs(background_, bg8);

  cv::Mat mask;
  cv::absdiff(gray, bg8, mask);
  cv::threshold(mask, mask, cfg_.threshold * 255.0, 255, cv::THRESH_BINARY);
  cv::dilate(mask, mask, kernel_);

  cv::accumulateWeighted(gray, background_, cfg_.memory);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  const double inv = 1.0 / s;
  const double min_area_scaled = static_cast<double>(cfg_.min_area) * s * s;
  const std::string label = classes_.count(cfg_.class_id) ? ClassLabel(classes_, cfg_.class_id) : "motion";

  for (const auto& c : contours) {
    const double area = cv::contourArea(c);
    if (area < min_area_scaled) continue;

    const cv::Rect r = cv::boundingRect(c);

    DetectionEvent e;
    e.class_id = cfg_.class_id;
    e.label = label;
    e.region.x = static_cast<float>(r.x * inv);
    e.region.y = static_cast<float>(r.y * inv);
    e.region.w = static_cast<float>(r.width * inv);
    e.region.h = static_cast<float>(r.height * inv);
    // Share of the box that actually moved
    e.confidence = static_cast<float>(std::min(1.0, area / std::max(1.0, static_cast<double>(r.area()))));
    events.push_back(std::move(e));
  }

  // Largest regions first
  std::sort(events.begin(), events.end(), [](const DetectionEvent& a, const DetectionEvent& b) {
    return a.region.w * a.region.h > b.region.w * b.region.h;
  });

  if (!cfg_.full_detection_frame) {
    cv::Mat full_mask;
    cv::resize(mask, full_mask, canvas.size(), 0, 0, cv::INTER_NEAREST);
    if (canvas.channels() == 3) {
      cv::cvtColor(full_mask, canvas, cv::COLOR_GRAY2BGR);
    } else {
      canvas = full_mask;
    }
  }
  DrawDetections(canvas, events, classes_);

  return events;
}

} // namespace fwp
