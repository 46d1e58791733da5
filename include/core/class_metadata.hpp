#pragma once

#include <map>
#include <string>

#include <opencv2/core.hpp>

/*
    Per-class display and tracking settings, keyed by the detector's class id. Shared by detectors (labels and box
    colors) and the tracker (colors, label layout, how long an unseen identity is remembered).
*/

namespace fwp {

struct ClassInfo {
  std::string label;
  cv::Scalar color{0, 255, 0};  // BGR
  float vert_offset{0.f};       // Label placement relative to the box, in box heights
  int memory_frames{-1};        // Frames an unseen track survives. < 0 uses the tracker default
};

using ClassMetadata = std::map<int, ClassInfo>;

inline std::string ClassLabel(const ClassMetadata& classes, int class_id) {
  const auto it = classes.find(class_id);
  if (it == classes.end()) return "unknown";
  return it->second.label;
}

inline cv::Scalar ClassColor(const ClassMetadata& classes, int class_id) {
  const auto it = classes.find(class_id);
  if (it == classes.end()) return cv::Scalar(0, 255, 0);
  return it->second.color;
}

} // namespace fwp
