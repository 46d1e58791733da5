#pragma once

#include <cstdint>

#include "core/detections.hpp"

namespace fwp {

// One identity maintained by the tracker across frames
struct Track {
  std::uint64_t id{0};
  int class_id{-1};
  float confidence{0.f};

  BBox region;        // Last matched region, pixels
  float cx{0.f};      // Centroid, normalized to frame width
  float cy{0.f};      // Centroid, normalized to frame height

  int age_frames{0};
  int hits{0};
  int missed_frames{0};
  bool colliding{false};
};

} // namespace fwp
