#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fwp {

// Pixel-space region, top-left corner plus size
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};
};

// A singular detection event: what was seen, where, and how sure the detector is
struct DetectionEvent {
  std::int32_t class_id{-1};
  std::string label;
  BBox region;
  float confidence{0.f};
};

// Everything a detector reported for one frame, in detector order. Empty means "no detections"
using Detections = std::vector<DetectionEvent>;

} // namespace fwp
