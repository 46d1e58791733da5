#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

#include <opencv2/core.hpp>

/*
    Defines the structure for a singular frame in a video stream
*/

namespace fwp {

using TimePoint = std::chrono::steady_clock::time_point;

struct Frame {
  // Monotonic timestamp when frame was captured
  TimePoint capture_time;

  // Frame sequence number (monotonic). The FrameBuffer assigns its own on write
  std::uint64_t sequence_id{0};

  // Image data (shared, ref-counted)
  cv::Mat image;
};

// Frames are produced once and then only read, by any number of consumers
using FramePtr = std::shared_ptr<const Frame>;

} // namespace fwp
