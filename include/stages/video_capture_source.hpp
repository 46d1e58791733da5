#pragma once

#include <cstdint>
#include <string>

#include <opencv2/videoio.hpp>

#include "core/config.hpp"
#include "stages/frame_source.hpp"

namespace fwp {

// Camera, video file or stream read through cv::VideoCapture
class VideoCaptureSource final : public FrameSource {
public:
  // Opens cfg.path, or cfg.device_index when path is empty. Throws std::runtime_error if it can't be opened
  explicit VideoCaptureSource(const SourceConfig& cfg);

  bool read(Frame& out) override;
  std::string describe() const override;

  // Nominal rate reported by the backend, 0 if unknown
  double nominal_fps() const;

private:
  SourceConfig cfg_;
  cv::VideoCapture cap_;
  std::uint64_t next_id_{0};
};

} // namespace fwp
