#include "stages/video_capture_source.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "infra/log.hpp"

namespace fwp {

VideoCaptureSource::VideoCaptureSource(const SourceConfig& cfg) : cfg_(cfg) {
  // cap_ can be a live device, a recording or a stream URL
  if (cfg_.path.empty()) {
    cap_.open(cfg_.device_index);
  } else {
    cap_.open(cfg_.path);
  }

  if (!cap_.isOpened()) {
    throw std::runtime_error("Failed to open video source: " + describe());
  }

  if (cfg_.width > 0) cap_.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
  if (cfg_.height > 0) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
  if (cfg_.fps > 0) cap_.set(cv::CAP_PROP_FPS, cfg_.fps);
}

bool VideoCaptureSource::read(Frame& out) {
  cv::Mat img;

  if (!cap_.read(img) || img.empty()) {
    // Only files can be rewound
    if (!cfg_.loop || cfg_.path.empty()) return false;

    LogInfo("source", "rewinding " + cfg_.path);
    cap_.set(cv::CAP_PROP_POS_FRAMES, 0);
    if (!cap_.read(img) || img.empty()) return false;
  }

  out.capture_time = std::chrono::steady_clock::now();
  out.sequence_id = next_id_++;
  out.image = std::move(img);
  return true;
}

std::string VideoCaptureSource::describe() const {
  if (cfg_.path.empty()) return "device " + std::to_string(cfg_.device_index);
  return cfg_.path;
}

double VideoCaptureSource::nominal_fps() const {
  return cap_.get(cv::CAP_PROP_FPS);
}

} // namespace fwp
