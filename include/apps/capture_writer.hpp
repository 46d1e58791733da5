#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include "core/detections.hpp"
#include "core/event_log.hpp"

/*
    Training-data capture. For each saved frame it writes into output_dir:
        frame_<n>.jpeg      the frame as it reached the detector
        frame_<n>.bb.jpeg   the annotated frame
        frame_<n>.yaml      that frame's events
    close() adds detection_events.yaml with every saved frame's events, loadable by the replay_log detector.
*/

namespace fwp {

class CaptureWriter {
public:
  static constexpr const char* kEventLogName = "detection_events.yaml";

  // Creates output_dir if needed. Throws std::runtime_error if it can't
  explicit CaptureWriter(std::string output_dir);
  ~CaptureWriter();

  CaptureWriter(const CaptureWriter&) = delete;
  CaptureWriter& operator=(const CaptureWriter&) = delete;

  // Throws std::runtime_error if any file can't be written
  void save(std::uint64_t frame_index, const cv::Mat& raw, const cv::Mat& annotated, const Detections& events);

  // Writes (or rewrites) the batch event log with every frame saved so far
  void close();

  const EventLog& events() const { return log_; }
  const std::string& output_dir() const { return dir_; }

private:
  std::string Path(const std::string& file) const;

  std::string dir_;
  EventLog log_;
  bool dirty_{false};
};

} // namespace fwp
