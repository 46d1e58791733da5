#pragma once

#include <cstdint>

#include "core/class_metadata.hpp"
#include "core/event_log.hpp"
#include "detectors/frame_processor.hpp"

namespace fwp {

// Replays a recorded event log: the n-th frame it sees (1-based) gets the events logged for frame n, or none.
// Lets tracker and overlay work be repeated without re-running an expensive detector
class ReplayDetector final : public Detector {
public:
  ReplayDetector(EventLog log, ClassMetadata classes);

  Detections detect(TimePoint timestamp, const cv::Mat& frame, cv::Mat& canvas) override;
  const char* kind() const override { return "replay_log"; }

  std::uint64_t frames_seen() const { return frame_index_; }
  std::size_t logged_frames() const { return log_.size(); }

private:
  EventLog log_;
  ClassMetadata classes_;
  std::uint64_t frame_index_{0};
};

} // namespace fwp
