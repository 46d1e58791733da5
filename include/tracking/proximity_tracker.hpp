#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "core/class_metadata.hpp"
#include "core/track.hpp"
#include "tracking/tracker.hpp"

/*
    ProximityTracker keeps identities alive across frames by centroid distance.

    Centroids are normalized by frame size, so distance_threshold is resolution independent (0.025 means 2.5% of
    the frame). A detection joins the nearest existing track of the same class that is closer than the threshold;
    leftovers start new tracks. A track that goes unmatched for longer than its class's memory_frames (or the
    tracker default) is dropped.

    detect() flags every pair of currently visible tracks of different classes whose boxes overlap.
*/

namespace fwp {

struct Collision {
  std::uint64_t a{0};
  std::uint64_t b{0};
};

class ProximityTracker final : public Tracker {
public:
  ProximityTracker(ClassMetadata classes,
                   float distance_threshold,
                   int default_memory_frames = 10,
                   bool collision_detection = true);

  // Throws std::invalid_argument on an empty frame
  void update(const cv::Mat& frame, const Detections& events) override;
  void detect(cv::Mat& frame) override;

  const std::vector<Track>& tracks() const { return tracks_; }
  const std::vector<Collision>& collisions() const { return collisions_; }

private:
  int MemoryFor(int class_id) const;

  ClassMetadata classes_;
  float distance_threshold_;
  int default_memory_frames_;
  bool collision_detection_;

  std::vector<Track> tracks_;
  std::vector<Collision> collisions_;
  std::uint64_t next_id_{1};
};

} // namespace fwp
