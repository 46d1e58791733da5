#include "tracking/proximity_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "apps/overlay.hpp"

namespace fwp {

namespace {

struct Candidate {
  float dist;
  std::size_t track;
  std::size_t event;
};

bool Visible(const Track& t) { return t.missed_frames == 0; }

} // namespace

ProximityTracker::ProximityTracker(ClassMetadata classes,
                                   float distance_threshold,
                                   int default_memory_frames,
                                   bool collision_detection)
    : classes_(std::move(classes)),
      distance_threshold_(distance_threshold),
      default_memory_frames_(default_memory_frames),
      collision_detection_(collision_detection) {
  if (distance_threshold_ <= 0.f) throw std::invalid_argument("distance_threshold must be > 0");
}

int ProximityTracker::MemoryFor(int class_id) const {
  const auto it = classes_.find(class_id);
  if (it != classes_.end() && it->second.memory_frames >= 0) return it->second.memory_frames;
  return default_memory_frames_;
}

void ProximityTracker::update(const cv::Mat& frame, const Detections& events) {
  if (frame.empty()) throw std::invalid_argument("ProximityTracker::update: empty frame");

  const float fw = static_cast<float>(frame.cols);
  const float fh = static_cast<float>(frame.rows);

  for (auto& t : tracks_) {
    t.age_frames += 1;
    t.missed_frames += 1;
  }

  std::vector<float> ecx(events.size());
  std::vector<float> ecy(events.size());
  for (std::size_t i = 0; i < events.size(); ++i) {
    const BBox& r = events[i].region;
    ecx[i] = (r.x + r.w * 0.5f) / fw;
    ecy[i] = (r.y + r.h * 0.5f) / fh;
  }

  // Every same-class pair under the threshold, closest first
  std::vector<Candidate> candidates;
  for (std::size_t ti = 0; ti < tracks_.size(); ++ti) {
    for (std::size_t ei = 0; ei < events.size(); ++ei) {
      if (tracks_[ti].class_id != events[ei].class_id) continue;
      const float d = std::hypot(tracks_[ti].cx - ecx[ei], tracks_[ti].cy - ecy[ei]);
      if (d < distance_threshold_) candidates.push_back({d, ti, ei});
    }
  }
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate& a, const Candidate& b) { return a.dist < b.dist; });

  std::vector<bool> track_used(tracks_.size(), false);
  std::vector<bool> event_used(events.size(), false);

  for (const auto& c : candidates) {
    if (track_used[c.track] || event_used[c.event]) continue;
    track_used[c.track] = true;
    event_used[c.event] = true;

    Track& t = tracks_[c.track];
    const DetectionEvent& e = events[c.event];
    t.region = e.region;
    t.confidence = e.confidence;
    t.cx = ecx[c.event];
    t.cy = ecy[c.event];
    t.hits += 1;
    t.missed_frames = 0;
  }

  for (std::size_t ei = 0; ei < events.size(); ++ei) {
    if (event_used[ei]) continue;

    Track t;
    t.id = next_id_++;
    t.class_id = events[ei].class_id;
    t.confidence = events[ei].confidence;
    t.region = events[ei].region;
    t.cx = ecx[ei];
    t.cy = ecy[ei];
    t.age_frames = 1;
    t.hits = 1;
    tracks_.push_back(t);
  }

  tracks_.erase(std::remove_if(tracks_.begin(), tracks_.end(),
                               [this](const Track& t) { return t.missed_frames > MemoryFor(t.class_id); }),
                tracks_.end());
}

void ProximityTracker::detect(cv::Mat& frame) {
  collisions_.clear();
  for (auto& t : tracks_) t.colliding = false;

  if (collision_detection_) {
    for (std::size_t i = 0; i < tracks_.size(); ++i) {
      if (!Visible(tracks_[i])) continue;
      for (std::size_t j = i + 1; j < tracks_.size(); ++j) {
        if (!Visible(tracks_[j])) continue;
        if (tracks_[i].class_id == tracks_[j].class_id) continue;

        const cv::Rect overlap = ToRect(tracks_[i].region) & ToRect(tracks_[j].region);
        if (overlap.area() <= 0) continue;

        tracks_[i].colliding = true;
        tracks_[j].colliding = true;
        collisions_.push_back({tracks_[i].id, tracks_[j].id});
      }
    }
  }

  if (!frame.empty()) DrawTracks(frame, tracks_, classes_);
}

} // namespace fwp
