#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/class_metadata.hpp"
#include "core/detections.hpp"
#include "core/track.hpp"

/*
    Drawing helpers shared by the frame processor, the detectors and the tracker.

    DrawDiagnosticOverlay is stamped on every processed frame: a small marker in the top left corner plus
    "<watcher name> <fps> FPS" next to it, so any window or saved frame shows which watcher produced it and how
    fast it was running.
*/

namespace fwp {

cv::Rect ToRect(const BBox& b);

// "<name> 12.3 FPS"
std::string FormatFps(const std::string& name, double fps);

void DrawDiagnosticOverlay(cv::Mat& bgr, const std::string& name, double fps);

// One box per event, colored by class, with "<label> <confidence>" above it
void DrawDetections(cv::Mat& bgr, const Detections& events, const ClassMetadata& classes);

// Tracked identities: "<label> #<id>" placed by the class's vert_offset. Colliding tracks are drawn in red
void DrawTracks(cv::Mat& bgr, const std::vector<Track>& tracks, const ClassMetadata& classes);

} // namespace fwp
