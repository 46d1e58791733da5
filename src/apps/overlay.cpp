#include "apps/overlay.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace fwp {

static constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;
static constexpr double kTextScale = 0.5;

// Positions and colors of the diagnostic marker/text, tuned for frames down to ~320px wide
static const cv::Point kMarkerCenter(8, 12);
static constexpr int kMarkerRadius = 4;
static const cv::Scalar kMarkerColor(10, 40, 200);
static const cv::Point kTextOrigin(17, 16);
static const cv::Scalar kTextColor(150, 120, 50);

static const cv::Scalar kCollisionColor(0, 0, 255);

cv::Rect ToRect(const BBox& b) {
  return cv::Rect(static_cast<int>(std::lround(b.x)), static_cast<int>(std::lround(b.y)),
                  static_cast<int>(std::lround(b.w)), static_cast<int>(std::lround(b.h)));
}

std::string FormatFps(const std::string& name, double fps) {
  std::ostringstream oss;
  oss << name << " " << std::fixed << std::setprecision(1) << fps << " FPS";
  return oss.str();
}

void DrawDiagnosticOverlay(cv::Mat& bgr, const std::string& name, double fps) {
  if (bgr.empty()) return;
  cv::circle(bgr, kMarkerCenter, kMarkerRadius, kMarkerColor, 2);
  cv::putText(bgr, FormatFps(name, fps), kTextOrigin, kFont, kTextScale, kTextColor, 1);
}

// Text above the box, pushed inside the frame when the box touches the top edge
static void PutLabel(cv::Mat& bgr, const std::string& text, cv::Point at, const cv::Scalar& color) {
  int baseline = 0;
  const cv::Size ts = cv::getTextSize(text, kFont, 0.45, 1, &baseline);
  at.y = std::max(at.y, ts.height + 2);
  at.x = std::max(0, std::min(at.x, bgr.cols - ts.width));
  cv::putText(bgr, text, at, kFont, 0.45, color, 1, cv::LINE_AA);
}

void DrawDetections(cv::Mat& bgr, const Detections& events, const ClassMetadata& classes) {
  if (bgr.empty()) return;
  for (const auto& e : events) {
    const cv::Rect r = ToRect(e.region) & cv::Rect(0, 0, bgr.cols, bgr.rows);
    if (r.area() <= 0) continue;

    const cv::Scalar color = ClassColor(classes, e.class_id);
    cv::rectangle(bgr, r, color, 2);

    std::ostringstream text;
    text << (e.label.empty() ? ClassLabel(classes, e.class_id) : e.label) << " "
         << std::fixed << std::setprecision(2) << e.confidence;
    PutLabel(bgr, text.str(), cv::Point(r.x, r.y - 4), color);
  }
}

void DrawTracks(cv::Mat& bgr, const std::vector<Track>& tracks, const ClassMetadata& classes) {
  if (bgr.empty()) return;
  for (const auto& t : tracks) {
    if (t.missed_frames > 0) continue;  // Only identities seen this frame

    const cv::Rect r = ToRect(t.region) & cv::Rect(0, 0, bgr.cols, bgr.rows);
    if (r.area() <= 0) continue;

    const cv::Scalar color = t.colliding ? kCollisionColor : ClassColor(classes, t.class_id);
    cv::rectangle(bgr, r, color, t.colliding ? 3 : 1);

    float vert_offset = 0.f;
    const auto it = classes.find(t.class_id);
    if (it != classes.end()) vert_offset = it->second.vert_offset;

    const int y = r.y - 4 + static_cast<int>(vert_offset * static_cast<float>(r.height));
    PutLabel(bgr, ClassLabel(classes, t.class_id) + " #" + std::to_string(t.id), cv::Point(r.x, y), color);
  }
}

} // namespace fwp
