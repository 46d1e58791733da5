#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "core/config_loader.hpp"
#include "core/event_log.hpp"
#include "detectors/detector_factory.hpp"
#include "detectors/frame_processor.hpp"
#include "detectors/motion_detector.hpp"
#include "detectors/replay_detector.hpp"

namespace {
int g_failures = 0;

void check(bool condition, const std::string& message) {
  if (!condition) {
    ++g_failures;
    std::cerr << "[FAIL] " << message << "\n";
  }
}

using Clock = std::chrono::steady_clock;

fwp::ClassMetadata Classes() {
  fwp::ClassMetadata classes;
  classes[0] = fwp::ClassInfo{"forklift", cv::Scalar(55, 125, 225), 0.0f, -1};
  classes[1] = fwp::ClassInfo{"person", cv::Scalar(225, 125, 35), -0.22f, -1};
  return classes;
}

cv::Mat Black() { return cv::Mat(240, 320, CV_8UC3, cv::Scalar(0, 0, 0)); }

cv::Mat WithSquare(int x, int y) {
  cv::Mat m = Black();
  cv::rectangle(m, cv::Rect(x, y, 80, 80), cv::Scalar(255, 255, 255), cv::FILLED);
  return m;
}

// Reports nothing, counts calls
class NullDetector final : public fwp::Detector {
public:
  fwp::Detections detect(fwp::TimePoint, const cv::Mat&, cv::Mat&) override {
    ++calls;
    return {};
  }
  const char* kind() const override { return "null"; }
  int calls{0};
};

void test_overlay_on_copy_and_empty_events() {
  auto det = std::make_unique<NullDetector>();
  NullDetector* raw = det.get();
  fwp::AnnotatingProcessor proc("cam0", std::move(det), 2, Clock::time_point{});

  const cv::Mat input = Black();
  const fwp::ProcessResult r = proc.process_frame(Clock::time_point{} + std::chrono::milliseconds(50), input);

  check(r.events.empty(), "no detections gives an empty event list");
  check(raw->calls == 1, "detector called once per frame");
  check(cv::countNonZero(input.reshape(1)) == 0, "caller's frame is not drawn on");
  check(cv::countNonZero(r.frame.reshape(1)) > 0, "processed frame carries the diagnostic overlay");
  check(proc.frames_processed() == 1, "processed counter advances");
}

void test_fps_and_interval_from_timestamps() {
  fwp::AnnotatingProcessor proc("cam0", std::make_unique<NullDetector>(), 4, Clock::time_point{});
  auto ts = Clock::time_point{};
  for (int i = 0; i < 4; ++i) {
    ts += std::chrono::milliseconds(25);
    proc.process_frame(ts, Black());
  }
  check(std::fabs(proc.fps() - 40.0) < 1e-6, "fps follows frame timestamps");
  check(std::fabs(proc.last_interval_s() - 0.025) < 1e-9, "interval since previous frame is tracked");
}

void test_empty_frame_throws() {
  fwp::AnnotatingProcessor proc("cam0", std::make_unique<NullDetector>());
  bool threw = false;
  try {
    proc.process_frame(Clock::now(), cv::Mat());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  check(threw, "empty frame is a contract failure");
}

void test_motion_variant() {
  fwp::DetectorConfig cfg;
  cfg.kind = fwp::DetectorKind::Motion;
  auto proc = fwp::MakeFrameProcessor("motion", cfg, Classes());
  check(std::string(proc->detector().kind()) == "motion", "factory builds the motion variant");

  const auto t0 = Clock::now();
  const fwp::ProcessResult first = proc->process_frame(t0, Black());
  check(first.events.empty(), "first frame only primes the background");

  const fwp::ProcessResult second = proc->process_frame(t0 + std::chrono::milliseconds(33), WithSquare(120, 80));
  check(!second.events.empty(), "a new bright square is reported as motion");
  if (!second.events.empty()) {
    const fwp::DetectionEvent& e = second.events.front();
    check(e.label == "forklift", "motion events take the configured class label");
    check(e.region.x <= 120 && e.region.x + e.region.w >= 200, "region covers the square horizontally");
    check(e.region.y <= 80 && e.region.y + e.region.h >= 160, "region covers the square vertically");
  }
}

void test_motion_difference_mask_output() {
  fwp::MotionConfig cfg;
  cfg.full_detection_frame = false;
  fwp::AnnotatingProcessor proc("mask", std::make_unique<fwp::MotionDetector>(cfg, Classes()));

  const auto t0 = Clock::now();
  proc.process_frame(t0, Black());
  const fwp::ProcessResult r = proc.process_frame(t0 + std::chrono::milliseconds(33), WithSquare(40, 40));
  check(!r.frame.empty(), "mask output is a frame");
  check(r.frame.size() == cv::Size(320, 240), "mask keeps the input size");
}

void test_replay_variant() {
  namespace fs = std::filesystem;
  const fs::path path = fs::temp_directory_path() /
                        ("fwp_replay_" + std::to_string(Clock::now().time_since_epoch().count()) + ".yaml");

  fwp::EventLog log;
  log[2] = {fwp::DetectionEvent{1, "person", fwp::BBox{10, 20, 30, 40}, 0.9f}};
  fwp::SaveEventLog(path.string(), log);

  fwp::DetectorConfig cfg;
  cfg.kind = fwp::DetectorKind::ReplayLog;
  cfg.replay_log.path = path.string();
  auto proc = fwp::MakeFrameProcessor("replay", cfg, Classes());
  fs::remove(path);

  const auto t0 = Clock::now();
  const auto r1 = proc->process_frame(t0, Black());
  const auto r2 = proc->process_frame(t0 + std::chrono::milliseconds(10), Black());
  const auto r3 = proc->process_frame(t0 + std::chrono::milliseconds(20), Black());

  check(r1.events.empty(), "unlogged frame replays no events");
  check(r2.events.size() == 1, "logged frame replays its events");
  check(!r2.events.empty() && r2.events[0].label == "person", "replayed label kept");
  check(!r2.events.empty() && r2.events[0].region.w == 30.f, "replayed region kept");
  check(r3.events.empty(), "frames past the log replay nothing");
}

void test_unknown_and_unbuildable_variants() {
  bool threw = false;
  try {
    (void)fwp::ParseDetectorKind("optical_flow");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  check(threw, "unknown variant name is rejected");

  fwp::DetectorConfig cfg;
  cfg.kind = fwp::DetectorKind::ReplayLog;
  cfg.replay_log.path = "/nonexistent/detection_events.yaml";
  threw = false;
  try {
    (void)fwp::MakeDetector(cfg, Classes());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  check(threw, "missing replay log fails at construction");

  cfg.kind = fwp::DetectorKind::NeuralNet;
  cfg.neural_net.model_path = "/nonexistent/model.onnx";
  threw = false;
  try {
    (void)fwp::MakeDetector(cfg, Classes());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  check(threw, "missing model fails at construction");
}

} // namespace

int main() {
  test_overlay_on_copy_and_empty_events();
  test_fps_and_interval_from_timestamps();
  test_empty_frame_throws();
  test_motion_variant();
  test_motion_difference_mask_output();
  test_replay_variant();
  test_unknown_and_unbuildable_variants();

  if (g_failures != 0) {
    std::cerr << g_failures << " frame_processor check(s) failed\n";
    return 1;
  }
  std::cout << "frame_processor_test passed\n";
  return 0;
}
