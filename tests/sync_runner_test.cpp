#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/capture_writer.hpp"
#include "core/event_log.hpp"
#include "detectors/frame_processor.hpp"
#include "infra/stop_token.hpp"
#include "stages/frame_source.hpp"
#include "stages/sync_runner.hpp"
#include "stages/video_capture_source.hpp"
#include "tracking/tracker.hpp"

namespace {
int g_failures = 0;

void check(bool condition, const std::string& message) {
  if (!condition) {
    ++g_failures;
    std::cerr << "[FAIL] " << message << "\n";
  }
}

using namespace std::chrono_literals;

// Finite source of 16x16 frames numbered 1..count in the blue channel of pixel (0, 0)
class CountingSource final : public fwp::FrameSource {
public:
  explicit CountingSource(int count) : count_(count) {}

  bool read(fwp::Frame& out) override {
    if (next_ > count_) return false;
    out.image = cv::Mat(16, 16, CV_8UC3, cv::Scalar(0, 0, 0));
    out.image.at<cv::Vec3b>(0, 0)[0] = static_cast<unsigned char>(next_);
    out.capture_time = fwp::TimePoint{} + std::chrono::milliseconds(40 * next_);
    out.sequence_id = static_cast<std::uint64_t>(next_);
    ++next_;
    return true;
  }

  std::string describe() const override { return "counting source"; }

private:
  int count_;
  int next_{1};
};

class RecordingProcessor final : public fwp::FrameProcessor {
public:
  fwp::ProcessResult process_frame(fwp::TimePoint, const cv::Mat& frame) override {
    const int value = frame.at<cv::Vec3b>(0, 0)[0];
    seen.push_back(value);
    sizes.push_back(frame.size());

    fwp::ProcessResult out;
    out.frame = frame.clone();
    if (value % 2 == 0) out.events.push_back(fwp::DetectionEvent{0, "even", fwp::BBox{1, 1, 4, 4}, 0.5f});
    return out;
  }

  std::vector<int> seen;
  std::vector<cv::Size> sizes;
};

class CountingTracker final : public fwp::Tracker {
public:
  void update(const cv::Mat&, const fwp::Detections& events) override {
    ++updates;
    events_seen += static_cast<int>(events.size());
  }
  void detect(cv::Mat&) override { ++detects; }

  int updates{0};
  int detects{0};
  int events_seen{0};
};

void test_skip_cadence() {
  for (int s = 0; s <= 4; ++s) {
    CountingSource source(30);
    RecordingProcessor proc;
    fwp::SyncOptions opts;
    opts.skip_count = s;

    fwp::SyncRunner runner(source, proc, opts);
    const fwp::SyncRunStats stats = runner.run();

    const std::string tag = "skip_count " + std::to_string(s) + ": ";
    check(stats.frames_read == 30, tag + "every frame is read");
    check(stats.frames_kept == static_cast<std::uint64_t>(30 / (s + 1)), tag + "1 of every S+1 frames kept");
    check(proc.seen.size() == stats.frames_kept, tag + "only kept frames reach the processor");

    bool cadence = true;
    for (std::size_t i = 0; i < proc.seen.size(); ++i) {
      cadence = cadence && proc.seen[i] == static_cast<int>((i + 1) * static_cast<std::size_t>(s + 1));
    }
    check(cadence, tag + "kept frames are every (S+1)-th");
  }
}

void test_admit_pattern() {
  CountingSource source(0);
  RecordingProcessor proc;
  fwp::SyncOptions opts;
  opts.skip_count = 2;
  fwp::SyncRunner runner(source, proc, opts);

  const bool expected[] = {false, false, true, false, false, true};
  bool ok = true;
  for (bool e : expected) ok = ok && runner.admit() == e;
  check(ok, "skip filter discards two then keeps one");
}

void test_exhaustion_and_tracker() {
  CountingSource source(10);
  RecordingProcessor proc;
  CountingTracker tracker;

  fwp::SyncRunner runner(source, proc);
  runner.set_tracker(&tracker);
  const fwp::SyncRunStats stats = runner.run();

  check(stats.frames_read == 10, "run ends cleanly at source exhaustion");
  check(stats.frames_with_events == 5, "even frames carry events");
  check(tracker.updates == 10 && tracker.detects == 10, "tracker called for every kept frame");
  check(tracker.events_seen == 5, "tracker receives the events");
}

void test_rescale() {
  CountingSource source(2);
  RecordingProcessor proc;
  fwp::SyncOptions opts;
  opts.scale_factor = 0.5f;

  fwp::SyncRunner runner(source, proc, opts);
  runner.run();
  check(proc.sizes.size() == 2 && proc.sizes[0] == cv::Size(8, 8), "frames rescaled before processing");
}

void test_capture_frames_with_events() {
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path() /
                       ("fwp_capture_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));

  {
    CountingSource source(4);
    RecordingProcessor proc;
    fwp::CaptureWriter capture(dir.string());

    fwp::SyncRunner runner(source, proc);
    runner.set_capture(&capture);
    runner.run();
    capture.close();
  }

  check(fs::exists(dir / "frame_2.jpeg"), "raw frame saved for a frame with events");
  check(fs::exists(dir / "frame_2.bb.jpeg"), "annotated frame saved");
  check(fs::exists(dir / "frame_2.yaml"), "per-frame events saved");
  check(!fs::exists(dir / "frame_1.jpeg"), "frames without events are not saved");
  check(fs::exists(dir / fwp::CaptureWriter::kEventLogName), "batch event log written on close");

  const fwp::EventLog log = fwp::LoadEventLog((dir / fwp::CaptureWriter::kEventLogName).string());
  check(log.size() == 2 && log.count(2) && log.count(4), "batch log keyed by processed frame index");

  fs::remove_all(dir);
}

void test_stop_interrupts_sleep() {
  CountingSource source(100);
  RecordingProcessor proc;
  fwp::SyncOptions opts;
  opts.sleep = 10s;

  fwp::StopSource stop;
  std::thread stopper([&] {
    std::this_thread::sleep_for(20ms);
    stop.request_stop();
  });

  fwp::SyncRunner runner(source, proc, opts);
  const auto t0 = std::chrono::steady_clock::now();
  const fwp::SyncRunStats stats = runner.run(stop.token());
  stopper.join();

  check(std::chrono::steady_clock::now() - t0 < 5s, "stop cuts the inter-frame sleep short");
  check(stats.frames_kept == 1, "no further frames after stop");
}

void test_invalid_options() {
  CountingSource source(1);
  RecordingProcessor proc;
  fwp::SyncOptions opts;
  opts.skip_count = -1;

  bool threw = false;
  try {
    fwp::SyncRunner runner(source, proc, opts);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  check(threw, "negative skip_count rejected");
}

void test_missing_video_file() {
  fwp::SourceConfig cfg;
  cfg.path = (std::filesystem::temp_directory_path() / "fwp_no_such_video.mp4").string();
  std::filesystem::remove(cfg.path);

  bool threw = false;
  try {
    fwp::VideoCaptureSource source(cfg);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find(cfg.path) != std::string::npos;
  }
  check(threw, "unopenable video file rejected with its path");
}

} // namespace

int main() {
  test_skip_cadence();
  test_admit_pattern();
  test_exhaustion_and_tracker();
  test_rescale();
  test_capture_frames_with_events();
  test_stop_interrupts_sleep();
  test_invalid_options();
  test_missing_video_file();

  if (g_failures != 0) {
    std::cerr << g_failures << " sync_runner check(s) failed\n";
    return 1;
  }
  std::cout << "sync_runner_test passed\n";
  return 0;
}
