#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/render_sink.hpp"
#include "detectors/frame_processor.hpp"
#include "infra/frame_buffer.hpp"
#include "stages/watcher.hpp"
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

bool WaitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

// Frames carry their own number in a single int pixel
void WriteNumbered(fwp::FrameBuffer& buf, int value) {
  buf.write(std::chrono::steady_clock::now(), cv::Mat(1, 1, CV_32SC1, cv::Scalar(value)));
}

class RecordingProcessor final : public fwp::FrameProcessor {
public:
  explicit RecordingProcessor(int fail_on = -1) : fail_on_(fail_on) {}

  fwp::ProcessResult process_frame(fwp::TimePoint, const cv::Mat& frame) override {
    const int value = frame.at<int>(0, 0);
    {
      std::lock_guard<std::mutex> lock(mu_);
      seen_.push_back(value);
    }
    if (value == fail_on_) throw std::runtime_error("bad frame " + std::to_string(value));

    fwp::ProcessResult out;
    out.frame = frame.clone();
    if (value % 2 == 0) out.events.push_back(fwp::DetectionEvent{0, "even", fwp::BBox{0, 0, 1, 1}, 1.f});
    return out;
  }

  std::vector<int> seen() const {
    std::lock_guard<std::mutex> lock(mu_);
    return seen_;
  }

  std::size_t count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return seen_.size();
  }

private:
  int fail_on_;
  mutable std::mutex mu_;
  std::vector<int> seen_;
};

class CountingTracker final : public fwp::Tracker {
public:
  void update(const cv::Mat&, const fwp::Detections& events) override {
    ++updates;
    total_events += static_cast<int>(events.size());
  }
  void detect(cv::Mat&) override { ++detects; }

  std::atomic<int> updates{0};
  std::atomic<int> detects{0};
  std::atomic<int> total_events{0};
};

class ThrowingSink final : public fwp::RenderSink {
public:
  void show(const std::string&, const cv::Mat&) override {
    ++calls;
    throw std::runtime_error("display gone");
  }
  std::atomic<int> calls{0};
};

fwp::WatcherOptions Options(const std::string& name) {
  fwp::WatcherOptions opts;
  opts.name = name;
  opts.idle_wait = 2ms;
  return opts;
}

void test_processes_in_write_order() {
  auto buf = std::make_shared<fwp::FrameBuffer>(128);
  auto proc = std::make_shared<RecordingProcessor>();
  auto tracker = std::make_shared<CountingTracker>();

  fwp::Watcher w(buf, proc, Options("ordered"));
  w.set_tracker(tracker);
  w.start();
  check(w.state() == fwp::WatcherState::Running, "watcher runs after start");

  for (int i = 0; i < 60; ++i) {
    WriteNumbered(*buf, i);
    if (i % 10 == 0) std::this_thread::sleep_for(1ms);
  }

  check(WaitUntil([&] { return proc->count() == 60; }), "all 60 frames processed");
  w.stop();

  const auto seen = proc->seen();
  bool in_order = seen.size() == 60;
  for (std::size_t i = 0; in_order && i < seen.size(); ++i) in_order = seen[i] == static_cast<int>(i);
  check(in_order, "frames processed once each, in write order");

  check(tracker->updates.load() == 60, "tracker updated for every processed frame");
  check(tracker->detects.load() == 60, "tracker detect follows every update");
  check(tracker->total_events.load() == 30, "tracker receives the processor's events");
  check(w.metrics().processed.load() == 60, "metrics count processed frames");
  check(w.state() == fwp::WatcherState::Stopped, "watcher reports stopped after stop");
}

void test_start_aligns_with_write_cursor() {
  auto buf = std::make_shared<fwp::FrameBuffer>(8);
  for (int i = 0; i < 8; ++i) WriteNumbered(*buf, i);

  auto proc = std::make_shared<RecordingProcessor>();
  fwp::Watcher w(buf, proc, Options("live"));
  w.start();

  std::this_thread::sleep_for(20ms);
  check(proc->count() == 0, "backlog written before start is ignored");

  WriteNumbered(*buf, 100);
  check(WaitUntil([&] { return proc->count() == 1; }), "first write after start is processed");
  w.stop();

  const auto seen = proc->seen();
  check(seen.size() == 1 && seen[0] == 100, "only the new frame is processed");
}

void test_stop_semantics() {
  auto buf = std::make_shared<fwp::FrameBuffer>(16);
  auto proc = std::make_shared<RecordingProcessor>();

  {
    fwp::Watcher never(buf, proc, Options("never_started"));
    never.stop();
    never.stop();
    check(never.state() == fwp::WatcherState::Stopped, "stop on a never-started watcher is a no-op");
  }

  fwp::Watcher w(buf, proc, Options("stopper"));
  w.start();
  for (int i = 0; i < 5; ++i) WriteNumbered(*buf, i);
  check(WaitUntil([&] { return proc->count() == 5; }), "frames processed before stop");

  w.stop();
  const std::size_t at_stop = proc->count();

  for (int i = 5; i < 10; ++i) WriteNumbered(*buf, i);
  std::this_thread::sleep_for(30ms);
  check(proc->count() == at_stop, "nothing is processed after stop returns");

  w.stop();
  check(w.state() == fwp::WatcherState::Stopped, "second stop is a no-op");

  bool threw = false;
  try {
    w.set_tracker(nullptr);
  } catch (const std::logic_error&) {
    threw = true;
  }
  check(!threw, "collaborators can be swapped while stopped");
}

void test_failure_is_terminal() {
  auto buf = std::make_shared<fwp::FrameBuffer>(128);
  for (int i = 1; i <= 60; ++i) WriteNumbered(*buf, i);

  auto proc = std::make_shared<RecordingProcessor>(42);
  fwp::WatcherOptions opts = Options("failing");
  opts.start_cursor = buf->capacity() - 1;

  fwp::Watcher w(buf, proc, opts);
  w.start();

  check(WaitUntil([&] { return w.failure().has_value() && w.state() == fwp::WatcherState::Stopped; }),
        "watcher stops on a throwing processor");

  const auto seen = proc->seen();
  check(!seen.empty() && seen.back() == 42, "frame 42 is the last one delivered");
  check(seen.size() == 42, "frames 1..42 delivered, nothing after");

  const auto failure = w.failure();
  check(failure.has_value(), "failure message is recorded");
  check(failure && failure->find("bad frame 42") != std::string::npos, "failure names the error");

  // More frames don't reach a failed watcher
  WriteNumbered(*buf, 61);
  std::this_thread::sleep_for(20ms);
  check(proc->count() == 42, "frame 43 onwards never delivered");

  bool threw = false;
  try {
    w.start();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  check(threw, "a failed watcher refuses to start again");
  w.stop();
}

void test_heartbeat() {
  auto buf = std::make_shared<fwp::FrameBuffer>(4);
  auto proc = std::make_shared<RecordingProcessor>();

  fwp::WatcherOptions opts = Options("beating");
  opts.heartbeat_interval = 10ms;
  fwp::Watcher w(buf, proc, opts);

  std::mutex mu;
  std::vector<std::string> names;
  std::atomic<std::uint64_t> last_count{0};
  w.set_heartbeat([&](const std::string& name, std::uint64_t frame_count) {
    std::lock_guard<std::mutex> lock(mu);
    names.push_back(name);
    last_count = frame_count;
  });

  WriteNumbered(*buf, 1);
  WriteNumbered(*buf, 2);
  w.start();

  check(WaitUntil([&] {
          std::lock_guard<std::mutex> lock(mu);
          return names.size() >= 2;
        }),
        "heartbeat fires repeatedly with no frames flowing");
  w.stop();

  std::lock_guard<std::mutex> lock(mu);
  check(!names.empty() && names.front() == "beating", "heartbeat carries the watcher name");
  check(last_count.load() == 2, "heartbeat carries the buffer's frame count");
}

// Takes a few milliseconds per frame, so a fast producer keeps it permanently behind
class SlowProcessor final : public fwp::FrameProcessor {
public:
  fwp::ProcessResult process_frame(fwp::TimePoint, const cv::Mat& frame) override {
    std::this_thread::sleep_for(3ms);
    ++processed;
    return fwp::ProcessResult{frame.clone(), {}};
  }
  std::atomic<int> processed{0};
};

void test_heartbeat_while_behind() {
  auto buf = std::make_shared<fwp::FrameBuffer>(64);
  auto proc = std::make_shared<SlowProcessor>();

  fwp::WatcherOptions opts = Options("overloaded");
  opts.heartbeat_interval = 20ms;
  fwp::Watcher w(buf, proc, opts);

  std::atomic<int> beats{0};
  w.set_heartbeat([&](const std::string&, std::uint64_t) { ++beats; });

  std::atomic_bool producing{true};
  std::thread producer([&] {
    int i = 0;
    while (producing) {
      WriteNumbered(*buf, i++);
      std::this_thread::sleep_for(200us);
    }
  });

  w.start();
  std::this_thread::sleep_for(1000ms);
  const int during_load = beats.load();
  producing = false;
  producer.join();
  w.stop();

  check(proc->processed.load() > 0, "slow watcher makes progress under load");
  // About 50 expected at a 20 ms interval; allow for a loaded test machine
  check(during_load >= 25, "heartbeat keeps its interval while the watcher is behind, got " +
                               std::to_string(during_load));
}

void test_render_failure_not_fatal() {
  auto buf = std::make_shared<fwp::FrameBuffer>(16);
  auto proc = std::make_shared<RecordingProcessor>();
  auto sink = std::make_shared<ThrowingSink>();

  fwp::Watcher w(buf, proc, Options("render"));
  w.set_render_sink(sink);
  w.start();

  bool threw = false;
  try {
    w.set_render_sink(nullptr);
  } catch (const std::logic_error&) {
    threw = true;
  }
  check(threw, "collaborators can't be swapped while running");

  for (int i = 0; i < 5; ++i) WriteNumbered(*buf, i);
  check(WaitUntil([&] { return proc->count() == 5; }), "processing continues past render failures");
  check(WaitUntil([&] { return w.metrics().render_failures.load() == 5; }), "every render failure is counted");
  check(w.state() == fwp::WatcherState::Running, "render failures don't stop the watcher");
  check(!w.failure().has_value(), "render failures aren't recorded as watcher failure");
  w.stop();
}

void test_independent_watchers() {
  auto buf = std::make_shared<fwp::FrameBuffer>(32);
  auto p1 = std::make_shared<RecordingProcessor>();
  auto p2 = std::make_shared<RecordingProcessor>(3);

  fwp::Watcher w1(buf, p1, Options("first"));
  fwp::Watcher w2(buf, p2, Options("second"));
  w1.start();
  w2.start();

  for (int i = 0; i < 10; ++i) WriteNumbered(*buf, i);

  check(WaitUntil([&] { return p1->count() == 10; }), "first watcher sees every frame");
  check(WaitUntil([&] { return w2.failure().has_value() && w2.state() == fwp::WatcherState::Stopped; }),
        "second watcher fails on its own");
  check(w1.state() == fwp::WatcherState::Running, "a failing watcher doesn't affect its neighbor");
  check(p2->count() == 4, "failing watcher stops at its bad frame");

  w1.stop();
  w2.stop();
}

} // namespace

int main() {
  test_processes_in_write_order();
  test_start_aligns_with_write_cursor();
  test_stop_semantics();
  test_failure_is_terminal();
  test_heartbeat();
  test_heartbeat_while_behind();
  test_render_failure_not_fatal();
  test_independent_watchers();

  if (g_failures != 0) {
    std::cerr << g_failures << " watcher check(s) failed\n";
    return 1;
  }
  std::cout << "watcher_test passed\n";
  return 0;
}
