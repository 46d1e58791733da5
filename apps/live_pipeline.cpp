#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <utility>

// Utilities
#include "core/config_loader.hpp"
#include "infra/log.hpp"
#include "infra/stop_token.hpp"

// Resources
#include "infra/frame_buffer.hpp"
#include "infra/latest_store.hpp"
#include "apps/render_sink.hpp"

// Processing
#include "detectors/detector_factory.hpp"
#include "tracking/proximity_tracker.hpp"

// Stages
#include "stages/capture_stage.hpp"
#include "stages/video_capture_source.hpp"
#include "stages/watcher.hpp"

#include <opencv2/highgui.hpp>  // cv::namedWindow, cv::imshow, cv::waitKey

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

// live_pipeline.cpp runs the system in async mode:
// a capture thread fills the frame buffer, a watcher thread follows it, the main thread shows the result

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    fwp::AppConfig cfg = fwp::LoadConfigFromYamlFile(cfg_path);
    fwp::LogInfo("main", "loaded config " + cfg_path);

    std::signal(SIGINT, HandleSigint);

    fwp::StopSource global_stop;

    // Resources shared between stages
    auto buffer = std::make_shared<fwp::FrameBuffer>(cfg.buffer.capacity);
    auto display_store = std::make_shared<fwp::LatestStore<fwp::RenderFrame>>();

    // Files are paced at their configured (else nominal) rate, live devices deliver at their own
    auto source = std::make_unique<fwp::VideoCaptureSource>(cfg.source);
    double pace_fps = 0.0;
    if (!cfg.source.path.empty()) {
      pace_fps = cfg.source.fps > 0 ? static_cast<double>(cfg.source.fps) : source->nominal_fps();
    }
    fwp::CaptureStage capture_stage(std::move(source), buffer, pace_fps);

    std::shared_ptr<fwp::FrameProcessor> processor = fwp::MakeFrameProcessor(
        cfg.watcher.name, cfg.detector, cfg.classes, static_cast<std::size_t>(cfg.watcher.fps_window));

    fwp::Watcher watcher(buffer, processor, fwp::MakeWatcherOptions(cfg.watcher, cfg.visualization.window_name));
    if (cfg.tracker.enabled) {
      watcher.set_tracker(std::make_shared<fwp::ProximityTracker>(
          cfg.classes, cfg.tracker.distance_threshold, cfg.tracker.memory_frames, cfg.tracker.collision_detection));
    }
    if (cfg.visualization.enabled) {
      watcher.set_render_sink(std::make_shared<fwp::LatestFrameSink>(display_store));
    }

    // Consumers first, so the watcher's cursor is in place before the first frame lands
    watcher.start(global_stop.token());
    capture_stage.start(global_stop.token());

    //UI (must be on main thread on MacOS)
    const std::string window = watcher.options().window_name;
    if (cfg.visualization.enabled) cv::namedWindow(window, cv::WINDOW_AUTOSIZE);
    std::uint64_t seen_version = 0;

    while (!global_stop.stop_requested()) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        fwp::LogInfo("main", "interrupted, shutting down pipeline");
        global_stop.request_stop();
        break;
      }

      if (watcher.failure()) {
        fwp::LogError("main", "watcher failed, shutting down pipeline");
        global_stop.request_stop();
        break;
      }

      // Finite sources: done once everything written has been looked at
      if (capture_stage.exhausted() && watcher.cursor() == buffer->write_index()) {
        fwp::LogInfo("main", "source finished, shutting down pipeline");
        global_stop.request_stop();
        break;
      }

      if (!cfg.visualization.enabled) {
        global_stop.token().wait_for(std::chrono::milliseconds(20));
        continue;
      }

      if (auto rf = display_store->read_if_newer(seen_version)) {
        if (!rf->image.empty()) cv::imshow(rf->window, rf->image);
      }

      const int key = cv::waitKey(5) & 0xFF;
      if (key == 'q' || key == 27) {
        fwp::LogInfo("main", "user exited, shutting down pipeline");
        global_stop.request_stop();
        break;
      }
    }

    if (cfg.visualization.enabled) cv::destroyWindow(window);

    // Stop all stages, producers first
    capture_stage.stop();
    watcher.stop();

    const auto& m = watcher.metrics();
    std::cout << "frames written:   " << capture_stage.frames_written() << "\n"
              << "frames processed: " << m.processed.load() << "\n"
              << "slots skipped:    " << m.stale_slots.load() << "\n"
              << "render failures:  " << m.render_failures.load() << "\n"
              << "avg latency (ms): " << m.avg_latency_ns.load() / 1e6 << "\n";

    if (watcher.failure()) return 1;

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
