#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>

#include "apps/capture_writer.hpp"
#include "apps/render_sink.hpp"
#include "core/config_loader.hpp"
#include "detectors/detector_factory.hpp"
#include "infra/log.hpp"
#include "infra/stop_token.hpp"
#include "stages/video_capture_source.hpp"
#include "stages/sync_runner.hpp"
#include "tracking/proximity_tracker.hpp"

#include <opencv2/highgui.hpp>

static fwp::StopSource* g_stop = nullptr;

static void HandleSigint(int) {
  if (g_stop) g_stop->request_stop_from_signal();
}

// offline_replay.cpp is a debugging and data collection tool
// Runs a pre-recorded video through the detector frame by frame on the main thread,
// optionally saving every frame with detections as training data

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    fwp::AppConfig cfg = fwp::LoadConfigFromYamlFile(cfg_path);
    fwp::LogInfo("main", "loaded config " + cfg_path);

    fwp::StopSource stop;
    g_stop = &stop;
    std::signal(SIGINT, HandleSigint);

    // Replays run once, regardless of the live setting
    fwp::SourceConfig source_cfg = cfg.source;
    source_cfg.loop = false;
    fwp::VideoCaptureSource source(source_cfg);

    auto processor = fwp::MakeFrameProcessor(
        cfg.watcher.name, cfg.detector, cfg.classes, static_cast<std::size_t>(cfg.watcher.fps_window));

    fwp::SyncOptions opts;
    opts.skip_count = cfg.playback.skip_count;
    opts.scale_factor = cfg.playback.scale_factor;
    opts.sleep = std::chrono::milliseconds(cfg.playback.sleep_ms);
    opts.window_name = cfg.visualization.window_name.empty() ? cfg.watcher.name : cfg.visualization.window_name;

    fwp::SyncRunner runner(source, *processor, opts);

    std::unique_ptr<fwp::ProximityTracker> tracker;
    if (cfg.tracker.enabled) {
      tracker = std::make_unique<fwp::ProximityTracker>(
          cfg.classes, cfg.tracker.distance_threshold, cfg.tracker.memory_frames, cfg.tracker.collision_detection);
      runner.set_tracker(tracker.get());
    }

    fwp::WindowSink window(&stop);
    if (cfg.visualization.enabled) runner.set_render_sink(&window);

    std::unique_ptr<fwp::CaptureWriter> capture;
    if (cfg.capture.enabled) {
      capture = std::make_unique<fwp::CaptureWriter>(cfg.capture.output_dir);
      runner.set_capture(capture.get());
      fwp::LogInfo("main", "capturing frames with detections to " + cfg.capture.output_dir);
    }

    const fwp::SyncRunStats stats = runner.run(stop.token());
    if (stop.stop_requested()) fwp::LogInfo("main", "stopped before end of video");

    if (capture) capture->close();
    if (cfg.visualization.enabled) cv::destroyAllWindows();
    g_stop = nullptr;

    std::cout << "frames read:        " << stats.frames_read << "\n"
              << "frames processed:   " << stats.frames_kept << "\n"
              << "frames with events: " << stats.frames_with_events << "\n"
              << "final fps:          " << processor->fps() << "\n";

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
