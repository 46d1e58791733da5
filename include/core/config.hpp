#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/class_metadata.hpp"

namespace fwp {

// Closed set of detection algorithms a watcher can run
enum class DetectorKind {
  Motion,
  NeuralNet,
  ReplayLog
};

inline const char* DetectorKindName(DetectorKind kind) {
  switch (kind) {
    case DetectorKind::Motion: return "motion";
    case DetectorKind::NeuralNet: return "neural_net";
    case DetectorKind::ReplayLog: return "replay_log";
  }
  return "unknown";
}

struct SourceConfig {
  std::string path = "";   // Video file or stream URL. Empty opens device_index
  int device_index = 0;

  // 0 leaves the capture default
  int width = 0;
  int height = 0;
  int fps = 0;

  bool loop = false;        // Rewind files at end instead of reporting exhaustion
};

struct BufferConfig {
  std::size_t capacity = 64;
};

struct WatcherConfig {
  std::string name = "WatcherProcess";
  int fps_window = 20;
  int idle_wait_ms = 5;
  int heartbeat_interval_s = 60;
  int start_cursor = -1;    // < 0 aligns to the buffer's write cursor at start
};

struct MotionConfig {
  float scale_factor = 1.0f;
  float threshold = 0.04f;        // Fraction of full intensity
  bool full_detection_frame = true;
  int min_area = 1600;            // Pixels, at full resolution
  float memory = 0.1f;            // Background learning rate
  int gaussian_blur_size = 11;
  int dilation_kernel_size = 19;
  int class_id = 0;
};

struct NeuralNetConfig {
  std::string model_path = "";
  int input_width = 640;
  int input_height = 640;
  float confidence_threshold = 0.25f;
  float nms_threshold = 0.45f;
  std::vector<std::string> ignore_classes;
  int intra_op_threads = 1;
};

struct ReplayLogConfig {
  std::string path = "";
};

struct DetectorConfig {
  DetectorKind kind = DetectorKind::Motion;
  MotionConfig motion{};
  NeuralNetConfig neural_net{};
  ReplayLogConfig replay_log{};
};

struct TrackerConfig {
  bool enabled = true;
  float distance_threshold = 0.025f;  // Normalized centroid distance
  int memory_frames = 10;
  bool collision_detection = true;
};

// Synchronous (offline) mode only
struct PlaybackConfig {
  int skip_count = 0;
  float scale_factor = 1.0f;
  int sleep_ms = 0;
};

struct CaptureConfig {
  bool enabled = false;
  std::string output_dir = "captures";
};

struct VisualizationConfig {
  bool enabled = true;
  std::string window_name = "";   // Empty uses the watcher name
};

struct AppConfig {
  SourceConfig source{};
  BufferConfig buffer{};
  WatcherConfig watcher{};
  DetectorConfig detector{};
  ClassMetadata classes{};
  TrackerConfig tracker{};
  PlaybackConfig playback{};
  CaptureConfig capture{};
  VisualizationConfig visualization{};
};

}
