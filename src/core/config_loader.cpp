#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fwp {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

DetectorKind ParseDetectorKind(const std::string& name) {
  if (name == "motion") return DetectorKind::Motion;
  if (name == "neural_net") return DetectorKind::NeuralNet;
  if (name == "replay_log") return DetectorKind::ReplayLog;
  throw std::invalid_argument("unknown detector variant '" + name + "'. Use: motion | neural_net | replay_log");
}

static cv::Scalar ParseColor(const YAML::Node& n, const std::string& key_path, const cv::Scalar& fallback) {
  if (!n) return fallback;
  if (!n.IsSequence() || n.size() != 3) throw ConfigError(key_path, "color must be a [b, g, r] list");
  try {
    return cv::Scalar(n[0].as<int>(), n[1].as<int>(), n[2].as<int>());
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static void LoadSource(const YAML::Node& root, SourceConfig& cfg) {
  const YAML::Node src = root["source"];
  if (!src) return;
  const std::string p = "source";

  cfg.path = GetOrKey<std::string>(src, "path", PathJoin(p, "path"), cfg.path);
  cfg.device_index = GetOrKey<int>(src, "device_index", PathJoin(p, "device_index"), cfg.device_index);
  cfg.width = GetOrKey<int>(src, "width", PathJoin(p, "width"), cfg.width);
  cfg.height = GetOrKey<int>(src, "height", PathJoin(p, "height"), cfg.height);
  cfg.fps = GetOrKey<int>(src, "fps", PathJoin(p, "fps"), cfg.fps);
  cfg.loop = GetOrKey<bool>(src, "loop", PathJoin(p, "loop"), cfg.loop);
}

static void LoadBuffer(const YAML::Node& root, BufferConfig& cfg) {
  const YAML::Node buf = root["buffer"];
  if (!buf) return;
  cfg.capacity = GetOrKey<std::size_t>(buf, "capacity", "buffer.capacity", cfg.capacity);
}

static void LoadWatcher(const YAML::Node& root, WatcherConfig& cfg) {
  const YAML::Node w = root["watcher"];
  if (!w) return;
  const std::string p = "watcher";

  cfg.name = GetOrKey<std::string>(w, "name", PathJoin(p, "name"), cfg.name);
  cfg.fps_window = GetOrKey<int>(w, "fps_window", PathJoin(p, "fps_window"), cfg.fps_window);
  cfg.idle_wait_ms = GetOrKey<int>(w, "idle_wait_ms", PathJoin(p, "idle_wait_ms"), cfg.idle_wait_ms);
  cfg.heartbeat_interval_s = GetOrKey<int>(w, "heartbeat_interval_s", PathJoin(p, "heartbeat_interval_s"), cfg.heartbeat_interval_s);
  cfg.start_cursor = GetOrKey<int>(w, "start_cursor", PathJoin(p, "start_cursor"), cfg.start_cursor);
}

static void LoadDetector(const YAML::Node& root, DetectorConfig& cfg) {
  const YAML::Node det = root["detector"];
  if (!det) return;
  const std::string p = "detector";

  const YAML::Node variant = Child(det, "variant");
  if (variant) {
    const std::string s = GetOrKey<std::string>(det, "variant", PathJoin(p, "variant"), "");
    try {
      cfg.kind = ParseDetectorKind(s);
    } catch (const std::invalid_argument& e) {
      throw ConfigError(PathJoin(p, "variant"), e.what());
    }
  }

  const YAML::Node m = det["motion"];
  const std::string mp = PathJoin(p, "motion");
  if (m) {
    auto& c = cfg.motion;
    c.scale_factor = GetOrKey<float>(m, "scale_factor", PathJoin(mp, "scale_factor"), c.scale_factor);
    c.threshold = GetOrKey<float>(m, "threshold", PathJoin(mp, "threshold"), c.threshold);
    c.full_detection_frame = GetOrKey<bool>(m, "full_detection_frame", PathJoin(mp, "full_detection_frame"), c.full_detection_frame);
    c.min_area = GetOrKey<int>(m, "min_area", PathJoin(mp, "min_area"), c.min_area);
    c.memory = GetOrKey<float>(m, "memory", PathJoin(mp, "memory"), c.memory);
    c.gaussian_blur_size = GetOrKey<int>(m, "gaussian_blur_size", PathJoin(mp, "gaussian_blur_size"), c.gaussian_blur_size);
    c.dilation_kernel_size = GetOrKey<int>(m, "dilation_kernel_size", PathJoin(mp, "dilation_kernel_size"), c.dilation_kernel_size);
    c.class_id = GetOrKey<int>(m, "class_id", PathJoin(mp, "class_id"), c.class_id);
  }

  const YAML::Node nn = det["neural_net"];
  const std::string np = PathJoin(p, "neural_net");
  if (nn) {
    auto& c = cfg.neural_net;
    c.model_path = GetOrKey<std::string>(nn, "model_path", PathJoin(np, "model_path"), c.model_path);
    c.input_width = GetOrKey<int>(nn, "input_width", PathJoin(np, "input_width"), c.input_width);
    c.input_height = GetOrKey<int>(nn, "input_height", PathJoin(np, "input_height"), c.input_height);
    c.confidence_threshold = GetOrKey<float>(nn, "confidence_threshold", PathJoin(np, "confidence_threshold"), c.confidence_threshold);
    c.nms_threshold = GetOrKey<float>(nn, "nms_threshold", PathJoin(np, "nms_threshold"), c.nms_threshold);
    c.ignore_classes = GetOrKey<std::vector<std::string>>(nn, "ignore_classes", PathJoin(np, "ignore_classes"), c.ignore_classes);
    c.intra_op_threads = GetOrKey<int>(nn, "intra_op_threads", PathJoin(np, "intra_op_threads"), c.intra_op_threads);
  }

  const YAML::Node rl = det["replay_log"];
  if (rl) {
    cfg.replay_log.path = GetOrKey<std::string>(rl, "path", PathJoin(PathJoin(p, "replay_log"), "path"), cfg.replay_log.path);
  }
}

// classes:
//   - { id: 0, label: forklift, color: [55, 125, 225], vert_offset: 0.0 }
static void LoadClasses(const YAML::Node& root, ClassMetadata& out) {
  const YAML::Node cls = root["classes"];
  if (!cls) return;
  if (!cls.IsSequence()) throw ConfigError("classes", "must be a list");

  out.clear();
  for (std::size_t i = 0; i < cls.size(); ++i) {
    const YAML::Node c = cls[i];
    const std::string p = "classes[" + std::to_string(i) + "]";

    const YAML::Node id_node = Child(c, "id");
    if (!id_node) throw ConfigError(PathJoin(p, "id"), "required");
    const int id = GetOrKey<int>(c, "id", PathJoin(p, "id"), -1);
    if (out.count(id)) throw ConfigError(PathJoin(p, "id"), "duplicate class id " + std::to_string(id));

    ClassInfo info;
    info.label = GetOrKey<std::string>(c, "label", PathJoin(p, "label"), info.label);
    info.color = ParseColor(Child(c, "color"), PathJoin(p, "color"), info.color);
    info.vert_offset = GetOrKey<float>(c, "vert_offset", PathJoin(p, "vert_offset"), info.vert_offset);
    info.memory_frames = GetOrKey<int>(c, "memory_frames", PathJoin(p, "memory_frames"), info.memory_frames);
    out[id] = std::move(info);
  }
}

static void LoadTracker(const YAML::Node& root, TrackerConfig& cfg) {
  const YAML::Node tr = root["tracker"];
  if (!tr) return;
  const std::string p = "tracker";

  cfg.enabled = GetOrKey<bool>(tr, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.distance_threshold = GetOrKey<float>(tr, "distance_threshold", PathJoin(p, "distance_threshold"), cfg.distance_threshold);
  cfg.memory_frames = GetOrKey<int>(tr, "memory_frames", PathJoin(p, "memory_frames"), cfg.memory_frames);
  cfg.collision_detection = GetOrKey<bool>(tr, "collision_detection", PathJoin(p, "collision_detection"), cfg.collision_detection);
}

static void LoadPlayback(const YAML::Node& root, PlaybackConfig& cfg) {
  const YAML::Node pb = root["playback"];
  if (!pb) return;
  const std::string p = "playback";

  cfg.skip_count = GetOrKey<int>(pb, "skip_count", PathJoin(p, "skip_count"), cfg.skip_count);
  cfg.scale_factor = GetOrKey<float>(pb, "scale_factor", PathJoin(p, "scale_factor"), cfg.scale_factor);
  cfg.sleep_ms = GetOrKey<int>(pb, "sleep_ms", PathJoin(p, "sleep_ms"), cfg.sleep_ms);
}

static void LoadCapture(const YAML::Node& root, CaptureConfig& cfg) {
  const YAML::Node cap = root["capture"];
  if (!cap) return;
  const std::string p = "capture";

  cfg.enabled = GetOrKey<bool>(cap, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.output_dir = GetOrKey<std::string>(cap, "output_dir", PathJoin(p, "output_dir"), cfg.output_dir);
}

static void LoadVisualization(const YAML::Node& root, VisualizationConfig& cfg) {
  const YAML::Node viz = root["visualization"];
  if (!viz) return;
  const std::string p = "visualization";

  cfg.enabled = GetOrKey<bool>(viz, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.window_name = GetOrKey<std::string>(viz, "window_name", PathJoin(p, "window_name"), cfg.window_name);
}

void ValidateOrThrow(const AppConfig& cfg) {
  if (cfg.source.path.empty() && cfg.source.device_index < 0)
    throw ConfigError("source", "path or device_index >= 0 required");
  if (cfg.source.width < 0 || cfg.source.height < 0) throw ConfigError("source", "width/height must be >= 0");
  if (cfg.source.fps < 0) throw ConfigError("source.fps", "must be >= 0");

  if (cfg.buffer.capacity < 2) throw ConfigError("buffer.capacity", "must be >= 2");

  if (cfg.watcher.name.empty()) throw ConfigError("watcher.name", "must not be empty");
  if (cfg.watcher.fps_window < 1) throw ConfigError("watcher.fps_window", "must be >= 1");
  if (cfg.watcher.idle_wait_ms < 1) throw ConfigError("watcher.idle_wait_ms", "must be >= 1");
  if (cfg.watcher.heartbeat_interval_s < 1) throw ConfigError("watcher.heartbeat_interval_s", "must be >= 1");
  if (cfg.watcher.start_cursor >= static_cast<int>(cfg.buffer.capacity))
    throw ConfigError("watcher.start_cursor", "must be < buffer.capacity");

  const auto& m = cfg.detector.motion;
  if (m.scale_factor <= 0.f || m.scale_factor > 1.f) throw ConfigError("detector.motion.scale_factor", "must be in (0, 1]");
  if (m.threshold < 0.f || m.threshold > 1.f) throw ConfigError("detector.motion.threshold", "must be in [0, 1]");
  if (m.min_area < 0) throw ConfigError("detector.motion.min_area", "must be >= 0");
  if (m.memory <= 0.f || m.memory > 1.f) throw ConfigError("detector.motion.memory", "must be in (0, 1]");
  if (m.gaussian_blur_size < 1 || m.gaussian_blur_size % 2 == 0)
    throw ConfigError("detector.motion.gaussian_blur_size", "must be odd and >= 1");
  if (m.dilation_kernel_size < 1) throw ConfigError("detector.motion.dilation_kernel_size", "must be >= 1");

  const auto& nn = cfg.detector.neural_net;
  if (cfg.detector.kind == DetectorKind::NeuralNet && nn.model_path.empty())
    throw ConfigError("detector.neural_net.model_path", "required when detector.variant = neural_net");
  if (nn.input_width <= 0 || nn.input_height <= 0)
    throw ConfigError("detector.neural_net", "input_width/input_height must be > 0");
  if (nn.confidence_threshold < 0.f || nn.confidence_threshold > 1.f)
    throw ConfigError("detector.neural_net.confidence_threshold", "must be in [0, 1]");
  if (nn.nms_threshold < 0.f || nn.nms_threshold > 1.f)
    throw ConfigError("detector.neural_net.nms_threshold", "must be in [0, 1]");
  if (nn.intra_op_threads < 1) throw ConfigError("detector.neural_net.intra_op_threads", "must be >= 1");

  if (cfg.detector.kind == DetectorKind::ReplayLog && cfg.detector.replay_log.path.empty())
    throw ConfigError("detector.replay_log.path", "required when detector.variant = replay_log");

  std::set<std::string> labels;
  for (const auto& kv : cfg.classes) {
    const std::string p = "classes[id=" + std::to_string(kv.first) + "]";
    if (kv.second.label.empty()) throw ConfigError(p + ".label", "must not be empty");
    if (!labels.insert(kv.second.label).second) throw ConfigError(p + ".label", "duplicate label '" + kv.second.label + "'");
  }

  if (cfg.tracker.distance_threshold <= 0.f) throw ConfigError("tracker.distance_threshold", "must be > 0");
  if (cfg.tracker.memory_frames < 0) throw ConfigError("tracker.memory_frames", "must be >= 0");

  if (cfg.playback.skip_count < 0) throw ConfigError("playback.skip_count", "must be >= 0");
  if (cfg.playback.scale_factor <= 0.f) throw ConfigError("playback.scale_factor", "must be > 0");
  if (cfg.playback.sleep_ms < 0) throw ConfigError("playback.sleep_ms", "must be >= 0");

  if (cfg.capture.enabled && cfg.capture.output_dir.empty())
    throw ConfigError("capture.output_dir", "required when capture enabled");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  LoadSource(root, cfg.source);
  LoadBuffer(root, cfg.buffer);
  LoadWatcher(root, cfg.watcher);
  LoadDetector(root, cfg.detector);
  LoadClasses(root, cfg.classes);
  LoadTracker(root, cfg.tracker);
  LoadPlayback(root, cfg.playback);
  LoadCapture(root, cfg.capture);
  LoadVisualization(root, cfg.visualization);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }
  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }
  return LoadFromRoot(root);
}

} // namespace fwp
