#include "detectors/detector_factory.hpp"

#include <stdexcept>
#include <utility>

#include "core/event_log.hpp"
#include "detectors/motion_detector.hpp"
#include "detectors/replay_detector.hpp"
#include "detectors/yolo_detector.hpp"
#include "infra/log.hpp"

namespace fwp {

std::unique_ptr<Detector> MakeDetector(const DetectorConfig& cfg, const ClassMetadata& classes) {
  switch (cfg.kind) {
    case DetectorKind::Motion:
      return std::make_unique<MotionDetector>(cfg.motion, classes);

    case DetectorKind::NeuralNet:
      LogInfo("detector", "loading model " + cfg.neural_net.model_path);
      return std::make_unique<YoloDetector>(cfg.neural_net, classes);

    case DetectorKind::ReplayLog: {
      EventLog log = LoadEventLog(cfg.replay_log.path);
      LogInfo("detector", "replaying " + std::to_string(log.size()) + " logged frames from " + cfg.replay_log.path);
      return std::make_unique<ReplayDetector>(std::move(log), classes);
    }
  }
  throw std::invalid_argument("unhandled detector kind");
}

std::unique_ptr<AnnotatingProcessor> MakeFrameProcessor(const std::string& name,
                                                        const DetectorConfig& cfg,
                                                        const ClassMetadata& classes,
                                                        std::size_t fps_window) {
  return std::make_unique<AnnotatingProcessor>(name, MakeDetector(cfg, classes), fps_window);
}

} // namespace fwp
