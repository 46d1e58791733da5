#pragma once

#include <memory>
#include <set>
#include <string>

#include <onnxruntime/onnxruntime_cxx_api.h>

#include "core/class_metadata.hpp"
#include "core/config.hpp"
#include "detectors/frame_processor.hpp"

namespace fwp {

// YOLO-style ONNX model: one input [1, 3, H, W] (RGB, 0..1) and one output of [1, 4 + C, N] or [1, N, 4 + C]
// with center-format boxes followed by per-class scores
class YoloDetector final : public Detector {
public:
  // Throws std::runtime_error if the model can't be loaded
  YoloDetector(NeuralNetConfig cfg, ClassMetadata classes);

  Detections detect(TimePoint timestamp, const cv::Mat& frame, cv::Mat& canvas) override;
  const char* kind() const override { return "neural_net"; }

private:
  NeuralNetConfig cfg_;
  ClassMetadata classes_;
  std::set<std::string> ignore_;

  Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "fwp-yolo"};
  Ort::SessionOptions sess_opts_{};
  std::unique_ptr<Ort::Session> session_;
  Ort::AllocatorWithDefaultOptions allocator_;

  std::string input_name_;
  std::string output_name_;
};

} // namespace fwp
