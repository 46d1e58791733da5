#include "detectors/yolo_detector.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include <opencv2/imgproc.hpp>

#include "apps/overlay.hpp"

namespace fwp {

static inline float Clamp(float v, float lo, float hi) {
  return std::max(lo, std::min(hi, v));
}

static inline float IoUBox(const BBox& a, const BBox& b) {
  const float ax2 = a.x + a.w;
  const float ay2 = a.y + a.h;
  const float bx2 = b.x + b.w;
  const float by2 = b.y + b.h;

  const float ix1 = std::max(a.x, b.x);
  const float iy1 = std::max(a.y, b.y);
  const float ix2 = std::min(ax2, bx2);
  const float iy2 = std::min(ay2, by2);

  const float iw = std::max(0.f, ix2 - ix1);
  const float ih = std::max(0.f, iy2 - iy1);
  const float inter = iw * ih;

  const float ua = a.w * a.h + b.w * b.h - inter;
  return (ua <= 0.f) ? 0.f : (inter / ua);
}

YoloDetector::YoloDetector(NeuralNetConfig cfg, ClassMetadata classes)
    : cfg_(std::move(cfg)), classes_(std::move(classes)), ignore_(cfg_.ignore_classes.begin(), cfg_.ignore_classes.end()) {
  try {
    sess_opts_.SetIntraOpNumThreads(cfg_.intra_op_threads);
    sess_opts_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    session_ = std::make_unique<Ort::Session>(env_, cfg_.model_path.c_str(), sess_opts_);

    {
      auto in = session_->GetInputNameAllocated(0, allocator_);
      input_name_ = in ? std::string(in.get()) : std::string{};
    }
    {
      auto out = session_->GetOutputNameAllocated(0, allocator_);
      output_name_ = out ? std::string(out.get()) : std::string{};
    }
  } catch (const Ort::Exception& e) {
    throw std::runtime_error("ONNX Runtime init failed for '" + cfg_.model_path + "': " + e.what());
  }

  if (input_name_.empty() || output_name_.empty()) {
    throw std::runtime_error("model '" + cfg_.model_path + "' has no usable input/output");
  }
}

Detections YoloDetector::detect(TimePoint, const cv::Mat& frame, cv::Mat& canvas) {
  Detections out;

  cv::Mat resized;
  cv::resize(frame, resized, cv::Size(cfg_.input_width, cfg_.input_height), 0, 0, cv::INTER_LINEAR);

  cv::Mat rgb;
  if (resized.channels() == 1) {
    cv::cvtColor(resized, rgb, cv::COLOR_GRAY2RGB);
  } else if (resized.channels() == 4) {
    cv::cvtColor(resized, rgb, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
  }

  cv::Mat f32;
  rgb.convertTo(f32, CV_32F, 1.0 / 255.0);

  const int hw = cfg_.input_height * cfg_.input_width;
  std::vector<float> input_tensor(static_cast<std::size_t>(3 * hw));
  {
    std::vector<cv::Mat> ch(3);
    cv::split(f32, ch);
    for (int c = 0; c < 3; ++c) {
      std::memcpy(input_tensor.data() + c * hw, ch[c].ptr<float>(), hw * sizeof(float));
    }
  }

  std::array<int64_t, 4> in_shape{1, 3, cfg_.input_height, cfg_.input_width};
  auto mem_info = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

  Ort::Value in = Ort::Value::CreateTensor<float>(
      mem_info, input_tensor.data(), input_tensor.size(), in_shape.data(), in_shape.size());

  const char* in_names[] = {input_name_.c_str()};
  const char* out_names[] = {output_name_.c_str()};

  std::vector<Ort::Value> ort_out;
  try {
    ort_out = session_->Run(Ort::RunOptions{nullptr}, in_names, &in, 1, out_names, 1);
  } catch (const Ort::Exception& e) {
    throw std::runtime_error(std::string("ORT Run failed: ") + e.what());
  }

  if (ort_out.empty() || !ort_out[0].IsTensor()) throw std::runtime_error("model produced no tensor output");

  auto& t = ort_out[0];
  auto shape = t.GetTensorTypeAndShapeInfo().GetShape();
  if (shape.size() != 3 || shape[0] != 1) throw std::runtime_error("unexpected model output rank");

  const float* data = t.GetTensorData<float>();
  const int A = static_cast<int>(shape[1]);
  const int B = static_cast<int>(shape[2]);

  // Channels are the short axis
  const bool layout_CxN = (A < B);
  const int C = layout_CxN ? A : B;
  const int N = layout_CxN ? B : A;
  if (C < 5) throw std::runtime_error("model output has no class scores");

  const int num_classes = C - 4;

  auto at = [&](int c, int n) -> float {
    if (layout_CxN) return data[c * N + n];
    return data[n * C + c];
  };

  const float sx = static_cast<float>(frame.cols) / static_cast<float>(cfg_.input_width);
  const float sy = static_cast<float>(frame.rows) / static_cast<float>(cfg_.input_height);

  struct Cand { BBox box; int cls; float score; };
  std::vector<Cand> cands;
  cands.reserve(256);

  for (int i = 0; i < N; ++i) {
    int best_cls = -1;
    float best = 0.f;
    for (int c = 0; c < num_classes; ++c) {
      const float s = at(4 + c, i);
      if (s > best) { best = s; best_cls = c; }
    }

    if (best < cfg_.confidence_threshold) continue;
    if (!ignore_.empty() && ignore_.count(ClassLabel(classes_, best_cls))) continue;

    const float cx = at(0, i);
    const float cy = at(1, i);
    const float w  = at(2, i);
    const float h  = at(3, i);

    BBox bb;
    bb.x = Clamp((cx - 0.5f * w) * sx, 0.f, static_cast<float>(frame.cols) - 1.f);
    bb.y = Clamp((cy - 0.5f * h) * sy, 0.f, static_cast<float>(frame.rows) - 1.f);
    bb.w = Clamp(w * sx, 0.f, static_cast<float>(frame.cols) - bb.x);
    bb.h = Clamp(h * sy, 0.f, static_cast<float>(frame.rows) - bb.y);
    if (bb.w <= 1.f || bb.h <= 1.f) continue;

    cands.push_back({bb, best_cls, best});
  }

  std::sort(cands.begin(), cands.end(),
            [](const Cand& a, const Cand& b) { return a.score > b.score; });

  // Greedy NMS within each class
  std::vector<Cand> kept;
  kept.reserve(cands.size());
  for (const auto& c : cands) {
    bool ok = true;
    for (const auto& k : kept) {
      if (k.cls == c.cls && IoUBox(c.box, k.box) > cfg_.nms_threshold) { ok = false; break; }
    }
    if (ok) kept.push_back(c);
  }

  out.reserve(kept.size());
  for (const auto& k : kept) {
    DetectionEvent d;
    d.class_id = k.cls;
    d.label = ClassLabel(classes_, k.cls);
    d.confidence = k.score;
    d.region = k.box;
    out.push_back(std::move(d));
  }

  DrawDetections(canvas, out, classes_);
  return out;
}

} // namespace fwp
