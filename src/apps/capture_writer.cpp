#include "apps/capture_writer.hpp"

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "infra/log.hpp"

namespace fwp {

CaptureWriter::CaptureWriter(std::string output_dir) : dir_(std::move(output_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) throw std::runtime_error("failed to create capture directory '" + dir_ + "': " + ec.message());
}

CaptureWriter::~CaptureWriter() {
  if (!dirty_) return;
  try {
    close();
  } catch (const std::exception& e) {
    LogError("capture", std::string("event log not written: ") + e.what());
  }
}

std::string CaptureWriter::Path(const std::string& file) const {
  return (std::filesystem::path(dir_) / file).string();
}

void CaptureWriter::save(std::uint64_t frame_index, const cv::Mat& raw, const cv::Mat& annotated, const Detections& events) {
  const std::string base = "frame_" + std::to_string(frame_index);

  const std::string raw_path = Path(base + ".jpeg");
  if (!cv::imwrite(raw_path, raw)) throw std::runtime_error("failed to write " + raw_path);

  const std::string bb_path = Path(base + ".bb.jpeg");
  if (!cv::imwrite(bb_path, annotated)) throw std::runtime_error("failed to write " + bb_path);

  const std::string meta_path = Path(base + ".yaml");
  std::ofstream meta(meta_path);
  meta << FrameEventsToYaml(frame_index, events) << "\n";
  if (!meta) throw std::runtime_error("failed to write " + meta_path);

  log_[frame_index] = events;
  dirty_ = true;
  LogInfo("capture", "wrote " + base + " (" + std::to_string(events.size()) + " events)");
}

void CaptureWriter::close() {
  SaveEventLog(Path(kEventLogName), log_);
  dirty_ = false;
}

} // namespace fwp
