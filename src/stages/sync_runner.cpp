#include "stages/sync_runner.hpp"

#include <stdexcept>
#include <utility>

#include <opencv2/imgproc.hpp>

#include "apps/capture_writer.hpp"
#include "apps/render_sink.hpp"
#include "infra/log.hpp"
#include "tracking/tracker.hpp"

namespace fwp {

SyncRunner::SyncRunner(FrameSource& source, FrameProcessor& processor, SyncOptions opts)
    : source_(source), processor_(processor), opts_(std::move(opts)) {
  if (opts_.skip_count < 0) throw std::invalid_argument("skip_count must be >= 0");
  if (opts_.scale_factor <= 0.f) throw std::invalid_argument("scale_factor must be > 0");
}

bool SyncRunner::admit() {
  if (skip_counter_ < opts_.skip_count) {
    ++skip_counter_;
    return false;
  }
  skip_counter_ = 0;
  return true;
}

SyncRunStats SyncRunner::run(const StopToken& stop) {
  LogInfo(opts_.window_name, "sync run over " + source_.describe());

  while (!stop.stop_requested()) {
    Frame f;
    if (!source_.read(f)) {
      LogInfo(opts_.window_name, "source exhausted");
      break;
    }
    ++stats_.frames_read;

    if (!admit()) continue;

    if (opts_.scale_factor != 1.0f) {
      cv::resize(f.image, f.image, cv::Size(), opts_.scale_factor, opts_.scale_factor, cv::INTER_AREA);
    }

    ProcessResult result = processor_.process_frame(f.capture_time, f.image);
    ++stats_.frames_kept;

    if (tracker_) {
      tracker_->update(result.frame, result.events);
      tracker_->detect(result.frame);
    }

    if (!result.events.empty()) {
      ++stats_.frames_with_events;
      if (capture_) capture_->save(stats_.frames_kept, f.image, result.frame, result.events);
    }

    if (sink_) {
      try {
        sink_->show(opts_.window_name, result.frame);
      } catch (const std::exception& e) {
        if (stats_.render_failures++ == 0) {
          LogWarn(opts_.window_name, std::string("render failed (further failures only counted): ") + e.what());
        }
      }
    }

    if (opts_.sleep.count() > 0 && stop.wait_for(opts_.sleep)) break;
  }

  return stats_;
}

} // namespace fwp
