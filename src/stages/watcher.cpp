#include "stages/watcher.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>

#include "apps/render_sink.hpp"
#include "infra/log.hpp"
#include "tracking/tracker.hpp"

namespace fwp {

namespace {

void LogHeartbeat(const std::string& name, std::uint64_t frame_count, const WatcherMetrics& m) {
  char line[160];
  std::snprintf(line, sizeof(line), "heartbeat %08llu (processed %llu, skipped %llu, render failures %llu, avg %.2f ms)",
                static_cast<unsigned long long>(frame_count),
                static_cast<unsigned long long>(m.processed.load(std::memory_order_relaxed)),
                static_cast<unsigned long long>(m.stale_slots.load(std::memory_order_relaxed)),
                static_cast<unsigned long long>(m.render_failures.load(std::memory_order_relaxed)),
                static_cast<double>(m.avg_latency_ns.load(std::memory_order_relaxed)) / 1e6);
  LogInfo(name, line);
}

} // namespace

WatcherOptions MakeWatcherOptions(const WatcherConfig& cfg, const std::string& window_name) {
  WatcherOptions opts;
  opts.name = cfg.name;
  opts.window_name = window_name;
  opts.idle_wait = std::chrono::milliseconds(cfg.idle_wait_ms);
  opts.heartbeat_interval = std::chrono::seconds(cfg.heartbeat_interval_s);
  if (cfg.start_cursor >= 0) opts.start_cursor = static_cast<std::size_t>(cfg.start_cursor);
  return opts;
}

Watcher::Watcher(std::shared_ptr<FrameBuffer> buffer,
                 std::shared_ptr<FrameProcessor> processor,
                 WatcherOptions opts)
    : Stage(opts.name),
      buffer_(std::move(buffer)),
      processor_(std::move(processor)),
      heartbeat_([this](const std::string& n, std::uint64_t count) { LogHeartbeat(n, count, metrics_); }),
      opts_(std::move(opts)) {
  if (!buffer_) throw std::invalid_argument("Watcher '" + opts_.name + "': null buffer");
  if (!processor_) throw std::invalid_argument("Watcher '" + opts_.name + "': null processor");
  if (opts_.window_name.empty()) opts_.window_name = opts_.name;
}

Watcher::~Watcher() {
  stop();
}

void Watcher::set_tracker(std::shared_ptr<Tracker> tracker) {
  if (running()) throw std::logic_error("Watcher '" + name() + "': set_tracker while running");
  tracker_ = std::move(tracker);
}

void Watcher::set_render_sink(std::shared_ptr<RenderSink> sink) {
  if (running()) throw std::logic_error("Watcher '" + name() + "': set_render_sink while running");
  sink_ = std::move(sink);
}

void Watcher::set_heartbeat(HeartbeatFn fn) {
  if (running()) throw std::logic_error("Watcher '" + name() + "': set_heartbeat while running");
  heartbeat_ = std::move(fn);
}

WatcherState Watcher::state() const {
  return running() ? WatcherState::Running : WatcherState::Stopped;
}

std::optional<std::string> Watcher::failure() const {
  std::lock_guard<std::mutex> lock(failure_mu_);
  return failure_;
}

void Watcher::on_start() {
  if (const auto f = failure()) {
    throw std::runtime_error("Watcher '" + name() + "' failed and cannot be restarted: " + *f);
  }

  const std::size_t start = opts_.start_cursor ? *opts_.start_cursor : buffer_->write_index();
  frame_cursor_.emplace(*buffer_, start);
  cursor_.store(start, std::memory_order_release);
}

void Watcher::on_stop_requested() {
  buffer_->notify_consumers();
}

void Watcher::run(const StopToken& stop) {
  TimePoint next_heartbeat = std::chrono::steady_clock::now() + opts_.heartbeat_interval;

  while (!stop.stop_requested()) {
    const std::uint64_t seen = buffer_->frame_count();

    while (!stop.stop_requested()) {
      const auto read = frame_cursor_->step();
      if (!read) break;
      cursor_.store(read->index, std::memory_order_release);

      // A watcher that never catches up still has to report liveness
      MaybeHeartbeat(next_heartbeat);

      if (read->status == SlotStatus::Empty) {
        metrics_.empty_slots.fetch_add(1, std::memory_order_relaxed);
        continue;
      }
      if (read->status == SlotStatus::Stale) {
        metrics_.stale_slots.fetch_add(1, std::memory_order_relaxed);
        continue;
      }

      try {
        Dispatch(*read->frame);
      } catch (const std::exception& e) {
        Fail(e.what(), read->index, read->frame->sequence_id);
        return;
      } catch (...) {
        Fail("non-standard exception", read->index, read->frame->sequence_id);
        return;
      }
    }

    if (stop.stop_requested()) break;

    buffer_->wait_for_write(seen, opts_.idle_wait);
    MaybeHeartbeat(next_heartbeat);
  }
}

void Watcher::MaybeHeartbeat(TimePoint& next_heartbeat) {
  const TimePoint now = std::chrono::steady_clock::now();
  if (now < next_heartbeat) return;

  if (heartbeat_) heartbeat_(name(), buffer_->frame_count());
  next_heartbeat = now + opts_.heartbeat_interval;
}

void Watcher::Dispatch(const Frame& frame) {
  const auto t0 = NowNs();

  ProcessResult result = processor_->process_frame(frame.capture_time, frame.image);

  if (tracker_) {
    tracker_->update(result.frame, result.events);
    tracker_->detect(result.frame);
  }

  metrics_.on_frame(NowNs() - t0);

  if (sink_) Render(result.frame);
}

void Watcher::Render(const cv::Mat& image) {
  try {
    sink_->show(opts_.window_name, image);
  } catch (const std::exception& e) {
    // Log the first failure only, a broken display would otherwise flood the log
    if (metrics_.render_failures.fetch_add(1, std::memory_order_relaxed) == 0) {
      LogWarn(name(), std::string("render failed (further failures only counted): ") + e.what());
    }
  }
}

void Watcher::Fail(const std::string& what, std::size_t slot, std::uint64_t sequence_id) {
  const std::string msg = "frame " + std::to_string(sequence_id) + " in slot " + std::to_string(slot) + ": " + what;
  LogError(name(), "processing failed, stopping: " + msg);

  std::lock_guard<std::mutex> lock(failure_mu_);
  failure_ = msg;
}

} // namespace fwp
