#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

/*
  WatcherMetrics holds the counters one watcher updates from its own thread and anyone else may read: processed
  frames, slots passed over (empty or already-seen), render failures, moving-average processing latency and the
  time of the last processed frame. NowNs grabs the current steady time as an integer.
*/

namespace fwp {

using SteadyClock = std::chrono::steady_clock;

inline std::uint64_t NowNs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          SteadyClock::now().time_since_epoch())
          .count());
}

struct WatcherMetrics {
  std::atomic<std::uint64_t> processed{0};
  std::atomic<std::uint64_t> empty_slots{0};
  std::atomic<std::uint64_t> stale_slots{0};
  std::atomic<std::uint64_t> render_failures{0};

  std::atomic<std::uint64_t> avg_latency_ns{0};
  std::atomic<std::uint64_t> last_event_ns{0};

  // Single writer (the watcher thread), so load/store is enough for the average
  void on_frame(std::uint64_t latency_ns) {
    processed.fetch_add(1, std::memory_order_relaxed);

    const auto prev = avg_latency_ns.load(std::memory_order_relaxed);
    const auto next = (prev == 0) ? latency_ns : (prev * 7 + latency_ns) / 8;
    avg_latency_ns.store(next, std::memory_order_relaxed);

    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }
};

} // namespace fwp
