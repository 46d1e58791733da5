#pragma once

#include <chrono>
#include <cstddef>

/*
    Rolling frames-per-second over a fixed window of frames.

    Every 'window' ticks the rate is recomputed as window / seconds since the previous recompute (or since the
    start point for the first window). Between recomputes fps() keeps the last value, it never drops back to 0.
*/

namespace fwp {

class FpsCounter {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  static constexpr std::size_t kDefaultWindow = 20;

  explicit FpsCounter(std::size_t window = kDefaultWindow,
                      TimePoint start = std::chrono::steady_clock::now());

  // Counts one frame observed at 'now'. Returns the current rate
  double tick(TimePoint now);

  void restart(TimePoint start);

  double fps() const { return fps_; }
  std::size_t window() const { return window_; }

private:
  std::size_t window_;
  std::size_t count_{0};
  TimePoint window_start_;
  double fps_{0.0};
};

} // namespace fwp
