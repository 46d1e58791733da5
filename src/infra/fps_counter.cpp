#include "infra/fps_counter.hpp"

#include <stdexcept>

namespace fwp {

FpsCounter::FpsCounter(std::size_t window, TimePoint start) : window_(window), window_start_(start) {
  if (window_ == 0) throw std::invalid_argument("FpsCounter window must be >= 1");
}

double FpsCounter::tick(TimePoint now) {
  ++count_;
  if (count_ < window_) return fps_;

  const double elapsed_s = std::chrono::duration<double>(now - window_start_).count();
  // A zero or backwards window (clock step, duplicated timestamps) keeps the previous value
  if (elapsed_s > 0.0) {
    fps_ = static_cast<double>(window_) / elapsed_s;
  }
  window_start_ = now;
  count_ = 0;
  return fps_;
}

void FpsCounter::restart(TimePoint start) {
  window_start_ = start;
  count_ = 0;
  fps_ = 0.0;
}

} // namespace fwp
