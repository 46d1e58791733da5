#include "infra/frame_buffer.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace fwp {

FrameBuffer::FrameBuffer(std::size_t capacity)
    : capacity_(capacity), slots_(capacity), write_index_(capacity == 0 ? 0 : capacity - 1) {
  // With a single slot the write cursor never moves, so a consumer could never tell a new frame apart
  if (capacity_ < 2) throw std::invalid_argument("FrameBuffer capacity must be >= 2");
}

std::uint64_t FrameBuffer::write(TimePoint timestamp, cv::Mat image) {
  auto frame = std::make_shared<Frame>();
  frame->capture_time = timestamp;
  frame->image = std::move(image);

  std::uint64_t seq = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const std::size_t next = (write_index_.load(std::memory_order_relaxed) + 1) % capacity_;
    seq = frame_count_.load(std::memory_order_relaxed);
    frame->sequence_id = seq;

    // Slot first, then cursor: a consumer that sees the new cursor also sees the new frame
    slots_[next] = std::move(frame);
    write_index_.store(next, std::memory_order_release);
    frame_count_.store(seq + 1, std::memory_order_release);
  }
  cv_.notify_all();
  return seq;
}

FramePtr FrameBuffer::slot(std::size_t index) const {
  if (index >= capacity_) {
    throw std::out_of_range("FrameBuffer slot " + std::to_string(index) + " out of range");
  }
  std::lock_guard<std::mutex> lock(mu_);
  return slots_[index];
}

bool FrameBuffer::wait_for_write(std::uint64_t seen_count, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  const std::uint64_t gen = wake_generation_;
  cv_.wait_for(lock, timeout, [&] {
    return frame_count_.load(std::memory_order_relaxed) != seen_count || wake_generation_ != gen;
  });
  return frame_count_.load(std::memory_order_relaxed) != seen_count;
}

void FrameBuffer::notify_consumers() const {
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++wake_generation_;
  }
  cv_.notify_all();
}

FrameCursor::FrameCursor(const FrameBuffer& buffer, std::size_t start_index)
    : buffer_(buffer), index_(start_index) {
  if (index_ >= buffer_.capacity()) {
    throw std::out_of_range("FrameCursor start " + std::to_string(index_) + " out of range");
  }
}

std::optional<SlotRead> FrameCursor::step() {
  if (caught_up()) return std::nullopt;

  index_ = (index_ + 1) % buffer_.capacity();

  SlotRead out;
  out.index = index_;

  FramePtr frame = buffer_.slot(index_);
  if (!frame) {
    out.status = SlotStatus::Empty;
    return out;
  }

  if (last_sequence_ && frame->sequence_id <= *last_sequence_) {
    out.status = SlotStatus::Stale;
    return out;
  }

  last_sequence_ = frame->sequence_id;
  out.status = SlotStatus::Ready;
  out.frame = std::move(frame);
  return out;
}

} // namespace fwp
