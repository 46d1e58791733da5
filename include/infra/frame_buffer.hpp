#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "core/frame.hpp"

/*
    FrameBuffer is the one resource shared between the capture thread and the watchers.

    It is a fixed ring of N slots. The producer writes at its own pace: each write moves the write cursor one slot
    forward (wrapping at N), replaces that slot's frame wholesale and bumps the cumulative frame counter. The write
    cursor starts at N-1, so the first frame lands in slot 0.

    Nothing here ever blocks the producer on a consumer. A consumer that falls behind by more than N frames simply
    finds newer frames in the slots it hasn't reached yet, the older ones are gone. That is intended: the pipeline
    is for live viewing, bounded staleness is preferred over guaranteed delivery.

    Each consumer walks the ring with its own FrameCursor. Any number of cursors may follow one buffer without
    coordinating with each other.
*/

namespace fwp {

class FrameBuffer {
public:
  explicit FrameBuffer(std::size_t capacity);

  FrameBuffer(const FrameBuffer&) = delete;
  FrameBuffer& operator=(const FrameBuffer&) = delete;

  // Producer side. Stores the frame in the next slot and returns the sequence id it was given
  std::uint64_t write(TimePoint timestamp, cv::Mat image);

  std::size_t capacity() const { return capacity_; }

  // Slot holding the most recent write
  std::size_t write_index() const { return write_index_.load(std::memory_order_acquire); }

  // Total writes since construction
  std::uint64_t frame_count() const { return frame_count_.load(std::memory_order_acquire); }

  // Frame in slot 'index', or nullptr if nothing was written there yet. Throws std::out_of_range
  FramePtr slot(std::size_t index) const;

  // Blocks until frame_count() != seen_count, notify_consumers() is called, or the timeout elapses.
  // Returns true if a new frame was written
  bool wait_for_write(std::uint64_t seen_count, std::chrono::milliseconds timeout) const;

  // Wakes every wait_for_write() caller
  void notify_consumers() const;

private:
  const std::size_t capacity_;
  std::vector<FramePtr> slots_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  mutable std::uint64_t wake_generation_{0};

  std::atomic<std::size_t> write_index_;
  std::atomic<std::uint64_t> frame_count_{0};
};

enum class SlotStatus {
  Ready,  // Holds a frame newer than anything this cursor returned before
  Empty,  // Never written (buffer still warming up)
  Stale   // Holds a frame not newer than the last one returned (producer lapped the cursor)
};

struct SlotRead {
  std::size_t index{0};
  SlotStatus status{SlotStatus::Empty};
  FramePtr frame;  // Set only when status == Ready
};

// One consumer's position in a FrameBuffer
class FrameCursor {
public:
  // Throws std::out_of_range if start_index >= capacity
  FrameCursor(const FrameBuffer& buffer, std::size_t start_index);

  bool caught_up() const { return index_ == buffer_.write_index(); }

  // Moves exactly one slot forward and reads it. Does nothing and returns nullopt when caught up
  std::optional<SlotRead> step();

  std::size_t index() const { return index_; }

  // Sequence id of the last frame returned as Ready, if any
  std::optional<std::uint64_t> last_sequence() const { return last_sequence_; }

private:
  const FrameBuffer& buffer_;
  std::size_t index_;
  std::optional<std::uint64_t> last_sequence_;
};

} // namespace fwp
