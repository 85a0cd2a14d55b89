// Repository: Rtpcast-sender
// Component: FrameQueue
// Purpose: Bounded FIFO between the encoder callback and the transmission
//          loop. Full queue means drop, never block the producer.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_SENDER_FRAME_QUEUE_HPP_
#define RTPCAST_SENDER_FRAME_QUEUE_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "rtpcast/media/MediaFrame.hpp"

namespace rtpcast::sender {

// FrameQueue holds at most Capacity() media frames in arrival order.
//
// Producer side: TryPush() returns false when full; the frame is not taken.
//
// Consumer side: PollFor() waits up to a timeout for the head frame, and
// returns early with nullopt once the cancel flag is observed. Callers that
// set the flag must call NotifyAll() so a waiting consumer wakes.
//
// Resize() replaces the backing storage under the lock, keeping every
// queued frame in order. It throws std::runtime_error when the new capacity
// is below the current size and std::invalid_argument for 0.
//
// Thread safety: all public methods are mutex-protected.
class FrameQueue {
 public:
  explicit FrameQueue(size_t capacity);

  FrameQueue(const FrameQueue&) = delete;
  FrameQueue& operator=(const FrameQueue&) = delete;

  // --- Producer ---
  bool TryPush(media::MediaFrame&& frame);

  // --- Consumer ---
  std::optional<media::MediaFrame> PollFor(std::chrono::milliseconds timeout,
                                           const std::atomic<bool>& cancelled);

  // --- Control ---
  void Resize(size_t capacity);
  void Clear();
  void NotifyAll();

  // --- Observability ---
  size_t Size() const;
  size_t Capacity() const;
  size_t RemainingCapacity() const;

  // Size and capacity read under one lock.
  struct Occupancy {
    size_t size;
    size_t capacity;
  };
  Occupancy GetOccupancy() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<media::MediaFrame> frames_;
  size_t capacity_;
};

}  // namespace rtpcast::sender

#endif  // RTPCAST_SENDER_FRAME_QUEUE_HPP_
