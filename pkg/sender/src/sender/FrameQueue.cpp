// Repository: Rtpcast-sender
// Component: FrameQueue Implementation
// Purpose: Bounded FIFO between the encoder callback and the transmission loop.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/sender/FrameQueue.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace rtpcast::sender {

FrameQueue::FrameQueue(size_t capacity) : capacity_(capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("cache size must be greater than 0");
  }
}

bool FrameQueue::TryPush(media::MediaFrame&& frame) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.size() >= capacity_) {
      return false;
    }
    frames_.push_back(std::move(frame));
  }
  cv_.notify_one();
  return true;
}

std::optional<media::MediaFrame> FrameQueue::PollFor(std::chrono::milliseconds timeout,
                                                     const std::atomic<bool>& cancelled) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [&] {
    return !frames_.empty() || cancelled.load(std::memory_order_acquire);
  });
  if (frames_.empty() || cancelled.load(std::memory_order_acquire)) {
    return std::nullopt;
  }
  media::MediaFrame frame = std::move(frames_.front());
  frames_.pop_front();
  return frame;
}

void FrameQueue::Resize(size_t capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("cache size must be greater than 0");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (capacity < frames_.size()) {
    throw std::runtime_error("Can't fit current cache inside new cache size");
  }
  std::deque<media::MediaFrame> replacement(std::make_move_iterator(frames_.begin()),
                                            std::make_move_iterator(frames_.end()));
  frames_.swap(replacement);
  capacity_ = capacity;
}

void FrameQueue::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  frames_.clear();
}

void FrameQueue::NotifyAll() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
  }
  cv_.notify_all();
}

size_t FrameQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_.size();
}

size_t FrameQueue::Capacity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_;
}

FrameQueue::Occupancy FrameQueue::GetOccupancy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Occupancy{frames_.size(), capacity_};
}

size_t FrameQueue::RemainingCapacity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_ - frames_.size();
}

}  // namespace rtpcast::sender
