// Repository: Rtpcast-sender
// Component: BitrateManager Implementation
// Purpose: Exponentially smoothed outgoing bitrate.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/bitrate/BitrateManager.hpp"

#include <stdexcept>
#include <string>

#include "rtpcast/sender/ISenderObserver.hpp"

namespace rtpcast::bitrate {

BitrateManager::BitrateManager(sender::ISenderObserver* observer,
                               std::shared_ptr<time::ITimeSource> time_source)
    : observer_(observer),
      time_source_(time_source ? std::move(time_source)
                               : std::make_shared<time::SteadyTimeSource>()) {
  window_start_ms_ = time_source_->NowMs();
}

void BitrateManager::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_bits_ = 0;
  seeded_ = false;
  smoothed_bps_ = 0.0;
  window_start_ms_ = time_source_->NowMs();
  last_bitrate_.store(0, std::memory_order_relaxed);
}

void BitrateManager::CalculateBitrate(uint64_t bits) {
  uint64_t report = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_bits_ += bits;
    const int64_t now_ms = time_source_->NowMs();
    const int64_t elapsed_ms = now_ms - window_start_ms_;
    if (elapsed_ms < 1000) {
      return;
    }
    const double current = static_cast<double>(pending_bits_) * 1000.0 /
                           static_cast<double>(elapsed_ms);
    if (!seeded_) {
      smoothed_bps_ = current;
      seeded_ = true;
    }
    smoothed_bps_ += factor_ * (current - smoothed_bps_);
    pending_bits_ = 0;
    window_start_ms_ = now_ms;
    report = static_cast<uint64_t>(smoothed_bps_);
    last_bitrate_.store(report, std::memory_order_relaxed);
  }
  if (observer_ != nullptr) {
    observer_->OnNewBitrate(report);
  }
}

float BitrateManager::ExponentialFactor() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return factor_;
}

void BitrateManager::SetExponentialFactor(float factor) {
  if (!(factor > 0.0f && factor <= 1.0f)) {
    throw std::invalid_argument("exponential factor must be in (0, 1], got " +
                                std::to_string(factor));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  factor_ = factor;
}

}  // namespace rtpcast::bitrate
