// Repository: Rtpcast-sender
// Component: BitrateManager
// Purpose: Exponentially smoothed outgoing bitrate.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_BITRATE_BITRATE_MANAGER_HPP_
#define RTPCAST_BITRATE_BITRATE_MANAGER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "rtpcast/bitrate/IBitrateEstimator.hpp"
#include "rtpcast/time/ITimeSource.hpp"

namespace rtpcast::sender {
class ISenderObserver;
}  // namespace rtpcast::sender

namespace rtpcast::bitrate {

// BitrateManager accumulates bit counts and, once at least one second has
// passed since the last sample, computes
//
//   current = bits / elapsed_seconds
//   smoothed = smoothed + factor * (current - smoothed)
//
// The first sample after Reset() seeds the smoothed value. A factor of 1.0
// (default) reports the raw rate. Each sample is passed to
// observer->OnNewBitrate() when an observer is set.
class BitrateManager : public IBitrateEstimator {
 public:
  explicit BitrateManager(sender::ISenderObserver* observer = nullptr,
                          std::shared_ptr<time::ITimeSource> time_source = nullptr);

  void Reset() override;
  void CalculateBitrate(uint64_t bits) override;

  float ExponentialFactor() const override;
  // Throws std::invalid_argument outside (0, 1].
  void SetExponentialFactor(float factor) override;

  uint64_t LastBitrate() const override { return last_bitrate_.load(std::memory_order_relaxed); }

 private:
  sender::ISenderObserver* observer_;
  std::shared_ptr<time::ITimeSource> time_source_;

  mutable std::mutex mutex_;
  float factor_ = 1.0f;
  uint64_t pending_bits_ = 0;
  int64_t window_start_ms_ = -1;
  bool seeded_ = false;
  double smoothed_bps_ = 0.0;
  std::atomic<uint64_t> last_bitrate_{0};
};

}  // namespace rtpcast::bitrate

#endif  // RTPCAST_BITRATE_BITRATE_MANAGER_HPP_
