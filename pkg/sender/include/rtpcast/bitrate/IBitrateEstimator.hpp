// Repository: Rtpcast-sender
// Component: Bitrate Estimator Interface
// Purpose: Consumer of per-second bit counts from the measurement loop.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_BITRATE_I_BITRATE_ESTIMATOR_HPP_
#define RTPCAST_BITRATE_I_BITRATE_ESTIMATOR_HPP_

#include <cstdint>

namespace rtpcast::bitrate {

// Reset() runs on Start() before the measurement thread exists.
// CalculateBitrate() is called from the measurement thread; the factor
// accessors from any thread.
class IBitrateEstimator {
 public:
  virtual ~IBitrateEstimator() = default;

  virtual void Reset() = 0;
  virtual void CalculateBitrate(uint64_t bits) = 0;

  virtual float ExponentialFactor() const = 0;
  virtual void SetExponentialFactor(float factor) = 0;

  // Last smoothed value in bits per second, 0 before the first sample.
  virtual uint64_t LastBitrate() const = 0;
};

}  // namespace rtpcast::bitrate

#endif  // RTPCAST_BITRATE_I_BITRATE_ESTIMATOR_HPP_
