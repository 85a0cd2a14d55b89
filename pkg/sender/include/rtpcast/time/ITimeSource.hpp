// Repository: Rtpcast-sender
// Component: Time Source
// Purpose: Monotonic millisecond clock seam for rate measurement.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_TIME_I_TIME_SOURCE_HPP_
#define RTPCAST_TIME_I_TIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace rtpcast::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMs() const = 0;
};

class SteadyTimeSource : public ITimeSource {
 public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace rtpcast::time

#endif  // RTPCAST_TIME_I_TIME_SOURCE_HPP_
