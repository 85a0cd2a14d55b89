// Fake bitrate estimator: records every sample handed to it.

#ifndef RTPCAST_TESTS_FIXTURES_FAKE_BITRATE_ESTIMATOR_H_
#define RTPCAST_TESTS_FIXTURES_FAKE_BITRATE_ESTIMATOR_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <numeric>
#include <vector>

#include "rtpcast/bitrate/IBitrateEstimator.hpp"

namespace rtpcast::tests::fixtures {

class FakeBitrateEstimator : public bitrate::IBitrateEstimator {
 public:
  void Reset() override { resets_.fetch_add(1); }

  void CalculateBitrate(uint64_t bits) override {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(bits);
    cv_.notify_all();
  }

  float ExponentialFactor() const override { return factor_.load(); }
  void SetExponentialFactor(float factor) override { factor_.store(factor); }
  uint64_t LastBitrate() const override { return 0; }

  bool WaitForSamples(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return samples_.size() >= count; });
  }

  std::vector<uint64_t> Samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
  }

  uint64_t TotalBits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::accumulate(samples_.begin(), samples_.end(), uint64_t{0});
  }

  int Resets() const { return resets_.load(); }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<uint64_t> samples_;
  std::atomic<float> factor_{1.0f};
  std::atomic<int> resets_{0};
};

}  // namespace rtpcast::tests::fixtures

#endif  // RTPCAST_TESTS_FIXTURES_FAKE_BITRATE_ESTIMATOR_H_
