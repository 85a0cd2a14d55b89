// Observer that records failure and bitrate callbacks for assertions.

#ifndef RTPCAST_TESTS_FIXTURES_RECORDING_OBSERVER_H_
#define RTPCAST_TESTS_FIXTURES_RECORDING_OBSERVER_H_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "rtpcast/sender/ISenderObserver.hpp"

namespace rtpcast::tests::fixtures {

class RecordingObserver : public sender::ISenderObserver {
 public:
  void OnConnectionFailed(const std::string& reason) override {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.push_back(reason);
    cv_.notify_all();
  }

  void OnNewBitrate(uint64_t bitrate_bps) override {
    std::lock_guard<std::mutex> lock(mutex_);
    bitrates_.push_back(bitrate_bps);
    cv_.notify_all();
  }

  bool WaitForFailure(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return !failures_.empty(); });
  }

  std::vector<std::string> Failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
  }

  std::vector<uint64_t> Bitrates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bitrates_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> failures_;
  std::vector<uint64_t> bitrates_;
};

}  // namespace rtpcast::tests::fixtures

#endif  // RTPCAST_TESTS_FIXTURES_RECORDING_OBSERVER_H_
