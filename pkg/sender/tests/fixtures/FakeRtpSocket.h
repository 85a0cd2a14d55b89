// Fake RTP transport: records every packet and flush, can fail on demand
// and can stall sends until released.

#ifndef RTPCAST_TESTS_FIXTURES_FAKE_RTP_SOCKET_H_
#define RTPCAST_TESTS_FIXTURES_FAKE_RTP_SOCKET_H_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "rtpcast/rtp/sockets/RtpSocket.hpp"

namespace rtpcast::tests::fixtures {

class FakeRtpSocket : public rtp::RtpSocket {
 public:
  explicit FakeRtpSocket(bool stream_oriented = false) : stream_oriented_(stream_oriented) {}

  void SendFrame(const rtp::RtpFrame& frame) override {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !stalled_; });
    if (fail_after_ >= 0 && static_cast<int64_t>(sent_.size()) >= fail_after_) {
      throw std::runtime_error(failure_message_);
    }
    sent_.push_back(frame);
    cv_.notify_all();
  }

  void Flush() override {
    std::lock_guard<std::mutex> lock(mutex_);
    flushes_++;
    flush_marks_.push_back(sent_.size());
    cv_.notify_all();
  }

  void Close() override {
    std::lock_guard<std::mutex> lock(mutex_);
    closes_++;
  }

  bool IsStreamOriented() const override { return stream_oriented_; }

  void Abort() override {
    std::lock_guard<std::mutex> lock(mutex_);
    aborts_++;
  }

  // --- Test controls ---

  // Every SendFrame() after the first `packets` successful ones throws.
  void FailAfter(int64_t packets, std::string message = "Broken pipe") {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_after_ = packets;
    failure_message_ = std::move(message);
  }

  void Stall() {
    std::lock_guard<std::mutex> lock(mutex_);
    stalled_ = true;
  }

  void Release() {
    std::lock_guard<std::mutex> lock(mutex_);
    stalled_ = false;
    cv_.notify_all();
  }

  bool WaitForFlushes(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return flushes_ >= count; });
  }

  // --- Observability ---

  std::vector<rtp::RtpFrame> Sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  // Packet count at each flush.
  std::vector<size_t> FlushMarks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flush_marks_;
  }

  size_t Flushes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flushes_;
  }

  int Closes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closes_;
  }

  int Aborts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aborts_;
  }

 private:
  bool stream_oriented_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<rtp::RtpFrame> sent_;
  std::vector<size_t> flush_marks_;
  size_t flushes_ = 0;
  int closes_ = 0;
  int aborts_ = 0;
  bool stalled_ = false;
  int64_t fail_after_ = -1;
  std::string failure_message_;
};

}  // namespace rtpcast::tests::fixtures

#endif  // RTPCAST_TESTS_FIXTURES_FAKE_RTP_SOCKET_H_
