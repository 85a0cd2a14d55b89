// Repository: Rtpcast-sender
// Component: Sender Observer
// Purpose: Callbacks from the sender threads to the embedding client.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_SENDER_I_SENDER_OBSERVER_HPP_
#define RTPCAST_SENDER_I_SENDER_OBSERVER_HPP_

#include <cstdint>
#include <string>

namespace rtpcast::sender {

// Invoked from sender-owned threads. Implementations must not call Stop() on
// the sender synchronously from OnConnectionFailed (Stop joins the calling
// thread); hand the request to another thread instead.
class ISenderObserver {
 public:
  virtual ~ISenderObserver() = default;

  // Called at most once per session, from the transmission thread.
  virtual void OnConnectionFailed(const std::string& reason) = 0;

  // Smoothed outgoing bitrate, bits per second. Measurement thread.
  virtual void OnNewBitrate(uint64_t bitrate_bps) { (void)bitrate_bps; }
};

}  // namespace rtpcast::sender

#endif  // RTPCAST_SENDER_I_SENDER_OBSERVER_HPP_
