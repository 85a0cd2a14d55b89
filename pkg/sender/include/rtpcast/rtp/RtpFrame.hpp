// Repository: Rtpcast-sender
// Component: RTP Frame
// Purpose: One wire-ready RTP packet produced by a packetizer.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_RTP_FRAME_HPP_
#define RTPCAST_RTP_RTP_FRAME_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rtpcast/rtp/RtpConstants.hpp"

namespace rtpcast::rtp {

// RtpFrame holds a complete RTP packet (header + payload). Created, sent and
// discarded within one transmission-loop iteration.
struct RtpFrame {
  std::vector<uint8_t> buffer;
  uint32_t timestamp = 0;
  uint8_t channel_identifier = kVideoTrackChannel;

  size_t length() const { return buffer.size(); }

  bool IsVideoFrame() const { return channel_identifier == kVideoTrackChannel; }
};

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_RTP_FRAME_HPP_
