// Repository: Rtpcast-sender
// Component: G711Packetizer
// Purpose: RFC 3551 PCMA packetization.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/rtp/packets/G711Packetizer.hpp"

#include <algorithm>

namespace rtpcast::rtp {

G711Packetizer::G711Packetizer()
    : RtpPacketizer(kG711PayloadType, 8000, kAudioTrackChannel) {}

void G711Packetizer::SetAudioInfo(int sample_rate) {
  SetClockRate(static_cast<uint32_t>(sample_rate));
}

std::vector<RtpFrame> G711Packetizer::CreatePackets(const media::MediaFrame& frame) {
  std::vector<RtpFrame> out;
  const uint8_t* data = frame.Payload();
  const size_t size = frame.PayloadSize();
  if (size == 0) return out;

  const uint32_t ts = ToRtpTimestamp(frame.info.pts_us);
  size_t pos = 0;
  while (pos < size) {
    const size_t len = std::min(kMaxPayloadSize, size - pos);
    out.push_back(BuildPacket(ts + static_cast<uint32_t>(pos), false, nullptr, 0,
                              data + pos, len));
    pos += len;
  }
  return out;
}

}  // namespace rtpcast::rtp
