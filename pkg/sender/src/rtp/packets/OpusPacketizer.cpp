// Repository: Rtpcast-sender
// Component: OpusPacketizer
// Purpose: RFC 7587 Opus packetization.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/rtp/packets/OpusPacketizer.hpp"

#include <stdexcept>
#include <string>

namespace rtpcast::rtp {

OpusPacketizer::OpusPacketizer()
    : RtpPacketizer(kAudioPayloadType, kOpusClockRate, kAudioTrackChannel) {}

void OpusPacketizer::SetAudioInfo(int sample_rate) {
  input_sample_rate_ = sample_rate;
}

std::vector<RtpFrame> OpusPacketizer::CreatePackets(const media::MediaFrame& frame) {
  std::vector<RtpFrame> out;
  const size_t size = frame.PayloadSize();
  if (size == 0) return out;
  // Opus packets cannot be fragmented.
  if (size > kMaxPayloadSize) {
    throw std::runtime_error("Opus packet too large: " + std::to_string(size) + " bytes");
  }
  out.push_back(BuildPacket(ToRtpTimestamp(frame.info.pts_us), false, nullptr, 0,
                            frame.Payload(), size));
  return out;
}

}  // namespace rtpcast::rtp
