// Repository: Rtpcast-sender
// Component: AacPacketizer
// Purpose: RFC 3640 AAC-hbr packetization.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_PACKETS_AAC_PACKETIZER_HPP_
#define RTPCAST_RTP_PACKETS_AAC_PACKETIZER_HPP_

#include <cstdint>
#include <vector>

#include "rtpcast/rtp/packets/RtpPacketizer.hpp"

namespace rtpcast::rtp {

// AacPacketizer sends one access unit per packet behind a 4-byte AU header
// section (AU-headers-length = 16, 13-bit size, 3-bit index). An ADTS header,
// if present, is stripped. AUs over the payload budget are fragmented; every
// fragment carries the full AU size as RFC 3640 requires.
class AacPacketizer : public RtpPacketizer {
 public:
  AacPacketizer();

  // RTP clock = sample rate.
  void SetAudioInfo(int sample_rate);

  std::vector<RtpFrame> CreatePackets(const media::MediaFrame& frame) override;
};

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_PACKETS_AAC_PACKETIZER_HPP_
