// Repository: Rtpcast-sender
// Component: Av1Packetizer
// Purpose: AV1 RTP payload packetization (one OBU element per packet).
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_PACKETS_AV1_PACKETIZER_HPP_
#define RTPCAST_RTP_PACKETS_AV1_PACKETIZER_HPP_

#include <cstdint>
#include <vector>

#include "rtpcast/rtp/packets/RtpPacketizer.hpp"

namespace rtpcast::rtp {

// Av1Packetizer expects a temporal unit in low-overhead bitstream format
// (OBUs carrying obu_has_size_field). Each OBU is sent as a single OBU
// element (W=1) with its size field removed; OBUs over the payload budget
// are fragmented with the Z/Y continuation bits. Temporal delimiters and
// tile lists are not transmitted.
class Av1Packetizer : public RtpPacketizer {
 public:
  Av1Packetizer();

  std::vector<RtpFrame> CreatePackets(const media::MediaFrame& frame) override;

  static constexpr uint8_t kObuSequenceHeader = 1;
  static constexpr uint8_t kObuTemporalDelimiter = 2;
  static constexpr uint8_t kObuTileList = 8;

  // Aggregation header bits.
  static constexpr uint8_t kAggZ = 0x80;
  static constexpr uint8_t kAggY = 0x40;
  static constexpr uint8_t kAggW1 = 0x10;
  static constexpr uint8_t kAggN = 0x08;
};

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_PACKETS_AV1_PACKETIZER_HPP_
