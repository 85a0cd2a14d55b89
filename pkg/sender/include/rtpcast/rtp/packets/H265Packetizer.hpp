// Repository: Rtpcast-sender
// Component: H265Packetizer
// Purpose: RFC 7798 packetization (single NAL, FU).
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_PACKETS_H265_PACKETIZER_HPP_
#define RTPCAST_RTP_PACKETS_H265_PACKETIZER_HPP_

#include <cstdint>
#include <vector>

#include "rtpcast/rtp/packets/RtpPacketizer.hpp"

namespace rtpcast::rtp {

// H265Packetizer: IRAP access units are preceded by VPS, SPS and PPS as
// single NAL unit packets. NAL units over the payload budget are sent as
// fragmentation units (type 49).
class H265Packetizer : public RtpPacketizer {
 public:
  H265Packetizer();

  void SetVideoInfo(const std::vector<uint8_t>& sps, const std::vector<uint8_t>& pps,
                    const std::vector<uint8_t>& vps);

  std::vector<RtpFrame> CreatePackets(const media::MediaFrame& frame) override;

  static constexpr uint8_t kNalTypeVps = 32;
  static constexpr uint8_t kNalTypeSps = 33;
  static constexpr uint8_t kNalTypePps = 34;
  static constexpr uint8_t kNalTypeAud = 35;
  static constexpr uint8_t kNalTypeFu = 49;

  static uint8_t NalType(const uint8_t* nal) { return (nal[0] >> 1) & 0x3F; }

 private:
  void AppendNal(const uint8_t* nal, size_t size, uint32_t ts, bool last,
                 std::vector<RtpFrame>& out);

  std::vector<uint8_t> vps_;
  std::vector<uint8_t> sps_;
  std::vector<uint8_t> pps_;
};

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_PACKETS_H265_PACKETIZER_HPP_
