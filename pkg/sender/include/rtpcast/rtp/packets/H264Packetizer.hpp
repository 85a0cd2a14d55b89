// Repository: Rtpcast-sender
// Component: H264Packetizer
// Purpose: RFC 6184 packetization (single NAL, STAP-A, FU-A).
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_PACKETS_H264_PACKETIZER_HPP_
#define RTPCAST_RTP_PACKETS_H264_PACKETIZER_HPP_

#include <cstdint>
#include <vector>

#include "rtpcast/rtp/packets/RtpPacketizer.hpp"

namespace rtpcast::rtp {

// H264Packetizer splits Annex-B access units into RTP packets.
//
// - NAL fits in one packet -> single NAL unit packet.
// - NAL larger than the payload budget -> FU-A fragments.
// - Keyframes are preceded by one STAP-A carrying SPS and PPS so a receiver
//   joining mid-stream can start decoding at the next IDR.
// - Marker bit is set on the last packet of the access unit.
// - In-band SPS/PPS/AUD NAL units are not forwarded once out-of-band
//   parameter sets are known.
class H264Packetizer : public RtpPacketizer {
 public:
  H264Packetizer();

  // Stores the parameter sets. Start codes are tolerated and stripped.
  void SetVideoInfo(const std::vector<uint8_t>& sps, const std::vector<uint8_t>& pps);

  std::vector<RtpFrame> CreatePackets(const media::MediaFrame& frame) override;

  static constexpr uint8_t kNalTypeIdr = 5;
  static constexpr uint8_t kNalTypeSps = 7;
  static constexpr uint8_t kNalTypePps = 8;
  static constexpr uint8_t kNalTypeAud = 9;
  static constexpr uint8_t kNalTypeStapA = 24;
  static constexpr uint8_t kNalTypeFuA = 28;

 private:
  void AppendNal(const uint8_t* nal, size_t size, uint32_t ts, bool last,
                 std::vector<RtpFrame>& out);

  std::vector<uint8_t> sps_;
  std::vector<uint8_t> pps_;
};

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_PACKETS_H264_PACKETIZER_HPP_
