// Repository: Rtpcast-sender
// Component: G711Packetizer
// Purpose: RFC 3551 PCMA packetization.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_PACKETS_G711_PACKETIZER_HPP_
#define RTPCAST_RTP_PACKETS_G711_PACKETIZER_HPP_

#include <cstdint>
#include <vector>

#include "rtpcast/rtp/packets/RtpPacketizer.hpp"

namespace rtpcast::rtp {

// G711Packetizer sends raw A-law samples (one byte per sample). Buffers over
// the payload budget are split; each packet's timestamp advances by the
// number of samples before it. Marker is never set.
class G711Packetizer : public RtpPacketizer {
 public:
  G711Packetizer();

  void SetAudioInfo(int sample_rate);

  std::vector<RtpFrame> CreatePackets(const media::MediaFrame& frame) override;
};

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_PACKETS_G711_PACKETIZER_HPP_
