// Repository: Rtpcast-sender
// Component: OpusPacketizer
// Purpose: RFC 7587 Opus packetization.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_PACKETS_OPUS_PACKETIZER_HPP_
#define RTPCAST_RTP_PACKETS_OPUS_PACKETIZER_HPP_

#include <cstdint>
#include <vector>

#include "rtpcast/rtp/packets/RtpPacketizer.hpp"

namespace rtpcast::rtp {

// One Opus packet per RTP packet. The RTP clock is always 48 kHz regardless
// of the encoder's input rate (RFC 7587 section 4.1).
class OpusPacketizer : public RtpPacketizer {
 public:
  OpusPacketizer();

  // Accepted for symmetry with the other audio packetizers; the clock stays
  // at 48 kHz.
  void SetAudioInfo(int sample_rate);
  int InputSampleRate() const { return input_sample_rate_; }

  std::vector<RtpFrame> CreatePackets(const media::MediaFrame& frame) override;

 private:
  int input_sample_rate_ = 48000;
};

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_PACKETS_OPUS_PACKETIZER_HPP_
