// Repository: Rtpcast-sender
// Component: RtpPacketizer
// Purpose: RTP header writing and timestamp conversion shared by codecs.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/rtp/packets/RtpPacketizer.hpp"

#include <cstring>

extern "C" {
#include <libavutil/mathematics.h>  // For av_rescale_q
#include <libavutil/rational.h>
}

namespace rtpcast::rtp {

RtpPacketizer::RtpPacketizer(uint8_t payload_type, uint32_t clock_rate,
                             uint8_t channel_identifier)
    : payload_type_(payload_type),
      clock_rate_(clock_rate),
      channel_identifier_(channel_identifier) {}

void RtpPacketizer::Reset() {
  sequence_number_ = 0;
}

uint32_t RtpPacketizer::ToRtpTimestamp(int64_t pts_us) const {
  const AVRational tb_us{1, 1'000'000};
  const AVRational tb_rtp{1, static_cast<int>(clock_rate_)};
  // RTP timestamps wrap modulo 2^32.
  return static_cast<uint32_t>(av_rescale_q(pts_us, tb_us, tb_rtp));
}

RtpFrame RtpPacketizer::BuildPacket(uint32_t timestamp, bool marker,
                                    const uint8_t* prefix, size_t prefix_size,
                                    const uint8_t* payload, size_t payload_size) {
  RtpFrame frame;
  frame.timestamp = timestamp;
  frame.channel_identifier = channel_identifier_;
  frame.buffer.resize(kRtpHeaderLength + prefix_size + payload_size);

  uint8_t* p = frame.buffer.data();
  const uint16_t seq = sequence_number_++;
  p[0] = 0x80;  // V=2, P=0, X=0, CC=0
  p[1] = static_cast<uint8_t>((marker ? 0x80 : 0x00) | (payload_type_ & 0x7F));
  p[2] = static_cast<uint8_t>(seq >> 8);
  p[3] = static_cast<uint8_t>(seq);
  p[4] = static_cast<uint8_t>(timestamp >> 24);
  p[5] = static_cast<uint8_t>(timestamp >> 16);
  p[6] = static_cast<uint8_t>(timestamp >> 8);
  p[7] = static_cast<uint8_t>(timestamp);
  p[8] = static_cast<uint8_t>(ssrc_ >> 24);
  p[9] = static_cast<uint8_t>(ssrc_ >> 16);
  p[10] = static_cast<uint8_t>(ssrc_ >> 8);
  p[11] = static_cast<uint8_t>(ssrc_);

  if (prefix_size > 0) {
    std::memcpy(p + kRtpHeaderLength, prefix, prefix_size);
  }
  if (payload_size > 0) {
    std::memcpy(p + kRtpHeaderLength + prefix_size, payload, payload_size);
  }
  return frame;
}

}  // namespace rtpcast::rtp
