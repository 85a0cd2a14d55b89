// Repository: Rtpcast-sender
// Component: RtpPacketizer Interface
// Purpose: Turns one encoded access unit into one or more RTP packets.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_PACKETS_RTP_PACKETIZER_HPP_
#define RTPCAST_RTP_PACKETS_RTP_PACKETIZER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rtpcast/media/MediaFrame.hpp"
#include "rtpcast/rtp/RtpFrame.hpp"

namespace rtpcast::rtp {

// RtpPacketizer is the base class for the per-codec packetizers.
//
// One long-lived instance exists per media kind for the whole session, so
// sequence numbering is continuous across frames. The base owns the RTP
// header fields (payload type, clock rate, SSRC, sequence number) and the
// pts -> RTP timestamp conversion; subclasses only decide how the payload
// is split.
//
// Thread model: called only from the transmission thread, or from lifecycle
// transitions while that thread is stopped. Not internally synchronized.
class RtpPacketizer {
 public:
  RtpPacketizer(uint8_t payload_type, uint32_t clock_rate, uint8_t channel_identifier);
  virtual ~RtpPacketizer() = default;

  RtpPacketizer(const RtpPacketizer&) = delete;
  RtpPacketizer& operator=(const RtpPacketizer&) = delete;

  void SetSsrc(uint32_t ssrc) { ssrc_ = ssrc; }
  uint32_t Ssrc() const { return ssrc_; }

  uint32_t ClockRate() const { return clock_rate_; }
  uint8_t PayloadType() const { return payload_type_; }
  uint16_t NextSequenceNumber() const { return sequence_number_; }

  // Restarts sequence numbering. Subclasses drop any per-stream state.
  virtual void Reset();

  // Packetizes one access unit. May return zero packets (e.g. an empty
  // payload). Packet order is the order they must be sent in.
  virtual std::vector<RtpFrame> CreatePackets(const media::MediaFrame& frame) = 0;

 protected:
  void SetClockRate(uint32_t clock_rate) { clock_rate_ = clock_rate; }

  // Converts a presentation timestamp in microseconds to RTP clock units.
  uint32_t ToRtpTimestamp(int64_t pts_us) const;

  // Builds a packet: 12-byte header followed by the given payload parts.
  // Consumes one sequence number.
  RtpFrame BuildPacket(uint32_t timestamp, bool marker,
                       const uint8_t* prefix, size_t prefix_size,
                       const uint8_t* payload, size_t payload_size);

  // Payload bytes available after the RTP header.
  static constexpr size_t kMaxPayloadSize = kMaxPacketSize - kRtpHeaderLength;

 private:
  uint8_t payload_type_;
  uint32_t clock_rate_;
  uint8_t channel_identifier_;
  uint32_t ssrc_ = 0;
  uint16_t sequence_number_ = 0;
};

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_PACKETS_RTP_PACKETIZER_HPP_
