// Repository: Rtpcast-sender
// Component: AacPacketizer
// Purpose: RFC 3640 AAC-hbr packetization.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/rtp/packets/AacPacketizer.hpp"

#include <algorithm>

namespace rtpcast::rtp {

namespace {
constexpr int kDefaultSampleRate = 44100;

// Length of the ADTS header at the start of data, 0 if none.
size_t AdtsHeaderLength(const uint8_t* data, size_t size) {
  if (size < 7 || data[0] != 0xFF || (data[1] & 0xF0) != 0xF0) return 0;
  const bool protection_absent = (data[1] & 0x01) != 0;
  const size_t len = protection_absent ? 7 : 9;
  return size >= len ? len : 0;
}
}  // namespace

AacPacketizer::AacPacketizer()
    : RtpPacketizer(kAudioPayloadType, kDefaultSampleRate, kAudioTrackChannel) {}

void AacPacketizer::SetAudioInfo(int sample_rate) {
  SetClockRate(static_cast<uint32_t>(sample_rate));
}

std::vector<RtpFrame> AacPacketizer::CreatePackets(const media::MediaFrame& frame) {
  std::vector<RtpFrame> out;
  const uint8_t* data = frame.Payload();
  size_t size = frame.PayloadSize();
  const size_t adts = AdtsHeaderLength(data, size);
  data += adts;
  size -= adts;
  if (size == 0) return out;

  const uint32_t ts = ToRtpTimestamp(frame.info.pts_us);
  // AU-header: 13-bit size (wraps for oversized AUs, as the field allows no more).
  const uint16_t au_header = static_cast<uint16_t>((size & 0x1FFF) << 3);
  const uint8_t section[4] = {0x00, 0x10, static_cast<uint8_t>(au_header >> 8),
                              static_cast<uint8_t>(au_header & 0xF8)};
  const size_t chunk = kMaxPayloadSize - sizeof(section);

  size_t pos = 0;
  while (pos < size) {
    const size_t len = std::min(chunk, size - pos);
    const bool end = (pos + len == size);
    out.push_back(BuildPacket(ts, end, section, sizeof(section), data + pos, len));
    pos += len;
  }
  return out;
}

}  // namespace rtpcast::rtp
