// Repository: Rtpcast-sender
// Component: Av1Packetizer
// Purpose: AV1 RTP payload packetization (one OBU element per packet).
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/rtp/packets/Av1Packetizer.hpp"

#include <algorithm>
#include <stdexcept>

namespace rtpcast::rtp {

namespace {

struct Obu {
  uint8_t type = 0;
  std::vector<uint8_t> element;  // header (size flag cleared) + payload
};

// Reads a leb128 value. Returns bytes consumed, 0 on malformed input.
size_t ReadLeb128(const uint8_t* data, size_t size, uint64_t* value) {
  uint64_t v = 0;
  for (size_t i = 0; i < 8 && i < size; ++i) {
    v |= static_cast<uint64_t>(data[i] & 0x7F) << (7 * i);
    if ((data[i] & 0x80) == 0) {
      *value = v;
      return i + 1;
    }
  }
  return 0;
}

std::vector<Obu> ParseObus(const uint8_t* data, size_t size) {
  std::vector<Obu> obus;
  size_t pos = 0;
  while (pos < size) {
    const uint8_t header = data[pos];
    const bool has_extension = (header & 0x04) != 0;
    const bool has_size = (header & 0x02) != 0;
    const size_t header_len = has_extension ? 2 : 1;
    if (pos + header_len > size) {
      throw std::runtime_error("AV1: truncated OBU header");
    }

    uint64_t payload_len = 0;
    size_t leb_len = 0;
    if (has_size) {
      leb_len = ReadLeb128(data + pos + header_len, size - pos - header_len, &payload_len);
      if (leb_len == 0) throw std::runtime_error("AV1: malformed OBU size");
    } else {
      payload_len = size - pos - header_len;
    }
    const size_t payload_pos = pos + header_len + leb_len;
    if (payload_pos + payload_len > size) {
      throw std::runtime_error("AV1: OBU exceeds temporal unit");
    }

    Obu obu;
    obu.type = (header >> 3) & 0x0F;
    obu.element.reserve(header_len + payload_len);
    obu.element.push_back(static_cast<uint8_t>(header & ~0x02));
    if (has_extension) obu.element.push_back(data[pos + 1]);
    obu.element.insert(obu.element.end(), data + payload_pos,
                       data + payload_pos + payload_len);
    obus.push_back(std::move(obu));

    pos = payload_pos + static_cast<size_t>(payload_len);
  }
  return obus;
}

}  // namespace

Av1Packetizer::Av1Packetizer()
    : RtpPacketizer(kVideoPayloadType, kVideoClockRate, kVideoTrackChannel) {}

std::vector<RtpFrame> Av1Packetizer::CreatePackets(const media::MediaFrame& frame) {
  std::vector<RtpFrame> out;
  std::vector<Obu> obus = ParseObus(frame.Payload(), frame.PayloadSize());
  obus.erase(std::remove_if(obus.begin(), obus.end(),
                            [](const Obu& o) {
                              return o.type == kObuTemporalDelimiter || o.type == kObuTileList;
                            }),
             obus.end());
  if (obus.empty()) return out;

  const uint32_t ts = ToRtpTimestamp(frame.info.pts_us);
  const bool new_sequence =
      frame.info.is_keyframe && obus.front().type == kObuSequenceHeader;
  const size_t chunk = kMaxPayloadSize - 1;

  for (size_t i = 0; i < obus.size(); ++i) {
    const std::vector<uint8_t>& element = obus[i].element;
    const bool last_obu = (i + 1 == obus.size());
    size_t pos = 0;
    while (pos < element.size()) {
      const size_t len = std::min(chunk, element.size() - pos);
      const bool continues = pos > 0;
      const bool more = pos + len < element.size();
      uint8_t agg = kAggW1;
      if (continues) agg |= kAggZ;
      if (more) agg |= kAggY;
      if (new_sequence && out.empty()) agg |= kAggN;
      out.push_back(BuildPacket(ts, last_obu && !more, &agg, 1, element.data() + pos, len));
      pos += len;
    }
  }
  return out;
}

}  // namespace rtpcast::rtp
