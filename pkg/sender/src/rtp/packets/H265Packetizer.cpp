// Repository: Rtpcast-sender
// Component: H265Packetizer
// Purpose: RFC 7798 packetization (single NAL, FU).
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/rtp/packets/H265Packetizer.hpp"

#include <algorithm>

#include "rtpcast/rtp/packets/NalUnits.hpp"

namespace rtpcast::rtp {

namespace {
// BLA_W_LP .. CRA_NUT
bool IsIrap(uint8_t type) { return type >= 16 && type <= 21; }
}  // namespace

H265Packetizer::H265Packetizer()
    : RtpPacketizer(kVideoPayloadType, kVideoClockRate, kVideoTrackChannel) {}

void H265Packetizer::SetVideoInfo(const std::vector<uint8_t>& sps,
                                  const std::vector<uint8_t>& pps,
                                  const std::vector<uint8_t>& vps) {
  sps_ = StripStartCode(sps);
  pps_ = StripStartCode(pps);
  vps_ = StripStartCode(vps);
}

std::vector<RtpFrame> H265Packetizer::CreatePackets(const media::MediaFrame& frame) {
  std::vector<RtpFrame> out;
  const std::vector<NalUnit> all = SplitAnnexB(frame.Payload(), frame.PayloadSize());
  const bool have_params = !vps_.empty() && !sps_.empty() && !pps_.empty();

  std::vector<NalUnit> nals;
  bool irap = false;
  for (const NalUnit& nal : all) {
    if (nal.size < 2) continue;
    const uint8_t type = NalType(nal.data);
    if (IsIrap(type)) irap = true;
    if (type == kNalTypeAud) continue;
    if (have_params && (type == kNalTypeVps || type == kNalTypeSps || type == kNalTypePps)) {
      continue;
    }
    nals.push_back(nal);
  }
  if (nals.empty()) return out;

  const uint32_t ts = ToRtpTimestamp(frame.info.pts_us);

  if (have_params && (irap || frame.info.is_keyframe)) {
    for (const std::vector<uint8_t>* ps : {&vps_, &sps_, &pps_}) {
      AppendNal(ps->data(), ps->size(), ts, false, out);
    }
  }

  for (size_t i = 0; i < nals.size(); ++i) {
    AppendNal(nals[i].data, nals[i].size, ts, i + 1 == nals.size(), out);
  }
  return out;
}

void H265Packetizer::AppendNal(const uint8_t* nal, size_t size, uint32_t ts, bool last,
                               std::vector<RtpFrame>& out) {
  if (size <= kMaxPayloadSize) {
    out.push_back(BuildPacket(ts, last, nullptr, 0, nal, size));
    return;
  }

  // Payload header keeps F, LayerId and TID; type becomes FU.
  const uint8_t header0 = static_cast<uint8_t>((nal[0] & 0x81) | (kNalTypeFu << 1));
  const uint8_t header1 = nal[1];
  const uint8_t nal_type = NalType(nal);
  const size_t chunk = kMaxPayloadSize - 3;

  size_t pos = 2;
  while (pos < size) {
    const size_t len = std::min(chunk, size - pos);
    const bool start = (pos == 2);
    const bool end = (pos + len == size);
    const uint8_t fu[3] = {
        header0, header1,
        static_cast<uint8_t>((start ? 0x80 : 0x00) | (end ? 0x40 : 0x00) | nal_type)};
    out.push_back(BuildPacket(ts, last && end, fu, sizeof(fu), nal + pos, len));
    pos += len;
  }
}

}  // namespace rtpcast::rtp
