// Repository: Rtpcast-sender
// Component: H264Packetizer
// Purpose: RFC 6184 packetization (single NAL, STAP-A, FU-A).
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/rtp/packets/H264Packetizer.hpp"

#include <algorithm>

#include "rtpcast/rtp/packets/NalUnits.hpp"

namespace rtpcast::rtp {

H264Packetizer::H264Packetizer()
    : RtpPacketizer(kVideoPayloadType, kVideoClockRate, kVideoTrackChannel) {}

void H264Packetizer::SetVideoInfo(const std::vector<uint8_t>& sps,
                                  const std::vector<uint8_t>& pps) {
  sps_ = StripStartCode(sps);
  pps_ = StripStartCode(pps);
}

std::vector<RtpFrame> H264Packetizer::CreatePackets(const media::MediaFrame& frame) {
  std::vector<RtpFrame> out;
  const std::vector<NalUnit> all = SplitAnnexB(frame.Payload(), frame.PayloadSize());
  const bool have_params = !sps_.empty() && !pps_.empty();

  std::vector<NalUnit> nals;
  bool idr = false;
  for (const NalUnit& nal : all) {
    const uint8_t type = nal.data[0] & 0x1F;
    if (type == kNalTypeIdr) idr = true;
    if (type == kNalTypeAud) continue;
    if (have_params && (type == kNalTypeSps || type == kNalTypePps)) continue;
    nals.push_back(nal);
  }
  if (nals.empty()) return out;

  const uint32_t ts = ToRtpTimestamp(frame.info.pts_us);

  if (have_params && (idr || frame.info.is_keyframe)) {
    // STAP-A: NRI taken from the SPS, then (size, NAL) pairs.
    std::vector<uint8_t> stap;
    stap.reserve(1 + 2 + sps_.size() + 2 + pps_.size());
    stap.push_back(static_cast<uint8_t>((sps_[0] & 0x60) | kNalTypeStapA));
    for (const std::vector<uint8_t>* ps : {&sps_, &pps_}) {
      stap.push_back(static_cast<uint8_t>(ps->size() >> 8));
      stap.push_back(static_cast<uint8_t>(ps->size()));
      stap.insert(stap.end(), ps->begin(), ps->end());
    }
    out.push_back(BuildPacket(ts, false, nullptr, 0, stap.data(), stap.size()));
  }

  for (size_t i = 0; i < nals.size(); ++i) {
    AppendNal(nals[i].data, nals[i].size, ts, i + 1 == nals.size(), out);
  }
  return out;
}

void H264Packetizer::AppendNal(const uint8_t* nal, size_t size, uint32_t ts, bool last,
                               std::vector<RtpFrame>& out) {
  if (size <= kMaxPayloadSize) {
    out.push_back(BuildPacket(ts, last, nullptr, 0, nal, size));
    return;
  }

  // FU-A: the original NAL header is folded into indicator + FU header.
  const uint8_t indicator = static_cast<uint8_t>((nal[0] & 0xE0) | kNalTypeFuA);
  const uint8_t nal_type = nal[0] & 0x1F;
  const size_t chunk = kMaxPayloadSize - 2;

  size_t pos = 1;
  while (pos < size) {
    const size_t len = std::min(chunk, size - pos);
    const bool start = (pos == 1);
    const bool end = (pos + len == size);
    const uint8_t fu[2] = {
        indicator,
        static_cast<uint8_t>((start ? 0x80 : 0x00) | (end ? 0x40 : 0x00) | nal_type)};
    out.push_back(BuildPacket(ts, last && end, fu, sizeof(fu), nal + pos, len));
    pos += len;
  }
}

}  // namespace rtpcast::rtp
