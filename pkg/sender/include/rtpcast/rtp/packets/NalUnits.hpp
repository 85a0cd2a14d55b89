// Repository: Rtpcast-sender
// Component: NAL Unit Helpers
// Purpose: Annex-B start-code scanning shared by the H264 and H265 packetizers.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_PACKETS_NAL_UNITS_HPP_
#define RTPCAST_RTP_PACKETS_NAL_UNITS_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rtpcast::rtp {

// View into a caller-owned buffer. Does not include the start code.
struct NalUnit {
  const uint8_t* data = nullptr;
  size_t size = 0;
};

// Splits an Annex-B byte stream (00 00 01 / 00 00 00 01 delimited) into NAL
// units. A buffer with no start code is returned as a single NAL unit.
// Empty NAL units are skipped.
std::vector<NalUnit> SplitAnnexB(const uint8_t* data, size_t size);

// Returns a copy of a parameter set with any leading start code removed.
std::vector<uint8_t> StripStartCode(const std::vector<uint8_t>& nal);

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_PACKETS_NAL_UNITS_HPP_
