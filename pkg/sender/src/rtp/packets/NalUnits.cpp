// Repository: Rtpcast-sender
// Component: NAL Unit Helpers
// Purpose: Annex-B start-code scanning shared by the H264 and H265 packetizers.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/rtp/packets/NalUnits.hpp"

#include <cstddef>
#include <utility>

namespace rtpcast::rtp {

namespace {

// Returns the length of the start code at position i, or 0 if none.
size_t StartCodeLength(const uint8_t* data, size_t size, size_t i) {
  if (i + 3 <= size && data[i] == 0 && data[i + 1] == 0 && data[i + 2] == 1) {
    return 3;
  }
  if (i + 4 <= size && data[i] == 0 && data[i + 1] == 0 && data[i + 2] == 0 &&
      data[i + 3] == 1) {
    return 4;
  }
  return 0;
}

}  // namespace

std::vector<NalUnit> SplitAnnexB(const uint8_t* data, size_t size) {
  std::vector<NalUnit> units;
  if (data == nullptr || size == 0) return units;

  // Locate every start code first, then cut between them.
  std::vector<std::pair<size_t, size_t>> codes;  // (position, length)
  for (size_t i = 0; i + 3 <= size;) {
    const size_t len = StartCodeLength(data, size, i);
    if (len > 0) {
      codes.emplace_back(i, len);
      i += len;
    } else {
      ++i;
    }
  }

  if (codes.empty()) {
    units.push_back(NalUnit{data, size});
    return units;
  }

  // Bytes before the first start code are not part of any NAL unit.
  for (size_t k = 0; k < codes.size(); ++k) {
    const size_t begin = codes[k].first + codes[k].second;
    const size_t end = (k + 1 < codes.size()) ? codes[k + 1].first : size;
    if (end > begin) {
      units.push_back(NalUnit{data + begin, end - begin});
    }
  }
  return units;
}

std::vector<uint8_t> StripStartCode(const std::vector<uint8_t>& nal) {
  const size_t len = StartCodeLength(nal.data(), nal.size(), 0);
  return std::vector<uint8_t>(nal.begin() + static_cast<std::ptrdiff_t>(len), nal.end());
}

}  // namespace rtpcast::rtp
