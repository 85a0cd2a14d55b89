// Repository: Rtpcast-sender
// Component: RTP Constants
// Purpose: Wire-level sizes, clock rates and channel assignments shared by
//          packetizers, sockets and the sender-report generator.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_RTP_CONSTANTS_HPP_
#define RTPCAST_RTP_RTP_CONSTANTS_HPP_

#include <cstddef>
#include <cstdint>

namespace rtpcast::rtp {

constexpr size_t kRtpHeaderLength = 12;
constexpr size_t kMtu = 1500;
// IP (20) + UDP (8) subtracted from the MTU.
constexpr size_t kMaxPacketSize = kMtu - 28;

// '$' + channel + 16-bit length prefixed to every interleaved packet.
constexpr size_t kTcpHeaderLength = 4;

// RTCP sender report without report blocks.
constexpr size_t kReportPacketLength = 28;
constexpr int64_t kReportIntervalMs = 3000;

constexpr uint8_t kVideoPayloadType = 96;
constexpr uint8_t kAudioPayloadType = 97;
constexpr uint8_t kG711PayloadType = 8;  // PCMA

constexpr uint32_t kVideoClockRate = 90000;
constexpr uint32_t kOpusClockRate = 48000;

// Interleaved channel numbers (RTP even, RTCP odd).
constexpr uint8_t kVideoTrackChannel = 0;
constexpr uint8_t kAudioTrackChannel = 2;

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_RTP_CONSTANTS_HPP_
