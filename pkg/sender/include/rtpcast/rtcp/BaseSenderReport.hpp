// Repository: Rtpcast-sender
// Component: Sender Report Generator
// Purpose: Periodic RTCP sender reports (RFC 3550 section 6.4.1) per media kind.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTCP_BASE_SENDER_REPORT_HPP_
#define RTPCAST_RTCP_BASE_SENDER_REPORT_HPP_

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "rtpcast/media/MediaFrame.hpp"
#include "rtpcast/rtp/RtpFrame.hpp"

namespace rtpcast::net {
class TcpStreamSocket;
}  // namespace rtpcast::net

namespace rtpcast::rtcp {

using ReportPacket = std::array<uint8_t, rtp::kReportPacketLength>;

// BaseSenderReport counts packets and octets for video and audio separately.
// Update() is called for every RTP packet sent; once the report interval has
// elapsed for that packet's media kind, a sender report is written through
// the subclass transport and Update() returns true.
//
// The first Update() of each kind after construction or Reset() reports
// immediately.
//
// Called from the transmission thread only; Reset()/Close() run while that
// thread is stopped.
class BaseSenderReport {
 public:
  explicit BaseSenderReport(
      std::chrono::milliseconds interval = std::chrono::milliseconds(rtp::kReportIntervalMs));
  virtual ~BaseSenderReport() = default;

  BaseSenderReport(const BaseSenderReport&) = delete;
  BaseSenderReport& operator=(const BaseSenderReport&) = delete;

  virtual void SetSsrc(uint32_t video_ssrc, uint32_t audio_ssrc);

  // Throws whatever the transport throws.
  virtual bool Update(const rtp::RtpFrame& frame);

  // Zeroes counters and report timers.
  virtual void Reset();

  virtual void Close() = 0;

  // Attaches the RTSP connection for interleaved transport. Ignored by UDP.
  virtual void SetSocket(std::shared_ptr<net::TcpStreamSocket> socket) { (void)socket; }

  uint64_t VideoPacketCount() const { return video_.packet_count; }
  uint64_t VideoOctetCount() const { return video_.octet_count; }
  uint64_t AudioPacketCount() const { return audio_.packet_count; }
  uint64_t AudioOctetCount() const { return audio_.octet_count; }

  // Builds a 28-byte SR with no report blocks. Octet and packet counts are
  // truncated to 32 bits as on the wire.
  static ReportPacket Encode(uint32_t ssrc, std::chrono::system_clock::time_point wall_clock,
                             uint32_t rtp_timestamp, uint64_t packet_count,
                             uint64_t octet_count);

  static std::unique_ptr<BaseSenderReport> Create(media::Protocol protocol,
                                                  const std::string& host,
                                                  uint16_t video_source_port,
                                                  uint16_t audio_source_port,
                                                  uint16_t video_server_port,
                                                  uint16_t audio_server_port);

 protected:
  virtual void SendReport(const ReportPacket& packet, bool is_video) = 0;

 private:
  struct TrackState {
    uint32_t ssrc = 0;
    uint64_t packet_count = 0;
    uint64_t octet_count = 0;
    bool reported = false;
    std::chrono::steady_clock::time_point last_report;
  };

  std::chrono::milliseconds interval_;
  TrackState video_;
  TrackState audio_;
};

}  // namespace rtpcast::rtcp

#endif  // RTPCAST_RTCP_BASE_SENDER_REPORT_HPP_
