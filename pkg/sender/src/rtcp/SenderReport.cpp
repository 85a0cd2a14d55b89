// Repository: Rtpcast-sender
// Component: Sender Report Generator Implementation
// Purpose: SR encoding, per-kind interval accounting, UDP and TCP writers.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/rtcp/BaseSenderReport.hpp"

#include <stdexcept>

#include "rtpcast/net/TcpStreamSocket.hpp"
#include "rtpcast/rtcp/SenderReportTcp.hpp"
#include "rtpcast/rtcp/SenderReportUdp.hpp"
#include "rtpcast/rtp/sockets/RtpSocketTcp.hpp"

namespace rtpcast::rtcp {

namespace {

// Seconds between 1900-01-01 (NTP era 0) and 1970-01-01.
constexpr uint64_t kNtpUnixOffsetSeconds = 2208988800ULL;
constexpr uint8_t kSenderReportType = 200;

void PutU32(uint8_t* out, uint32_t v) {
  out[0] = static_cast<uint8_t>(v >> 24);
  out[1] = static_cast<uint8_t>(v >> 16);
  out[2] = static_cast<uint8_t>(v >> 8);
  out[3] = static_cast<uint8_t>(v);
}

}  // namespace

BaseSenderReport::BaseSenderReport(std::chrono::milliseconds interval) : interval_(interval) {}

void BaseSenderReport::SetSsrc(uint32_t video_ssrc, uint32_t audio_ssrc) {
  video_.ssrc = video_ssrc;
  audio_.ssrc = audio_ssrc;
}

bool BaseSenderReport::Update(const rtp::RtpFrame& frame) {
  const bool is_video = frame.IsVideoFrame();
  TrackState& track = is_video ? video_ : audio_;
  track.packet_count++;
  track.octet_count += frame.length();

  const auto now = std::chrono::steady_clock::now();
  if (track.reported && now - track.last_report < interval_) {
    return false;
  }
  track.reported = true;
  track.last_report = now;
  SendReport(Encode(track.ssrc, std::chrono::system_clock::now(), frame.timestamp,
                    track.packet_count, track.octet_count),
             is_video);
  return true;
}

void BaseSenderReport::Reset() {
  video_.packet_count = 0;
  video_.octet_count = 0;
  video_.reported = false;
  audio_.packet_count = 0;
  audio_.octet_count = 0;
  audio_.reported = false;
}

ReportPacket BaseSenderReport::Encode(uint32_t ssrc,
                                      std::chrono::system_clock::time_point wall_clock,
                                      uint32_t rtp_timestamp, uint64_t packet_count,
                                      uint64_t octet_count) {
  ReportPacket out{};
  out[0] = 0x80;  // V=2, P=0, RC=0
  out[1] = kSenderReportType;
  // Length in 32-bit words minus one.
  out[2] = 0;
  out[3] = static_cast<uint8_t>(rtp::kReportPacketLength / 4 - 1);
  PutU32(&out[4], ssrc);

  const auto since_epoch =
      std::chrono::duration_cast<std::chrono::microseconds>(wall_clock.time_since_epoch());
  const uint64_t micros = static_cast<uint64_t>(since_epoch.count());
  const uint64_t seconds = micros / 1000000 + kNtpUnixOffsetSeconds;
  const uint64_t fraction = ((micros % 1000000) << 32) / 1000000;
  PutU32(&out[8], static_cast<uint32_t>(seconds));
  PutU32(&out[12], static_cast<uint32_t>(fraction));

  PutU32(&out[16], rtp_timestamp);
  PutU32(&out[20], static_cast<uint32_t>(packet_count));
  PutU32(&out[24], static_cast<uint32_t>(octet_count));
  return out;
}

std::unique_ptr<BaseSenderReport> BaseSenderReport::Create(media::Protocol protocol,
                                                           const std::string& host,
                                                           uint16_t video_source_port,
                                                           uint16_t audio_source_port,
                                                           uint16_t video_server_port,
                                                           uint16_t audio_server_port) {
  switch (protocol) {
    case media::Protocol::kUdp:
      return std::make_unique<SenderReportUdp>(host, video_source_port, audio_source_port,
                                               video_server_port, audio_server_port);
    case media::Protocol::kTcp:
    default:
      return std::make_unique<SenderReportTcp>();
  }
}

// =============================================================================
// UDP
// =============================================================================

SenderReportUdp::SenderReportUdp(const std::string& host, uint16_t video_source_port,
                                 uint16_t audio_source_port, uint16_t video_server_port,
                                 uint16_t audio_server_port)
    : video_socket_(host, video_server_port, video_source_port),
      audio_socket_(host, audio_server_port, audio_source_port) {}

void SenderReportUdp::SendReport(const ReportPacket& packet, bool is_video) {
  net::UdpSocket& socket = is_video ? video_socket_ : audio_socket_;
  socket.Send(packet.data(), packet.size());
}

void SenderReportUdp::Close() {
  video_socket_.Close();
  audio_socket_.Close();
}

// =============================================================================
// TCP interleaved
// =============================================================================

void SenderReportTcp::SetSocket(std::shared_ptr<net::TcpStreamSocket> socket) {
  std::lock_guard<std::mutex> lock(mutex_);
  socket_ = std::move(socket);
}

void SenderReportTcp::SendReport(const ReportPacket& packet, bool is_video) {
  std::shared_ptr<net::TcpStreamSocket> socket;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    socket = socket_;
  }
  if (!socket) {
    throw std::runtime_error("TCP socket not attached");
  }
  const uint8_t channel = static_cast<uint8_t>(
      (is_video ? rtp::kVideoTrackChannel : rtp::kAudioTrackChannel) + 1);
  rtp::WriteInterleaved(*socket, channel, packet.data(), packet.size());
}

void SenderReportTcp::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  socket_.reset();
}

}  // namespace rtpcast::rtcp
