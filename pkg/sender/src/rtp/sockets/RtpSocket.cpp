// Repository: Rtpcast-sender
// Component: RtpSocket Implementations
// Purpose: UDP and TCP-interleaved RTP transports.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/rtp/sockets/RtpSocket.hpp"

#include <stdexcept>
#include <string>

#include "rtpcast/net/TcpStreamSocket.hpp"
#include "rtpcast/rtp/sockets/RtpSocketTcp.hpp"
#include "rtpcast/rtp/sockets/RtpSocketUdp.hpp"

namespace rtpcast::rtp {

std::unique_ptr<RtpSocket> RtpSocket::Create(media::Protocol protocol, const std::string& host,
                                             uint16_t video_source_port,
                                             uint16_t audio_source_port,
                                             uint16_t video_server_port,
                                             uint16_t audio_server_port) {
  switch (protocol) {
    case media::Protocol::kUdp:
      return std::make_unique<RtpSocketUdp>(host, video_source_port, audio_source_port,
                                            video_server_port, audio_server_port);
    case media::Protocol::kTcp:
    default:
      return std::make_unique<RtpSocketTcp>();
  }
}

// =============================================================================
// TCP interleaved
// =============================================================================

void WriteInterleaved(net::TcpStreamSocket& socket, uint8_t channel, const uint8_t* data,
                      size_t len) {
  if (len > 0xFFFF) {
    throw std::runtime_error("interleaved frame too large: " + std::to_string(len));
  }
  const uint8_t header[kTcpHeaderLength] = {'$', channel, static_cast<uint8_t>(len >> 8),
                                            static_cast<uint8_t>(len & 0xFF)};
  socket.Write(header, sizeof(header));
  socket.Write(data, len);
}

void RtpSocketTcp::SetSocket(std::shared_ptr<net::TcpStreamSocket> socket) {
  std::lock_guard<std::mutex> lock(mutex_);
  socket_ = std::move(socket);
  aborted_.store(false, std::memory_order_release);
}

std::shared_ptr<net::TcpStreamSocket> RtpSocketTcp::Socket() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!socket_) {
    throw std::runtime_error("TCP socket not attached");
  }
  return socket_;
}

void RtpSocketTcp::SendFrame(const RtpFrame& frame) {
  WriteInterleaved(*Socket(), frame.channel_identifier, frame.buffer.data(), frame.length());
}

void RtpSocketTcp::Flush() {
  Socket()->Flush(&aborted_);
}

void RtpSocketTcp::Close() {
  // The connection belongs to the RTSP session; only drop our reference.
  std::lock_guard<std::mutex> lock(mutex_);
  socket_.reset();
}

// =============================================================================
// UDP
// =============================================================================

RtpSocketUdp::RtpSocketUdp(const std::string& host, uint16_t video_source_port,
                           uint16_t audio_source_port, uint16_t video_server_port,
                           uint16_t audio_server_port)
    : video_socket_(host, video_server_port, video_source_port),
      audio_socket_(host, audio_server_port, audio_source_port) {}

void RtpSocketUdp::SendFrame(const RtpFrame& frame) {
  net::UdpSocket& socket = frame.IsVideoFrame() ? video_socket_ : audio_socket_;
  socket.Send(frame.buffer.data(), frame.length());
}

void RtpSocketUdp::Close() {
  video_socket_.Close();
  audio_socket_.Close();
}

}  // namespace rtpcast::rtp
