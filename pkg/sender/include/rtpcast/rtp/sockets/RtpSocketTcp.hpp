// Repository: Rtpcast-sender
// Component: RtpSocketTcp
// Purpose: RTP interleaved on the RTSP connection (RFC 2326 section 10.12).
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_SOCKETS_RTP_SOCKET_TCP_HPP_
#define RTPCAST_RTP_SOCKETS_RTP_SOCKET_TCP_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "rtpcast/rtp/sockets/RtpSocket.hpp"

namespace rtpcast::rtp {

// Writes "$ <channel> <len16>" + packet into the shared stream socket and
// flushes on request. Abort() cancels a flush waiting on the peer without
// closing the connection, which belongs to the RTSP session; attaching a
// socket clears it.
class RtpSocketTcp : public RtpSocket {
 public:
  RtpSocketTcp() = default;

  void SetSocket(std::shared_ptr<net::TcpStreamSocket> socket) override;

  void SendFrame(const RtpFrame& frame) override;
  void Flush() override;
  void Close() override;
  void Abort() override { aborted_.store(true, std::memory_order_release); }
  bool IsStreamOriented() const override { return true; }

 private:
  std::shared_ptr<net::TcpStreamSocket> Socket() const;

  mutable std::mutex mutex_;
  std::shared_ptr<net::TcpStreamSocket> socket_;
  std::atomic<bool> aborted_{false};
};

// Writes one interleaved frame. Shared with the RTCP TCP writer.
void WriteInterleaved(net::TcpStreamSocket& socket, uint8_t channel, const uint8_t* data,
                      size_t len);

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_SOCKETS_RTP_SOCKET_TCP_HPP_
