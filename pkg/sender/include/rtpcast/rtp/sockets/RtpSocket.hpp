// Repository: Rtpcast-sender
// Component: RtpSocket Interface
// Purpose: Transport for RTP packets (UDP datagrams or TCP interleaved).
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_SOCKETS_RTP_SOCKET_HPP_
#define RTPCAST_RTP_SOCKETS_RTP_SOCKET_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include "rtpcast/media/MediaFrame.hpp"
#include "rtpcast/rtp/RtpFrame.hpp"

namespace rtpcast::net {
class TcpStreamSocket;
}  // namespace rtpcast::net

namespace rtpcast::rtp {

// RtpSocket is the transport seam used by the transmission loop.
//
// Contract:
// - SendFrame() writes (or buffers) one packet; Flush() pushes everything
//   buffered since the last flush. Called once per media frame.
// - Failures throw (std::system_error / std::runtime_error). The caller
//   treats any throw as fatal for the session.
// - IsStreamOriented() is true when each packet carries kTcpHeaderLength
//   bytes of framing on the wire; byte accounting depends on it.
// - Abort() may be called from another thread while SendFrame() or Flush()
//   is blocked; the blocked call then throws promptly.
// - Close() is idempotent.
class RtpSocket {
 public:
  virtual ~RtpSocket() = default;

  virtual void SendFrame(const RtpFrame& frame) = 0;
  virtual void Flush() = 0;
  virtual void Close() = 0;
  virtual bool IsStreamOriented() const = 0;

  // Datagram sends never park, so only stream transports override this.
  virtual void Abort() {}

  // Attaches the RTSP connection for interleaved transport. Ignored by
  // datagram transports.
  virtual void SetSocket(std::shared_ptr<net::TcpStreamSocket> socket) { (void)socket; }

  // Builds the transport for protocol. UDP opens its sockets immediately and
  // throws on failure; TCP waits for SetSocket().
  static std::unique_ptr<RtpSocket> Create(media::Protocol protocol, const std::string& host,
                                           uint16_t video_source_port,
                                           uint16_t audio_source_port,
                                           uint16_t video_server_port,
                                           uint16_t audio_server_port);
};

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_SOCKETS_RTP_SOCKET_HPP_
