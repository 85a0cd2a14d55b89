// Repository: Rtpcast-sender
// Component: RtpSocketUdp
// Purpose: RTP over UDP, one socket per media kind.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTP_SOCKETS_RTP_SOCKET_UDP_HPP_
#define RTPCAST_RTP_SOCKETS_RTP_SOCKET_UDP_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include "rtpcast/net/UdpSocket.hpp"
#include "rtpcast/rtp/sockets/RtpSocket.hpp"

namespace rtpcast::rtp {

// Each packet goes out as one datagram from the media kind's source port to
// its server port. Flush() has nothing to do.
class RtpSocketUdp : public RtpSocket {
 public:
  RtpSocketUdp(const std::string& host, uint16_t video_source_port, uint16_t audio_source_port,
               uint16_t video_server_port, uint16_t audio_server_port);

  void SendFrame(const RtpFrame& frame) override;
  void Flush() override {}
  void Close() override;
  bool IsStreamOriented() const override { return false; }

 private:
  net::UdpSocket video_socket_;
  net::UdpSocket audio_socket_;
};

}  // namespace rtpcast::rtp

#endif  // RTPCAST_RTP_SOCKETS_RTP_SOCKET_UDP_HPP_
