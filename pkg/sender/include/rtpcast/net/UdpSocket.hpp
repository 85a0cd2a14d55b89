// Repository: Rtpcast-sender
// Component: UdpSocket
// Purpose: Connected datagram socket bound to a fixed local port.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_NET_UDP_SOCKET_HPP_
#define RTPCAST_NET_UDP_SOCKET_HPP_

#include <atomic>
#include <cstdint>
#include <string>

namespace rtpcast::net {

// UdpSocket sends datagrams from local_port (0 = ephemeral) to
// host:remote_port. The socket is connect()ed so ICMP port-unreachable is
// reported on a later Send() as ECONNREFUSED.
//
// Send() throws std::system_error on failure. Close() is idempotent.
class UdpSocket {
 public:
  UdpSocket(const std::string& host, uint16_t remote_port, uint16_t local_port = 0);
  ~UdpSocket();

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  void Send(const uint8_t* data, size_t len);
  void Close();

  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }
  uint16_t LocalPort() const { return local_port_; }
  uint16_t RemotePort() const { return remote_port_; }

 private:
  int fd_ = -1;
  uint16_t local_port_;
  uint16_t remote_port_;
  std::atomic<bool> closed_{false};
};

}  // namespace rtpcast::net

#endif  // RTPCAST_NET_UDP_SOCKET_HPP_
