// Repository: Rtpcast-sender
// Component: UdpSocket Implementation
// Purpose: Connected datagram socket bound to a fixed local port.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/net/UdpSocket.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <system_error>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace rtpcast::net {

UdpSocket::UdpSocket(const std::string& host, uint16_t remote_port, uint16_t local_port)
    : local_port_(local_port), remote_port_(remote_port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_DGRAM;
  addrinfo* result = nullptr;
  const std::string service = std::to_string(remote_port);
  int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    throw std::runtime_error("getaddrinfo(" + host + "): " + gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(result, &freeaddrinfo);

  fd_ = ::socket(result->ai_family, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    throw std::system_error(errno, std::generic_category(), "socket");
  }

  int err = 0;
  const char* what = nullptr;
  if (local_port != 0) {
    int one = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (result->ai_family == AF_INET6) {
      sockaddr_in6 local{};
      local.sin6_family = AF_INET6;
      local.sin6_addr = in6addr_any;
      local.sin6_port = htons(local_port);
      if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        err = errno;
        what = "bind";
      }
    } else {
      sockaddr_in local{};
      local.sin_family = AF_INET;
      local.sin_addr.s_addr = htonl(INADDR_ANY);
      local.sin_port = htons(local_port);
      if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        err = errno;
        what = "bind";
      }
    }
  }
  if (err == 0 && ::connect(fd_, result->ai_addr, result->ai_addrlen) < 0) {
    err = errno;
    what = "connect";
  }
  if (err != 0) {
    ::close(fd_);
    fd_ = -1;
    throw std::system_error(err, std::generic_category(), what);
  }
}

UdpSocket::~UdpSocket() {
  Close();
}

void UdpSocket::Send(const uint8_t* data, size_t len) {
  if (closed_.load(std::memory_order_acquire)) {
    throw std::runtime_error("socket closed");
  }
  while (true) {
    ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
    if (n >= 0) return;
    if (errno == EINTR) continue;
    throw std::system_error(errno, std::generic_category(), "send");
  }
}

void UdpSocket::Close() {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace rtpcast::net
