// Repository: Rtpcast-sender
// Component: TcpStreamSocket Implementation
// Purpose: Connected TCP stream shared by RTSP, interleaved RTP and RTCP.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/net/TcpStreamSocket.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "rtpcast/util/Logger.hpp"

namespace rtpcast::net {

namespace {

void SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    throw std::system_error(errno, std::generic_category(), "fcntl(O_NONBLOCK)");
  }
}

int ConnectWithTimeout(const addrinfo* ai, std::chrono::milliseconds timeout) {
  int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), "socket");
  }
  try {
    SetNonBlocking(fd);
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
      if (errno != EINPROGRESS) {
        throw std::system_error(errno, std::generic_category(), "connect");
      }
      struct pollfd pfd;
      pfd.fd = fd;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      int ret;
      do {
        ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
      } while (ret < 0 && errno == EINTR);
      if (ret < 0) {
        throw std::system_error(errno, std::generic_category(), "poll(connect)");
      }
      if (ret == 0) {
        throw std::runtime_error("connect timed out");
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        throw std::system_error(errno, std::generic_category(), "getsockopt(SO_ERROR)");
      }
      if (so_error != 0) {
        throw std::system_error(so_error, std::generic_category(), "connect");
      }
    }
  } catch (...) {
    ::close(fd);
    throw;
  }
  return fd;
}

}  // namespace

TcpStreamSocket::TcpStreamSocket(int fd, std::chrono::milliseconds write_timeout)
    : fd_(fd), write_timeout_(write_timeout) {
  try {
    SetNonBlocking(fd_);
  } catch (...) {
    ::close(fd_);
    throw;
  }
  int one = 1;
  // Latency matters more than segment count for media.
  setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

TcpStreamSocket::~TcpStreamSocket() {
  Close();
}

std::shared_ptr<TcpStreamSocket> TcpStreamSocket::Connect(const std::string& host,
                                                          uint16_t port,
                                                          std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const std::string service = std::to_string(port);
  int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    throw std::runtime_error("getaddrinfo(" + host + "): " + gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(result, &freeaddrinfo);

  std::string last_error = "no address";
  for (const addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    try {
      int fd = ConnectWithTimeout(ai, timeout);
      util::Logger::Info("[TcpStreamSocket] Connected to " + host + ":" + service);
      return std::make_shared<TcpStreamSocket>(fd);
    } catch (const std::exception& e) {
      last_error = e.what();
    }
  }
  throw std::runtime_error("connect to " + host + ":" + service + " failed: " + last_error);
}

void TcpStreamSocket::Write(const uint8_t* data, size_t len) {
  if (closed_.load(std::memory_order_acquire)) {
    throw std::runtime_error("socket closed");
  }
  if (!data || len == 0) return;
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.insert(pending_.end(), data, data + len);
}

void TcpStreamSocket::Flush(const std::atomic<bool>* cancel) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_.load(std::memory_order_acquire)) {
    throw std::runtime_error("socket closed");
  }
  if (pending_.empty()) return;
  std::vector<uint8_t> out;
  out.swap(pending_);
  SendAllLocked(out.data(), out.size(), cancel);
}

void TcpStreamSocket::SendAllLocked(const uint8_t* data, size_t len,
                                    const std::atomic<bool>* cancel) {
  const auto deadline = std::chrono::steady_clock::now() + write_timeout_;
  const uint8_t* ptr = data;
  size_t remaining = len;

  while (remaining > 0) {
    if (cancel != nullptr && cancel->load(std::memory_order_acquire)) {
      throw std::runtime_error("send cancelled with " + std::to_string(remaining) +
                               " bytes pending");
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      throw std::runtime_error("send timed out with " + std::to_string(remaining) +
                               " bytes pending");
    }
    auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    if (cancel != nullptr && wait_ms > kCancelCheckInterval.count()) {
      wait_ms = kCancelCheckInterval.count();
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int poll_ret = poll(&pfd, 1, static_cast<int>(wait_ms));
    if (poll_ret < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "poll");
    }
    if (poll_ret == 0) continue;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      throw std::runtime_error("connection closed by peer");
    }

    ssize_t n = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "send");
    }
    ptr += n;
    remaining -= static_cast<size_t>(n);
    bytes_delivered_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
  }
}

size_t TcpStreamSocket::GetPendingBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

void TcpStreamSocket::Close() {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;  // Already closed
  }
  // Shut down before taking the lock so a Flush() parked in poll() wakes
  // with POLLHUP instead of running out its write timeout.
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.clear();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace rtpcast::net
