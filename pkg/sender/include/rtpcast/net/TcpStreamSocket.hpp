// Repository: Rtpcast-sender
// Component: TcpStreamSocket
// Purpose: Connected TCP stream shared by RTSP, interleaved RTP and RTCP.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_NET_TCP_STREAM_SOCKET_HPP_
#define RTPCAST_NET_TCP_STREAM_SOCKET_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rtpcast::net {

// TcpStreamSocket wraps a connected, non-blocking TCP socket.
//
// Write() appends to an internal buffer; Flush() pushes the buffer to the
// kernel with poll() + send(), bounded by write_timeout. The RTP and RTCP
// writers share one instance when media is interleaved, so both calls are
// serialized by an internal mutex.
//
// Failure reporting: Flush() throws std::system_error on a socket error and
// std::runtime_error on timeout or when the socket is closed. Callers treat
// either as fatal for the session.
class TcpStreamSocket {
 public:
  // Adopts a connected fd. TAKES OWNERSHIP and will close it. The fd is
  // switched to O_NONBLOCK.
  explicit TcpStreamSocket(int fd,
                           std::chrono::milliseconds write_timeout = std::chrono::seconds(5));
  ~TcpStreamSocket();

  TcpStreamSocket(const TcpStreamSocket&) = delete;
  TcpStreamSocket& operator=(const TcpStreamSocket&) = delete;

  // Resolves host and connects within timeout. Throws std::system_error or
  // std::runtime_error on failure.
  static std::shared_ptr<TcpStreamSocket> Connect(
      const std::string& host, uint16_t port,
      std::chrono::milliseconds timeout = std::chrono::seconds(5));

  // Appends bytes to the pending buffer. Throws if closed.
  void Write(const uint8_t* data, size_t len);

  // Sends everything pending. Throws on error or timeout, or within
  // kCancelCheckInterval once *cancel turns true.
  void Flush(const std::atomic<bool>* cancel = nullptr);

  static constexpr std::chrono::milliseconds kCancelCheckInterval{100};

  // Idempotent. Pending bytes are discarded.
  void Close();

  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }
  uint64_t GetBytesDelivered() const { return bytes_delivered_.load(std::memory_order_relaxed); }
  size_t GetPendingBytes() const;

 private:
  void SendAllLocked(const uint8_t* data, size_t len, const std::atomic<bool>* cancel);

  int fd_;
  std::chrono::milliseconds write_timeout_;
  std::atomic<bool> closed_{false};
  std::atomic<uint64_t> bytes_delivered_{0};

  mutable std::mutex mutex_;
  std::vector<uint8_t> pending_;
};

}  // namespace rtpcast::net

#endif  // RTPCAST_NET_TCP_STREAM_SOCKET_HPP_
