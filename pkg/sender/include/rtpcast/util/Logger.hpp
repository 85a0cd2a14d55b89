// Repository: Rtpcast-sender
// Component: Thread-Safe Logger
// Purpose: Serialized log lines shared by the producer, sender threads and control handlers.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_UTIL_LOGGER_HPP_
#define RTPCAST_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace rtpcast::util {

// Logger writes whole lines under one static mutex, so lines from the
// producer thread, the transmission loop, the bitrate loop and gRPC handlers
// never interleave.
//
//   Info, Debug: stdout. Debug is dropped unless RTPCAST_DEBUG is set.
//   Warn, Error: stderr.
//
// Callers prefix lines with their component tag, e.g. "[RtpSender] ...".
//
// Test-only: sinks receive every line of their level in addition to the
// stream, so tests can assert on emitted lines.
class Logger {
 public:
  enum class Level { kDebug, kInfo, kWarn, kError };

  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line) { Emit(Level::kInfo, line); }
  static void Debug(const std::string& line);
  static void Warn(const std::string& line) { Emit(Level::kWarn, line); }
  static void Error(const std::string& line) { Emit(Level::kError, line); }

  static bool DebugEnabled();

  // Test-only. Pass nullptr to clear.
  static void SetErrorSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetInfoSink(Sink sink);

 private:
  static void Emit(Level level, const std::string& line);

  static std::mutex mutex_;
  static Sink error_sink_;
  static Sink warn_sink_;
  static Sink info_sink_;
};

}  // namespace rtpcast::util

#endif  // RTPCAST_UTIL_LOGGER_HPP_
