// Repository: Rtpcast-sender
// Component: Thread-Safe Logger
// Purpose: Serialized log lines shared by the producer, sender threads and control handlers.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace rtpcast::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::error_sink_;
Logger::Sink Logger::warn_sink_;
Logger::Sink Logger::info_sink_;

bool Logger::DebugEnabled() {
  static const bool enabled = std::getenv("RTPCAST_DEBUG") != nullptr;
  return enabled;
}

void Logger::SetErrorSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetInfoSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(Level::kDebug, line);
}

void Logger::Emit(Level level, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Sink* sink = nullptr;
  std::ostream* out = &std::cout;
  switch (level) {
    case Level::kDebug:
      break;
    case Level::kInfo:
      sink = &info_sink_;
      break;
    case Level::kWarn:
      sink = &warn_sink_;
      out = &std::cerr;
      break;
    case Level::kError:
      sink = &error_sink_;
      out = &std::cerr;
      break;
  }
  if (sink != nullptr && *sink) {
    (*sink)(line);
  }
  *out << line << '\n';
  out->flush();
}

}  // namespace rtpcast::util
