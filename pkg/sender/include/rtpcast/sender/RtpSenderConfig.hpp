// Repository: Rtpcast-sender
// Component: RtpSender Configuration
// Purpose: Tunables for the frame queue, transmission and measurement loops.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_SENDER_RTP_SENDER_CONFIG_HPP_
#define RTPCAST_SENDER_RTP_SENDER_CONFIG_HPP_

#include <chrono>
#include <cstddef>

#include "rtpcast/media/MediaFrame.hpp"

namespace rtpcast::sender {

struct RtpSenderConfig {
  // Frame queue capacity (media frames, not bytes).
  size_t cache_size = 200;

  // Per-packet and per-report log lines.
  bool enable_logs = true;

  // Longest the transmission loop waits on an empty queue before
  // re-checking cancellation.
  std::chrono::milliseconds poll_timeout{1000};

  // Measurement loop sampling period.
  std::chrono::milliseconds bitrate_interval{1000};

  // Negotiated codecs. SetVideoInfo()/SetAudioInfo() build the packetizer
  // for whichever codec is current.
  media::VideoCodec video_codec = media::VideoCodec::kH264;
  media::AudioCodec audio_codec = media::AudioCodec::kAAC;
};

}  // namespace rtpcast::sender

#endif  // RTPCAST_SENDER_RTP_SENDER_CONFIG_HPP_
