// Repository: Rtpcast-sender
// Component: Media Frame Types
// Purpose: Encoded access units handed to the sender by the upstream encoder.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_MEDIA_MEDIA_FRAME_HPP_
#define RTPCAST_MEDIA_MEDIA_FRAME_HPP_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace rtpcast::media {

enum class MediaType {
  kVideo,
  kAudio,
};

enum class VideoCodec {
  kH264,
  kH265,
  kAV1,
};

enum class AudioCodec {
  kAAC,
  kG711,
  kOpus,
};

// Transport used for RTP/RTCP. TCP means RTP interleaved on the RTSP
// connection; UDP means one datagram per packet on dedicated ports.
enum class Protocol {
  kTcp,
  kUdp,
};

inline const char* MediaTypeToString(MediaType type) {
  switch (type) {
    case MediaType::kVideo: return "Video";
    case MediaType::kAudio: return "Audio";
    default: return "Unknown";
  }
}

inline const char* VideoCodecToString(VideoCodec codec) {
  switch (codec) {
    case VideoCodec::kH264: return "H264";
    case VideoCodec::kH265: return "H265";
    case VideoCodec::kAV1: return "AV1";
    default: return "Unknown";
  }
}

inline const char* AudioCodecToString(AudioCodec codec) {
  switch (codec) {
    case AudioCodec::kAAC: return "AAC";
    case AudioCodec::kG711: return "G711";
    case AudioCodec::kOpus: return "OPUS";
    default: return "Unknown";
  }
}

inline const char* ProtocolToString(Protocol protocol) {
  switch (protocol) {
    case Protocol::kTcp: return "TCP";
    case Protocol::kUdp: return "UDP";
    default: return "Unknown";
  }
}

// Encoder-side metadata for one access unit.
// offset/size delimit the valid region of MediaFrame::data; size == 0 means
// "the whole buffer".
struct FrameInfo {
  int64_t pts_us = 0;
  bool is_keyframe = false;
  size_t offset = 0;
  size_t size = 0;
};

// One encoded audio or video access unit.
// Immutable once handed to the sender; moved into the frame queue and owned
// by the transmission loop after dequeue.
struct MediaFrame {
  MediaType type = MediaType::kVideo;
  std::vector<uint8_t> data;
  FrameInfo info;

  // Start of the valid payload region.
  const uint8_t* Payload() const {
    return data.data() + std::min(info.offset, data.size());
  }

  // Length of the valid payload region.
  size_t PayloadSize() const {
    if (info.offset >= data.size()) return 0;
    const size_t available = data.size() - info.offset;
    return info.size == 0 ? available : std::min(info.size, available);
  }
};

}  // namespace rtpcast::media

#endif  // RTPCAST_MEDIA_MEDIA_FRAME_HPP_
