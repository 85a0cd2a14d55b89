// Repository: Rtpcast-sender
// Component: Standalone Sender Harness
// Purpose: Feeds synthetic encoded frames through RtpSender to a real RTP
//          receiver for diagnostics.
// Copyright (c) 2025 Rtpcast contributors
//
// This binary is for testing and diagnostics only. There is no RTSP
// handshake: ports and codecs are given on the command line, and the TCP
// mode connects straight to a listener that accepts interleaved RTP.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "control/SenderControlService.h"
#include "rtpcast/net/TcpStreamSocket.hpp"
#include "rtpcast/sender/RtpSender.hpp"
#include "rtpcast/util/Logger.hpp"

namespace {

using rtpcast::media::AudioCodec;
using rtpcast::media::MediaFrame;
using rtpcast::media::MediaType;
using rtpcast::media::Protocol;
using rtpcast::media::VideoCodec;
using rtpcast::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string host = "127.0.0.1";
  Protocol protocol = Protocol::kUdp;
  uint16_t video_server_port = 5004;
  uint16_t audio_server_port = 5006;
  uint16_t video_source_port = 0;
  uint16_t audio_source_port = 0;
  uint16_t tcp_port = 8554;
  VideoCodec video_codec = VideoCodec::kH264;
  AudioCodec audio_codec = AudioCodec::kAAC;
  int fps = 30;
  size_t frame_bytes = 4000;
  int sample_rate = 44100;
  int duration_s = 10;
  size_t cache_size = 200;
  bool quiet = false;
  std::string control_address;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Sends synthetic audio/video frames over RTP for diagnostics.\n"
            << "\n"
            << "TRANSPORT:\n"
            << "  --host HOST              Receiver address (default: 127.0.0.1)\n"
            << "  --protocol udp|tcp       RTP transport (default: udp)\n"
            << "  --video-port N           Receiver video RTP port, RTCP is N+1 (default: 5004)\n"
            << "  --audio-port N           Receiver audio RTP port, RTCP is N+1 (default: 5006)\n"
            << "  --video-source-port N    Local video RTP port, 0 = ephemeral (default: 0)\n"
            << "  --audio-source-port N    Local audio RTP port, 0 = ephemeral (default: 0)\n"
            << "  --tcp-port N             Receiver TCP port for interleaved mode (default: 8554)\n"
            << "\n"
            << "MEDIA:\n"
            << "  --video-codec h264|h265|av1   (default: h264)\n"
            << "  --audio-codec aac|g711|opus   (default: aac)\n"
            << "  --fps N                  Video frames per second (default: 30)\n"
            << "  --frame-bytes N          Synthetic video frame size (default: 4000)\n"
            << "  --sample-rate N          Audio sample rate (default: 44100)\n"
            << "  --duration S             Seconds to run, 0 = until signal (default: 10)\n"
            << "\n"
            << "SENDER:\n"
            << "  --cache N                Frame queue capacity (default: 200)\n"
            << "  --quiet                  Disable per-packet logs\n"
            << "  --control ADDR           Serve SenderControl gRPC on ADDR (e.g. 0.0.0.0:50061)\n"
            << "  --help                   Show this help message\n"
            << "\n";
}

bool ParsePort(const std::string& value, uint16_t& out) {
  const long port = std::strtol(value.c_str(), nullptr, 10);
  if (port < 0 || port > 65535) return false;
  out = static_cast<uint16_t>(port);
  return true;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--host" && has_value) {
      args.host = argv[++i];
    } else if (arg == "--protocol" && has_value) {
      std::string value = argv[++i];
      if (value == "udp") {
        args.protocol = Protocol::kUdp;
      } else if (value == "tcp") {
        args.protocol = Protocol::kTcp;
      } else {
        args.error = "unknown protocol: " + value;
        return args;
      }
    } else if ((arg == "--video-port" || arg == "--audio-port" || arg == "--video-source-port" ||
                arg == "--audio-source-port" || arg == "--tcp-port") &&
               has_value) {
      uint16_t* target = &args.video_server_port;
      if (arg == "--audio-port") target = &args.audio_server_port;
      if (arg == "--video-source-port") target = &args.video_source_port;
      if (arg == "--audio-source-port") target = &args.audio_source_port;
      if (arg == "--tcp-port") target = &args.tcp_port;
      if (!ParsePort(argv[++i], *target)) {
        args.error = "invalid port for " + arg;
        return args;
      }
    } else if (arg == "--video-codec" && has_value) {
      std::string value = argv[++i];
      if (value == "h264") {
        args.video_codec = VideoCodec::kH264;
      } else if (value == "h265") {
        args.video_codec = VideoCodec::kH265;
      } else if (value == "av1") {
        args.video_codec = VideoCodec::kAV1;
      } else {
        args.error = "unknown video codec: " + value;
        return args;
      }
    } else if (arg == "--audio-codec" && has_value) {
      std::string value = argv[++i];
      if (value == "aac") {
        args.audio_codec = AudioCodec::kAAC;
      } else if (value == "g711") {
        args.audio_codec = AudioCodec::kG711;
      } else if (value == "opus") {
        args.audio_codec = AudioCodec::kOpus;
      } else {
        args.error = "unknown audio codec: " + value;
        return args;
      }
    } else if (arg == "--fps" && has_value) {
      args.fps = std::atoi(argv[++i]);
    } else if (arg == "--frame-bytes" && has_value) {
      args.frame_bytes = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (arg == "--sample-rate" && has_value) {
      args.sample_rate = std::atoi(argv[++i]);
    } else if (arg == "--duration" && has_value) {
      args.duration_s = std::atoi(argv[++i]);
    } else if (arg == "--cache" && has_value) {
      args.cache_size = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (arg == "--quiet") {
      args.quiet = true;
    } else if (arg == "--control" && has_value) {
      args.control_address = argv[++i];
    } else {
      args.error = "unknown or incomplete option: " + arg;
      return args;
    }
  }

  if (args.fps <= 0 || args.fps > 240) {
    args.error = "--fps must be in 1..240";
    return args;
  }
  if (args.frame_bytes == 0 || args.cache_size == 0 || args.sample_rate <= 0) {
    args.error = "--frame-bytes, --cache and --sample-rate must be positive";
    return args;
  }
  if (args.duration_s < 0) {
    args.error = "--duration must not be negative";
    return args;
  }
  args.valid = true;
  return args;
}

// =============================================================================
// Synthetic media
// =============================================================================

class SyntheticSource {
 public:
  SyntheticSource(VideoCodec video_codec, AudioCodec audio_codec, size_t frame_bytes)
      : video_codec_(video_codec), audio_codec_(audio_codec), frame_bytes_(frame_bytes) {}

  MediaFrame NextVideo(int64_t pts_us, bool keyframe) {
    MediaFrame frame;
    frame.type = MediaType::kVideo;
    frame.info.pts_us = pts_us;
    frame.info.is_keyframe = keyframe;
    switch (video_codec_) {
      case VideoCodec::kH264:
        frame.data = {0x00, 0x00, 0x00, 0x01, static_cast<uint8_t>(keyframe ? 0x65 : 0x41)};
        break;
      case VideoCodec::kH265:
        // IDR_W_RADL (19) or TRAIL_R (1), layer 0, tid 1.
        frame.data = {0x00, 0x00, 0x00, 0x01, static_cast<uint8_t>(keyframe ? 0x26 : 0x02), 0x01};
        break;
      case VideoCodec::kAV1: {
        // OBU_FRAME with obu_has_size_field, leb128 payload size.
        frame.data = {0x32};
        size_t size = frame_bytes_;
        do {
          uint8_t byte = size & 0x7F;
          size >>= 7;
          if (size != 0) byte |= 0x80;
          frame.data.push_back(byte);
        } while (size != 0);
        break;
      }
    }
    Fill(frame.data, frame_bytes_);
    return frame;
  }

  MediaFrame NextAudio(int64_t pts_us) {
    MediaFrame frame;
    frame.type = MediaType::kAudio;
    frame.info.pts_us = pts_us;
    const size_t bytes = audio_codec_ == AudioCodec::kG711 ? 160 : 256;
    Fill(frame.data, bytes);
    return frame;
  }

 private:
  void Fill(std::vector<uint8_t>& data, size_t bytes) {
    std::uniform_int_distribution<int> dist(0, 255);
    for (size_t i = 0; i < bytes; ++i) {
      data.push_back(static_cast<uint8_t>(dist(rng_)));
    }
  }

  VideoCodec video_codec_;
  AudioCodec audio_codec_;
  size_t frame_bytes_;
  std::mt19937 rng_{42};
};

// =============================================================================
// Observer
// =============================================================================

class HarnessObserver : public rtpcast::sender::ISenderObserver {
 public:
  void OnConnectionFailed(const std::string& reason) override {
    Logger::Error("[HARNESS] Connection failed: " + reason);
    failed_.store(true, std::memory_order_release);
  }

  void OnNewBitrate(uint64_t bitrate_bps) override {
    Logger::Info("[HARNESS] Bitrate " + std::to_string(bitrate_bps / 1000) + " kbps");
  }

  bool Failed() const { return failed_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> failed_{false};
};

void PrintCounters(const rtpcast::sender::RtpSender& sender) {
  const rtpcast::sender::SenderStats stats = sender.GetStats();
  std::cout << "\n[HARNESS] Final counters\n"
            << "  sent video packets:    " << stats.sent_video_frames << "\n"
            << "  sent audio packets:    " << stats.sent_audio_frames << "\n"
            << "  dropped video frames:  " << stats.dropped_video_frames << "\n"
            << "  dropped audio frames:  " << stats.dropped_audio_frames << "\n"
            << "  queued:                " << stats.items_in_cache << "/" << stats.cache_size
            << "\n"
            << "  last bitrate:          " << stats.bitrate_bps << " bps\n";
}

int Run(const CliArgs& args) {
  HarnessObserver observer;
  rtpcast::sender::RtpSenderConfig config;
  config.cache_size = args.cache_size;
  config.enable_logs = !args.quiet;
  config.video_codec = args.video_codec;
  config.audio_codec = args.audio_codec;

  rtpcast::sender::RtpSender sender(&observer, config);

  try {
    const std::vector<uint8_t> sps = {0x67, 0x42, 0xC0, 0x1F, 0xDA, 0x01, 0x40, 0x16, 0xE8};
    const std::vector<uint8_t> pps = {0x68, 0xCE, 0x3C, 0x80};
    const std::vector<uint8_t> vps = {0x40, 0x01, 0x0C, 0x01, 0xFF, 0xFF};
    sender.SetVideoInfo(sps, pps, vps);
    sender.SetAudioInfo(args.sample_rate, true);

    const auto rtcp = [](uint16_t port) {
      return static_cast<uint16_t>(port == 0 ? 0 : port + 1);
    };
    sender.SetSocketsInfo(args.protocol, args.host,
                          {args.video_source_port, rtcp(args.video_source_port)},
                          {args.audio_source_port, rtcp(args.audio_source_port)},
                          {args.video_server_port, rtcp(args.video_server_port)},
                          {args.audio_server_port, rtcp(args.audio_server_port)});
    if (args.protocol == Protocol::kTcp) {
      sender.SetSocket(rtpcast::net::TcpStreamSocket::Connect(args.host, args.tcp_port));
    }
  } catch (const std::exception& e) {
    Logger::Error(std::string("[HARNESS] Setup failed: ") + e.what());
    return 1;
  }

  std::unique_ptr<rtpcast::control::SenderControlImpl> control;
  std::unique_ptr<grpc::Server> server;
  if (!args.control_address.empty()) {
    control = std::make_unique<rtpcast::control::SenderControlImpl>(sender);
    grpc::ServerBuilder builder;
    builder.AddListeningPort(args.control_address, grpc::InsecureServerCredentials());
    builder.RegisterService(control.get());
    server = builder.BuildAndStart();
    if (!server) {
      Logger::Error("[HARNESS] Failed to start control server on " + args.control_address);
      return 1;
    }
    Logger::Info("[HARNESS] SenderControl listening on " + args.control_address);
  }

  if (!sender.Start()) {
    Logger::Error("[HARNESS] Sender refused to start");
    if (server) server->Shutdown();
    return 1;
  }

  SyntheticSource source(args.video_codec, args.audio_codec, args.frame_bytes);
  const auto video_period = std::chrono::microseconds(1'000'000 / args.fps);
  const auto audio_period = std::chrono::microseconds(
      args.audio_codec == AudioCodec::kG711 ? 20'000
                                            : 1024LL * 1'000'000 / args.sample_rate);
  const auto start = std::chrono::steady_clock::now();
  const auto deadline = start + std::chrono::seconds(args.duration_s);
  auto next_video = start;
  auto next_audio = start;
  int64_t video_index = 0;

  while (!g_termination_requested.load(std::memory_order_acquire) && !observer.Failed()) {
    const auto now = std::chrono::steady_clock::now();
    if (args.duration_s > 0 && now >= deadline) break;

    if (now >= next_video) {
      const auto pts = std::chrono::duration_cast<std::chrono::microseconds>(next_video - start);
      sender.SendMediaFrame(source.NextVideo(pts.count(), video_index % args.fps == 0));
      ++video_index;
      next_video += video_period;
    }
    if (now >= next_audio) {
      const auto pts = std::chrono::duration_cast<std::chrono::microseconds>(next_audio - start);
      sender.SendMediaFrame(source.NextAudio(pts.count()));
      next_audio += audio_period;
    }
    std::this_thread::sleep_until(std::min(next_video, next_audio));
  }

  const bool failed = observer.Failed();
  PrintCounters(sender);
  sender.Stop();
  if (server) server->Shutdown();
  return failed ? 2 : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  return Run(args);
}
