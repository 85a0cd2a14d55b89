// Repository: Rtpcast-sender
// Component: RtpSender
// Purpose: Queues encoded frames, packetizes and transmits them on a
//          dedicated thread, interleaves sender reports and samples the
//          outgoing bitrate.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_SENDER_RTP_SENDER_HPP_
#define RTPCAST_SENDER_RTP_SENDER_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "rtpcast/bitrate/IBitrateEstimator.hpp"
#include "rtpcast/media/MediaFrame.hpp"
#include "rtpcast/rtcp/BaseSenderReport.hpp"
#include "rtpcast/rtp/packets/RtpPacketizer.hpp"
#include "rtpcast/rtp/sockets/RtpSocket.hpp"
#include "rtpcast/sender/FrameQueue.hpp"
#include "rtpcast/sender/ISenderObserver.hpp"
#include "rtpcast/sender/RtpSenderConfig.hpp"

namespace rtpcast::net {
class TcpStreamSocket;
}  // namespace rtpcast::net

namespace rtpcast::sender {

// RTP and RTCP port of one media kind.
struct PortPair {
  uint16_t rtp = 0;
  uint16_t rtcp = 0;
};

// Point-in-time view of the sender's counters.
struct SenderStats {
  bool running = false;
  size_t cache_size = 0;
  size_t items_in_cache = 0;
  uint64_t sent_audio_frames = 0;
  uint64_t sent_video_frames = 0;
  uint64_t dropped_audio_frames = 0;
  uint64_t dropped_video_frames = 0;
  uint64_t bitrate_bps = 0;
};

// RtpSender is the transmission core of an RTSP client session.
//
// Lifecycle: Idle --Start()--> Running --Stop()--> Idle.
// A transport failure moves Running to Failed: the observer is told once,
// IsRunning() turns false, and Start() is refused until Stop() has run.
//
// Threads:
//   producer       SendMediaFrame(), never blocks.
//   transmission   dequeues, packetizes, sends, flushes once per frame.
//   measurement    once per bitrate_interval hands bytes*8 to the estimator.
// Both owned threads share one cancellation flag and are joined by Stop().
//
// Counters count RTP packets per media kind (sent) and media frames per
// media kind (dropped at the queue). Only Stop() and the Reset* calls
// zero them.
class RtpSender {
 public:
  explicit RtpSender(ISenderObserver* observer, const RtpSenderConfig& config = RtpSenderConfig{});
  RtpSender(ISenderObserver* observer, const RtpSenderConfig& config,
            std::unique_ptr<bitrate::IBitrateEstimator> estimator);
  ~RtpSender();

  RtpSender(const RtpSender&) = delete;
  RtpSender& operator=(const RtpSender&) = delete;

  // --- Configuration ---

  void SetVideoCodec(media::VideoCodec codec);
  void SetAudioCodec(media::AudioCodec codec);

  // Builds the RTP transport and sender-report generator for protocol.
  // UDP sockets are opened here; failures throw std::system_error.
  void SetSocketsInfo(media::Protocol protocol, const std::string& host,
                      const PortPair& video_source_ports, const PortPair& audio_source_ports,
                      const PortPair& video_server_ports, const PortPair& audio_server_ports);

  // Attaches the RTSP connection used for interleaved transport.
  void SetSocket(std::shared_ptr<net::TcpStreamSocket> socket);

  // Replaces the video packetizer for the current video codec.
  // Throws std::invalid_argument when a parameter set the codec needs is
  // missing or empty; the previous packetizer is kept in that case.
  void SetVideoInfo(const std::vector<uint8_t>& sps,
                    const std::optional<std::vector<uint8_t>>& pps,
                    const std::optional<std::vector<uint8_t>>& vps = std::nullopt);

  // Replaces the audio packetizer for the current audio codec.
  void SetAudioInfo(int sample_rate, bool is_stereo = true);

  // Injection points for embedding and tests. Like SetSocketsInfo(), a call
  // made while running applies from the next Start().
  void SetRtpSocket(std::shared_ptr<rtp::RtpSocket> socket);
  void SetSenderReport(std::shared_ptr<rtcp::BaseSenderReport> report);

  // --- Producer ---

  // No-op unless running. Drops (and counts) the frame when the queue is full.
  void SendMediaFrame(media::MediaFrame frame);

  // --- Lifecycle ---

  bool Start();
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // --- Queue control ---

  // True when the queue is at least percent full. Throws std::invalid_argument
  // outside [0, 100].
  bool HasCongestion(float percent = 20.0f) const;

  // Throws std::runtime_error when more frames are queued than fit.
  void ResizeCache(size_t new_size);
  void ClearCache();

  // --- Diagnostics ---

  size_t GetCacheSize() const { return queue_.Capacity(); }
  size_t GetItemsInCache() const { return queue_.Size(); }

  uint64_t GetSentAudioFrames() const { return sent_audio_frames_.load(std::memory_order_relaxed); }
  uint64_t GetSentVideoFrames() const { return sent_video_frames_.load(std::memory_order_relaxed); }
  uint64_t GetDroppedAudioFrames() const {
    return dropped_audio_frames_.load(std::memory_order_relaxed);
  }
  uint64_t GetDroppedVideoFrames() const {
    return dropped_video_frames_.load(std::memory_order_relaxed);
  }

  void ResetSentAudioFrames() { sent_audio_frames_.store(0, std::memory_order_relaxed); }
  void ResetSentVideoFrames() { sent_video_frames_.store(0, std::memory_order_relaxed); }
  void ResetDroppedAudioFrames() { dropped_audio_frames_.store(0, std::memory_order_relaxed); }
  void ResetDroppedVideoFrames() { dropped_video_frames_.store(0, std::memory_order_relaxed); }

  void SetLogs(bool enable) { logs_enabled_.store(enable, std::memory_order_relaxed); }
  bool LogsEnabled() const { return logs_enabled_.load(std::memory_order_relaxed); }

  void SetBitrateExponentialFactor(float factor);
  float GetBitrateExponentialFactor() const;

  SenderStats GetStats() const;

 private:
  // Components a session runs with. Captured at Start() so configuration
  // calls made while running take effect on the next session; Stop() aborts,
  // resets and closes these, not the pending ones.
  struct Session {
    std::shared_ptr<rtp::RtpSocket> rtp_socket;
    std::shared_ptr<rtcp::BaseSenderReport> sender_report;
  };

  void TransmissionLoop(Session session);
  void MeasurementLoop();
  void TransmitFrame(const media::MediaFrame& frame, const Session& session);
  void Cancel();

  std::shared_ptr<rtp::RtpPacketizer> PacketizerFor(media::MediaType type) const;

  ISenderObserver* observer_;
  RtpSenderConfig config_;
  std::unique_ptr<bitrate::IBitrateEstimator> estimator_;

  FrameQueue queue_;

  // Serializes Start/Stop/SetSocketsInfo/SetSocket.
  std::mutex lifecycle_mutex_;
  std::shared_ptr<rtp::RtpSocket> rtp_socket_;
  std::shared_ptr<rtcp::BaseSenderReport> sender_report_;
  Session session_;

  // Serializes SendMediaFrame against the running_ transition in Stop().
  std::mutex producer_mutex_;

  // Guards packetizer replacement against the transmission thread.
  mutable std::mutex packetizer_mutex_;
  media::VideoCodec video_codec_;
  media::AudioCodec audio_codec_;
  std::shared_ptr<rtp::RtpPacketizer> video_packetizer_;
  std::shared_ptr<rtp::RtpPacketizer> audio_packetizer_;
  uint32_t video_ssrc_ = 0;
  uint32_t audio_ssrc_ = 0;

  std::atomic<bool> running_{false};
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> logs_enabled_;

  std::mutex session_mutex_;
  std::condition_variable session_cv_;
  std::unique_ptr<std::thread> transmission_thread_;
  std::unique_ptr<std::thread> measurement_thread_;

  std::atomic<uint64_t> bytes_sent_{0};
  std::atomic<uint64_t> sent_audio_frames_{0};
  std::atomic<uint64_t> sent_video_frames_{0};
  std::atomic<uint64_t> dropped_audio_frames_{0};
  std::atomic<uint64_t> dropped_video_frames_{0};
};

}  // namespace rtpcast::sender

#endif  // RTPCAST_SENDER_RTP_SENDER_HPP_
