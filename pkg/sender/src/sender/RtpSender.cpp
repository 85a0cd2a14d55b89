// Repository: Rtpcast-sender
// Component: RtpSender Implementation
// Purpose: Frame queue, transmission loop, measurement loop and lifecycle.
// Copyright (c) 2025 Rtpcast contributors

#include "rtpcast/sender/RtpSender.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

extern "C" {
#include <libavutil/random_seed.h>
}

#include "rtpcast/bitrate/BitrateManager.hpp"
#include "rtpcast/net/TcpStreamSocket.hpp"
#include "rtpcast/rtp/packets/AacPacketizer.hpp"
#include "rtpcast/rtp/packets/Av1Packetizer.hpp"
#include "rtpcast/rtp/packets/G711Packetizer.hpp"
#include "rtpcast/rtp/packets/H264Packetizer.hpp"
#include "rtpcast/rtp/packets/H265Packetizer.hpp"
#include "rtpcast/rtp/packets/OpusPacketizer.hpp"
#include "rtpcast/util/Logger.hpp"

namespace rtpcast::sender {

namespace {

std::shared_ptr<rtp::RtpPacketizer> DefaultVideoPacketizer(media::VideoCodec codec) {
  switch (codec) {
    case media::VideoCodec::kH265:
      return std::make_shared<rtp::H265Packetizer>();
    case media::VideoCodec::kAV1:
      return std::make_shared<rtp::Av1Packetizer>();
    case media::VideoCodec::kH264:
    default:
      return std::make_shared<rtp::H264Packetizer>();
  }
}

std::shared_ptr<rtp::RtpPacketizer> DefaultAudioPacketizer(media::AudioCodec codec) {
  switch (codec) {
    case media::AudioCodec::kG711:
      return std::make_shared<rtp::G711Packetizer>();
    case media::AudioCodec::kOpus:
      return std::make_shared<rtp::OpusPacketizer>();
    case media::AudioCodec::kAAC:
    default:
      return std::make_shared<rtp::AacPacketizer>();
  }
}

}  // namespace

RtpSender::RtpSender(ISenderObserver* observer, const RtpSenderConfig& config)
    : RtpSender(observer, config, std::make_unique<bitrate::BitrateManager>(observer)) {}

RtpSender::RtpSender(ISenderObserver* observer, const RtpSenderConfig& config,
                     std::unique_ptr<bitrate::IBitrateEstimator> estimator)
    : observer_(observer),
      config_(config),
      estimator_(std::move(estimator)),
      queue_(config.cache_size),
      video_codec_(config.video_codec),
      audio_codec_(config.audio_codec),
      video_packetizer_(DefaultVideoPacketizer(config.video_codec)),
      audio_packetizer_(DefaultAudioPacketizer(config.audio_codec)),
      logs_enabled_(config.enable_logs) {
  if (!estimator_) {
    throw std::invalid_argument("RtpSender requires a bitrate estimator");
  }
}

RtpSender::~RtpSender() { Stop(); }

// =============================================================================
// Configuration
// =============================================================================

void RtpSender::SetVideoCodec(media::VideoCodec codec) {
  std::lock_guard<std::mutex> lock(packetizer_mutex_);
  video_codec_ = codec;
}

void RtpSender::SetAudioCodec(media::AudioCodec codec) {
  std::lock_guard<std::mutex> lock(packetizer_mutex_);
  audio_codec_ = codec;
}

void RtpSender::SetSocketsInfo(media::Protocol protocol, const std::string& host,
                               const PortPair& video_source_ports,
                               const PortPair& audio_source_ports,
                               const PortPair& video_server_ports,
                               const PortPair& audio_server_ports) {
  std::shared_ptr<rtp::RtpSocket> rtp_socket = rtp::RtpSocket::Create(
      protocol, host, video_source_ports.rtp, audio_source_ports.rtp, video_server_ports.rtp,
      audio_server_ports.rtp);
  std::shared_ptr<rtcp::BaseSenderReport> report = rtcp::BaseSenderReport::Create(
      protocol, host, video_source_ports.rtcp, audio_source_ports.rtcp,
      video_server_ports.rtcp, audio_server_ports.rtcp);

  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  rtp_socket_ = std::move(rtp_socket);
  sender_report_ = std::move(report);
  util::Logger::Info(std::string("[RtpSender] Transport configured: ") +
                     media::ProtocolToString(protocol) + " " + host);
}

void RtpSender::SetSocket(std::shared_ptr<net::TcpStreamSocket> socket) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (rtp_socket_) rtp_socket_->SetSocket(socket);
  if (sender_report_) sender_report_->SetSocket(socket);
}

void RtpSender::SetRtpSocket(std::shared_ptr<rtp::RtpSocket> socket) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  rtp_socket_ = std::move(socket);
}

void RtpSender::SetSenderReport(std::shared_ptr<rtcp::BaseSenderReport> report) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  sender_report_ = std::move(report);
}

void RtpSender::SetVideoInfo(const std::vector<uint8_t>& sps,
                             const std::optional<std::vector<uint8_t>>& pps,
                             const std::optional<std::vector<uint8_t>>& vps) {
  std::lock_guard<std::mutex> lock(packetizer_mutex_);
  std::shared_ptr<rtp::RtpPacketizer> packetizer;
  switch (video_codec_) {
    case media::VideoCodec::kH264: {
      if (!pps) {
        throw std::invalid_argument("pps can't be null with h264");
      }
      if (sps.empty() || pps->empty()) {
        throw std::invalid_argument("sps and pps can't be empty with h264");
      }
      auto h264 = std::make_shared<rtp::H264Packetizer>();
      h264->SetVideoInfo(sps, *pps);
      packetizer = std::move(h264);
      break;
    }
    case media::VideoCodec::kH265: {
      if (!pps || !vps) {
        throw std::invalid_argument("pps or vps can't be null with h265");
      }
      if (sps.empty() || pps->empty() || vps->empty()) {
        throw std::invalid_argument("sps, pps and vps can't be empty with h265");
      }
      auto h265 = std::make_shared<rtp::H265Packetizer>();
      h265->SetVideoInfo(sps, *pps, *vps);
      packetizer = std::move(h265);
      break;
    }
    case media::VideoCodec::kAV1:
      packetizer = std::make_shared<rtp::Av1Packetizer>();
      break;
  }
  if (!packetizer) {
    throw std::invalid_argument("unsupported video codec");
  }
  packetizer->SetSsrc(video_ssrc_);
  video_packetizer_ = std::move(packetizer);
}

void RtpSender::SetAudioInfo(int sample_rate, bool /*is_stereo*/) {
  if (sample_rate <= 0) {
    throw std::invalid_argument("sample rate must be positive, got " +
                                std::to_string(sample_rate));
  }
  std::lock_guard<std::mutex> lock(packetizer_mutex_);
  std::shared_ptr<rtp::RtpPacketizer> packetizer;
  switch (audio_codec_) {
    case media::AudioCodec::kG711: {
      auto g711 = std::make_shared<rtp::G711Packetizer>();
      g711->SetAudioInfo(sample_rate);
      packetizer = std::move(g711);
      break;
    }
    case media::AudioCodec::kOpus: {
      auto opus = std::make_shared<rtp::OpusPacketizer>();
      opus->SetAudioInfo(sample_rate);
      packetizer = std::move(opus);
      break;
    }
    case media::AudioCodec::kAAC: {
      auto aac = std::make_shared<rtp::AacPacketizer>();
      aac->SetAudioInfo(sample_rate);
      packetizer = std::move(aac);
      break;
    }
  }
  if (!packetizer) {
    throw std::invalid_argument("unsupported audio codec");
  }
  packetizer->SetSsrc(audio_ssrc_);
  audio_packetizer_ = std::move(packetizer);
}

std::shared_ptr<rtp::RtpPacketizer> RtpSender::PacketizerFor(media::MediaType type) const {
  std::lock_guard<std::mutex> lock(packetizer_mutex_);
  return type == media::MediaType::kVideo ? video_packetizer_ : audio_packetizer_;
}

// =============================================================================
// Producer
// =============================================================================

void RtpSender::SendMediaFrame(media::MediaFrame frame) {
  // Held across the check and the push so Stop() cannot clear the queue or
  // the counters between them.
  std::lock_guard<std::mutex> lock(producer_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  const media::MediaType type = frame.type;
  if (queue_.TryPush(std::move(frame))) {
    return;
  }
  if (type == media::MediaType::kVideo) {
    dropped_video_frames_.fetch_add(1, std::memory_order_relaxed);
    util::Logger::Info("[RtpSender] Video frame discarded");
  } else {
    dropped_audio_frames_.fetch_add(1, std::memory_order_relaxed);
    util::Logger::Info("[RtpSender] Audio frame discarded");
  }
}

// =============================================================================
// Lifecycle
// =============================================================================

bool RtpSender::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (transmission_thread_ || measurement_thread_) {
    util::Logger::Warn("[RtpSender] Start refused: session active or not stopped after failure");
    return false;
  }
  if (!rtp_socket_ || !sender_report_) {
    util::Logger::Error("[RtpSender] Start refused: transport not configured");
    return false;
  }

  estimator_->Reset();
  queue_.Clear();
  bytes_sent_.store(0, std::memory_order_relaxed);

  const uint32_t video_ssrc = av_get_random_seed();
  const uint32_t audio_ssrc = av_get_random_seed();
  {
    std::lock_guard<std::mutex> plock(packetizer_mutex_);
    video_ssrc_ = video_ssrc;
    audio_ssrc_ = audio_ssrc;
    video_packetizer_->SetSsrc(video_ssrc);
    audio_packetizer_->SetSsrc(audio_ssrc);
  }
  sender_report_->SetSsrc(video_ssrc, audio_ssrc);

  cancelled_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);

  session_ = Session{rtp_socket_, sender_report_};
  transmission_thread_ = std::make_unique<std::thread>(&RtpSender::TransmissionLoop, this, session_);
  measurement_thread_ = std::make_unique<std::thread>(&RtpSender::MeasurementLoop, this);

  std::ostringstream oss;
  oss << "[RtpSender] Started, video ssrc " << video_ssrc << ", audio ssrc " << audio_ssrc
      << ", cache " << queue_.Capacity();
  util::Logger::Info(oss.str());
  return true;
}

void RtpSender::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  const bool had_session = transmission_thread_ || measurement_thread_;

  {
    std::lock_guard<std::mutex> plock(producer_mutex_);
    running_.store(false, std::memory_order_release);
  }
  Cancel();
  // Wakes a transmission thread blocked on a stalled peer.
  if (session_.rtp_socket) {
    session_.rtp_socket->Abort();
  }

  if (transmission_thread_ && transmission_thread_->joinable()) {
    transmission_thread_->join();
  }
  transmission_thread_.reset();
  if (measurement_thread_ && measurement_thread_->joinable()) {
    measurement_thread_->join();
  }
  measurement_thread_.reset();

  if (session_.sender_report) {
    session_.sender_report->Reset();
    session_.sender_report->Close();
  }
  if (session_.rtp_socket) {
    session_.rtp_socket->Close();
  }
  session_ = Session{};
  {
    std::lock_guard<std::mutex> plock(packetizer_mutex_);
    video_packetizer_->Reset();
    audio_packetizer_->Reset();
  }
  ResetSentAudioFrames();
  ResetSentVideoFrames();
  ResetDroppedAudioFrames();
  ResetDroppedVideoFrames();
  bytes_sent_.store(0, std::memory_order_relaxed);
  queue_.Clear();

  if (had_session) {
    util::Logger::Info("[RtpSender] Stopped");
  }
}

void RtpSender::Cancel() {
  cancelled_.store(true, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
  }
  session_cv_.notify_all();
  queue_.NotifyAll();
}

// =============================================================================
// Transmission loop
// =============================================================================

void RtpSender::TransmissionLoop(Session session) {
  while (!cancelled_.load(std::memory_order_acquire)) {
    std::optional<media::MediaFrame> frame = queue_.PollFor(config_.poll_timeout, cancelled_);
    if (!frame) {
      continue;
    }
    try {
      TransmitFrame(*frame, session);
    } catch (const std::exception& e) {
      if (cancelled_.load(std::memory_order_acquire)) {
        util::Logger::Debug(std::string("[RtpSender] Send aborted by stop: ") + e.what());
        return;
      }
      const std::string reason = std::string("Error send packet, ") + e.what();
      util::Logger::Error("[RtpSender] " + reason);
      running_.store(false, std::memory_order_release);
      Cancel();
      if (observer_ != nullptr) {
        observer_->OnConnectionFailed(reason);
      }
      return;
    }
  }
}

void RtpSender::TransmitFrame(const media::MediaFrame& frame, const Session& session) {
  std::shared_ptr<rtp::RtpPacketizer> packetizer = PacketizerFor(frame.type);
  std::vector<rtp::RtpFrame> packets = packetizer->CreatePackets(frame);

  const bool stream_oriented = session.rtp_socket->IsStreamOriented();
  const uint64_t framing = stream_oriented ? rtp::kTcpHeaderLength : 0;
  const bool logs = logs_enabled_.load(std::memory_order_relaxed);
  uint64_t size = 0;

  for (const rtp::RtpFrame& packet : packets) {
    session.rtp_socket->SendFrame(packet);
    const uint64_t packet_size = packet.length() + framing;
    bytes_sent_.fetch_add(packet_size, std::memory_order_relaxed);
    size += packet_size;
    if (packet.IsVideoFrame()) {
      sent_video_frames_.fetch_add(1, std::memory_order_relaxed);
    } else {
      sent_audio_frames_.fetch_add(1, std::memory_order_relaxed);
    }
    if (session.sender_report->Update(packet)) {
      bytes_sent_.fetch_add(rtp::kReportPacketLength + framing, std::memory_order_relaxed);
      if (logs) {
        util::Logger::Info("[RtpSender] wrote report");
      }
    }
  }
  session.rtp_socket->Flush();

  if (logs) {
    util::Logger::Info(std::string("[RtpSender] wrote ") + media::MediaTypeToString(frame.type) +
                       " packet, size " + std::to_string(size));
  }
}

// =============================================================================
// Measurement loop
// =============================================================================

void RtpSender::MeasurementLoop() {
  std::unique_lock<std::mutex> lock(session_mutex_);
  while (!cancelled_.load(std::memory_order_acquire)) {
    if (session_cv_.wait_for(lock, config_.bitrate_interval,
                             [this] { return cancelled_.load(std::memory_order_acquire); })) {
      break;
    }
    const uint64_t bytes = bytes_sent_.exchange(0, std::memory_order_relaxed);
    lock.unlock();
    estimator_->CalculateBitrate(bytes * 8);
    lock.lock();
  }
}

// =============================================================================
// Queue control and diagnostics
// =============================================================================

bool RtpSender::HasCongestion(float percent) const {
  if (!(percent >= 0.0f && percent <= 100.0f)) {
    throw std::invalid_argument("the value must be in range 0 to 100");
  }
  const FrameQueue::Occupancy occupancy = queue_.GetOccupancy();
  return static_cast<double>(occupancy.size) >=
         static_cast<double>(occupancy.capacity) * percent / 100.0;
}

void RtpSender::ResizeCache(size_t new_size) {
  queue_.Resize(new_size);
  util::Logger::Info("[RtpSender] Cache resized to " + std::to_string(new_size));
}

void RtpSender::ClearCache() { queue_.Clear(); }

void RtpSender::SetBitrateExponentialFactor(float factor) {
  estimator_->SetExponentialFactor(factor);
}

float RtpSender::GetBitrateExponentialFactor() const { return estimator_->ExponentialFactor(); }

SenderStats RtpSender::GetStats() const {
  SenderStats stats;
  stats.running = IsRunning();
  const FrameQueue::Occupancy occupancy = queue_.GetOccupancy();
  stats.cache_size = occupancy.capacity;
  stats.items_in_cache = occupancy.size;
  stats.sent_audio_frames = GetSentAudioFrames();
  stats.sent_video_frames = GetSentVideoFrames();
  stats.dropped_audio_frames = GetDroppedAudioFrames();
  stats.dropped_video_frames = GetDroppedVideoFrames();
  stats.bitrate_bps = estimator_->LastBitrate();
  return stats;
}

}  // namespace rtpcast::sender
