// Repository: Rtpcast-sender
// Component: SenderControl gRPC Service Implementation
// Purpose: Exposes RtpSender diagnostics and tuning over gRPC.
// Copyright (c) 2025 Rtpcast contributors

#include "control/SenderControlService.h"

#include <sstream>
#include <stdexcept>

#include "rtpcast/sender/RtpSender.hpp"
#include "rtpcast/util/Logger.hpp"

namespace rtpcast {
namespace control {

namespace {
constexpr float kDefaultCongestionPercent = 20.0f;
}  // namespace

SenderControlImpl::SenderControlImpl(sender::RtpSender& sender) : sender_(sender) {
  util::Logger::Info("[SenderControlImpl] Service initialized");
}

void SenderControlImpl::FillStats(SenderStats* out) const {
  const sender::SenderStats stats = sender_.GetStats();
  out->set_running(stats.running);
  out->set_cache_size(stats.cache_size);
  out->set_items_in_cache(stats.items_in_cache);
  out->set_sent_audio_frames(stats.sent_audio_frames);
  out->set_sent_video_frames(stats.sent_video_frames);
  out->set_dropped_audio_frames(stats.dropped_audio_frames);
  out->set_dropped_video_frames(stats.dropped_video_frames);
  out->set_bitrate_bps(stats.bitrate_bps);
  out->set_bitrate_exponential_factor(sender_.GetBitrateExponentialFactor());
  out->set_logs_enabled(sender_.LogsEnabled());
}

grpc::Status SenderControlImpl::GetStats(grpc::ServerContext* /*context*/,
                                         const GetStatsRequest* /*request*/,
                                         SenderStats* response) {
  util::Logger::Debug("[GetStats] Request received");
  FillStats(response);
  return grpc::Status::OK;
}

grpc::Status SenderControlImpl::ResetCounters(grpc::ServerContext* /*context*/,
                                              const ResetCountersRequest* request,
                                              ResetCountersResponse* response) {
  std::ostringstream oss;
  oss << "[ResetCounters] Request received: sent_audio=" << request->sent_audio()
      << ", sent_video=" << request->sent_video() << ", dropped_audio=" << request->dropped_audio()
      << ", dropped_video=" << request->dropped_video();
  util::Logger::Info(oss.str());

  if (request->sent_audio()) sender_.ResetSentAudioFrames();
  if (request->sent_video()) sender_.ResetSentVideoFrames();
  if (request->dropped_audio()) sender_.ResetDroppedAudioFrames();
  if (request->dropped_video()) sender_.ResetDroppedVideoFrames();

  FillStats(response->mutable_stats());
  return grpc::Status::OK;
}

grpc::Status SenderControlImpl::ResizeCache(grpc::ServerContext* /*context*/,
                                            const ResizeCacheRequest* request,
                                            ResizeCacheResponse* response) {
  const uint64_t new_size = request->new_size();
  util::Logger::Info("[ResizeCache] Request received: new_size=" + std::to_string(new_size));
  try {
    sender_.ResizeCache(static_cast<size_t>(new_size));
  } catch (const std::invalid_argument& e) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (const std::runtime_error& e) {
    util::Logger::Warn(std::string("[ResizeCache] Rejected: ") + e.what());
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, e.what());
  }
  response->set_cache_size(sender_.GetCacheSize());
  response->set_items_in_cache(sender_.GetItemsInCache());
  return grpc::Status::OK;
}

grpc::Status SenderControlImpl::HasCongestion(grpc::ServerContext* /*context*/,
                                              const HasCongestionRequest* request,
                                              HasCongestionResponse* response) {
  const float percent = request->has_percent() ? request->percent() : kDefaultCongestionPercent;
  try {
    response->set_congested(sender_.HasCongestion(percent));
  } catch (const std::invalid_argument& e) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  }
  response->set_percent(percent);
  return grpc::Status::OK;
}

grpc::Status SenderControlImpl::SetLogs(grpc::ServerContext* /*context*/,
                                        const SetLogsRequest* request,
                                        SetLogsResponse* response) {
  sender_.SetLogs(request->enabled());
  util::Logger::Info(std::string("[SetLogs] Packet logs ") +
                     (request->enabled() ? "enabled" : "disabled"));
  response->set_enabled(sender_.LogsEnabled());
  return grpc::Status::OK;
}

grpc::Status SenderControlImpl::SetBitrateExponentialFactor(
    grpc::ServerContext* /*context*/, const SetBitrateExponentialFactorRequest* request,
    SetBitrateExponentialFactorResponse* response) {
  try {
    sender_.SetBitrateExponentialFactor(request->factor());
  } catch (const std::invalid_argument& e) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  }
  response->set_factor(sender_.GetBitrateExponentialFactor());
  return grpc::Status::OK;
}

}  // namespace control
}  // namespace rtpcast
