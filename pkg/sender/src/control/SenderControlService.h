// Repository: Rtpcast-sender
// Component: SenderControl gRPC Service Implementation
// Purpose: Exposes RtpSender diagnostics and tuning over gRPC.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_CONTROL_SENDER_CONTROL_SERVICE_H_
#define RTPCAST_CONTROL_SENDER_CONTROL_SERVICE_H_

#include <grpcpp/grpcpp.h>

#include "sender_control.grpc.pb.h"
#include "sender_control.pb.h"

namespace rtpcast::sender {
class RtpSender;
}  // namespace rtpcast::sender

namespace rtpcast {
namespace control {

// SenderControlImpl implements the service defined in sender_control.proto.
// It is a thin adapter over RtpSender; the sender must outlive the service.
class SenderControlImpl final : public SenderControl::Service {
 public:
  explicit SenderControlImpl(sender::RtpSender& sender);
  ~SenderControlImpl() override = default;

  SenderControlImpl(const SenderControlImpl&) = delete;
  SenderControlImpl& operator=(const SenderControlImpl&) = delete;

  grpc::Status GetStats(grpc::ServerContext* context, const GetStatsRequest* request,
                        SenderStats* response) override;

  grpc::Status ResetCounters(grpc::ServerContext* context, const ResetCountersRequest* request,
                             ResetCountersResponse* response) override;

  grpc::Status ResizeCache(grpc::ServerContext* context, const ResizeCacheRequest* request,
                           ResizeCacheResponse* response) override;

  grpc::Status HasCongestion(grpc::ServerContext* context, const HasCongestionRequest* request,
                             HasCongestionResponse* response) override;

  grpc::Status SetLogs(grpc::ServerContext* context, const SetLogsRequest* request,
                       SetLogsResponse* response) override;

  grpc::Status SetBitrateExponentialFactor(grpc::ServerContext* context,
                                           const SetBitrateExponentialFactorRequest* request,
                                           SetBitrateExponentialFactorResponse* response) override;

 private:
  void FillStats(SenderStats* out) const;

  sender::RtpSender& sender_;
};

}  // namespace control
}  // namespace rtpcast

#endif  // RTPCAST_CONTROL_SENDER_CONTROL_SERVICE_H_
