// Repository: Rtpcast-sender
// Component: SenderReportTcp
// Purpose: RTCP sender reports interleaved on the RTSP connection.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTCP_SENDER_REPORT_TCP_HPP_
#define RTPCAST_RTCP_SENDER_REPORT_TCP_HPP_

#include <memory>
#include <mutex>

#include "rtpcast/rtcp/BaseSenderReport.hpp"

namespace rtpcast::rtcp {

// Reports go on channel 1 (video) and 3 (audio). They are buffered in the
// stream socket and leave with the next RTP flush.
class SenderReportTcp : public BaseSenderReport {
 public:
  SenderReportTcp() = default;

  void SetSocket(std::shared_ptr<net::TcpStreamSocket> socket) override;
  void Close() override;

 protected:
  void SendReport(const ReportPacket& packet, bool is_video) override;

 private:
  std::mutex mutex_;
  std::shared_ptr<net::TcpStreamSocket> socket_;
};

}  // namespace rtpcast::rtcp

#endif  // RTPCAST_RTCP_SENDER_REPORT_TCP_HPP_
