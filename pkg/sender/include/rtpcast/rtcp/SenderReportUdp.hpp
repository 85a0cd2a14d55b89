// Repository: Rtpcast-sender
// Component: SenderReportUdp
// Purpose: RTCP sender reports over UDP, one socket per media kind.
// Copyright (c) 2025 Rtpcast contributors

#ifndef RTPCAST_RTCP_SENDER_REPORT_UDP_HPP_
#define RTPCAST_RTCP_SENDER_REPORT_UDP_HPP_

#include <cstdint>
#include <string>

#include "rtpcast/net/UdpSocket.hpp"
#include "rtpcast/rtcp/BaseSenderReport.hpp"

namespace rtpcast::rtcp {

class SenderReportUdp : public BaseSenderReport {
 public:
  // Ports are the RTCP ports of each media kind (RTP port + 1).
  SenderReportUdp(const std::string& host, uint16_t video_source_port,
                  uint16_t audio_source_port, uint16_t video_server_port,
                  uint16_t audio_server_port);

  void Close() override;

 protected:
  void SendReport(const ReportPacket& packet, bool is_video) override;

 private:
  net::UdpSocket video_socket_;
  net::UdpSocket audio_socket_;
};

}  // namespace rtpcast::rtcp

#endif  // RTPCAST_RTCP_SENDER_REPORT_UDP_HPP_
