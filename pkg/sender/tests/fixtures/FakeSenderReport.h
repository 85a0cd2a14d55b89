// Fake sender-report generator: reports on a fixed packet cadence instead of
// wall-clock time and records lifecycle calls.

#ifndef RTPCAST_TESTS_FIXTURES_FAKE_SENDER_REPORT_H_
#define RTPCAST_TESTS_FIXTURES_FAKE_SENDER_REPORT_H_

#include <atomic>
#include <cstdint>

#include "rtpcast/rtcp/BaseSenderReport.hpp"

namespace rtpcast::tests::fixtures {

class FakeSenderReport : public rtcp::BaseSenderReport {
 public:
  // report_every == 0 never reports.
  explicit FakeSenderReport(uint64_t report_every = 0) : report_every_(report_every) {}

  void SetSsrc(uint32_t video_ssrc, uint32_t audio_ssrc) override {
    video_ssrc_.store(video_ssrc);
    audio_ssrc_.store(audio_ssrc);
  }

  bool Update(const rtp::RtpFrame& /*frame*/) override {
    const uint64_t n = updates_.fetch_add(1) + 1;
    return report_every_ != 0 && n % report_every_ == 0;
  }

  void Reset() override { resets_.fetch_add(1); }
  void Close() override { closes_.fetch_add(1); }

  uint32_t VideoSsrc() const { return video_ssrc_.load(); }
  uint32_t AudioSsrc() const { return audio_ssrc_.load(); }
  uint64_t Updates() const { return updates_.load(); }
  int Resets() const { return resets_.load(); }
  int Closes() const { return closes_.load(); }

 protected:
  void SendReport(const rtcp::ReportPacket& /*packet*/, bool /*is_video*/) override {}

 private:
  uint64_t report_every_;
  std::atomic<uint32_t> video_ssrc_{0};
  std::atomic<uint32_t> audio_ssrc_{0};
  std::atomic<uint64_t> updates_{0};
  std::atomic<int> resets_{0};
  std::atomic<int> closes_{0};
};

}  // namespace rtpcast::tests::fixtures

#endif  // RTPCAST_TESTS_FIXTURES_FAKE_SENDER_REPORT_H_
