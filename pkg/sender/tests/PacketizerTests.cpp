// Repository: Rtpcast-sender
// Component: Packetizer Tests
// Purpose: RTP header layout and per-codec payload formats.
// Copyright (c) 2025 Rtpcast contributors

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <vector>

#include "rtpcast/rtp/packets/AacPacketizer.hpp"
#include "rtpcast/rtp/packets/Av1Packetizer.hpp"
#include "rtpcast/rtp/packets/G711Packetizer.hpp"
#include "rtpcast/rtp/packets/H264Packetizer.hpp"
#include "rtpcast/rtp/packets/H265Packetizer.hpp"
#include "rtpcast/rtp/packets/NalUnits.hpp"
#include "rtpcast/rtp/packets/OpusPacketizer.hpp"

namespace rtpcast::rtp::testing {
namespace {

constexpr size_t kPayloadBudget = kMaxPacketSize - kRtpHeaderLength;

media::MediaFrame MakeFrame(media::MediaType type, std::vector<uint8_t> data, int64_t pts_us = 0,
                            bool keyframe = false) {
  media::MediaFrame frame;
  frame.type = type;
  frame.data = std::move(data);
  frame.info.pts_us = pts_us;
  frame.info.is_keyframe = keyframe;
  return frame;
}

std::vector<uint8_t> AnnexB(std::initializer_list<std::vector<uint8_t>> nals) {
  std::vector<uint8_t> out;
  for (const auto& nal : nals) {
    out.insert(out.end(), {0x00, 0x00, 0x00, 0x01});
    out.insert(out.end(), nal.begin(), nal.end());
  }
  return out;
}

std::vector<uint8_t> Nal(uint8_t header, size_t size, uint8_t fill = 0xAB) {
  std::vector<uint8_t> nal(size, fill);
  nal[0] = header;
  return nal;
}

bool Marker(const RtpFrame& packet) { return (packet.buffer[1] & 0x80) != 0; }
uint8_t PayloadTypeOf(const RtpFrame& packet) { return packet.buffer[1] & 0x7F; }
uint16_t Sequence(const RtpFrame& packet) {
  return static_cast<uint16_t>((packet.buffer[2] << 8) | packet.buffer[3]);
}
uint32_t Timestamp(const RtpFrame& packet) {
  return (static_cast<uint32_t>(packet.buffer[4]) << 24) |
         (static_cast<uint32_t>(packet.buffer[5]) << 16) |
         (static_cast<uint32_t>(packet.buffer[6]) << 8) | packet.buffer[7];
}
const uint8_t* Payload(const RtpFrame& packet) { return packet.buffer.data() + kRtpHeaderLength; }
size_t PayloadLength(const RtpFrame& packet) { return packet.length() - kRtpHeaderLength; }

// =============================================================================
// Annex-B scanning
// =============================================================================

TEST(NalUnitsTest, SplitsOnThreeAndFourByteStartCodes) {
  const std::vector<uint8_t> data = {0x00, 0x00, 0x00, 0x01, 0x67, 0x42, 0x00, 0x00,
                                     0x01, 0x68, 0xCE, 0x00, 0x00, 0x01, 0x65, 0x88};
  const std::vector<NalUnit> units = SplitAnnexB(data.data(), data.size());
  ASSERT_EQ(units.size(), 3u);
  EXPECT_EQ(units[0].size, 2u);
  EXPECT_EQ(units[0].data[0], 0x67);
  EXPECT_EQ(units[1].size, 2u);
  EXPECT_EQ(units[1].data[0], 0x68);
  EXPECT_EQ(units[2].size, 2u);
  EXPECT_EQ(units[2].data[0], 0x65);
}

TEST(NalUnitsTest, BufferWithoutStartCodeIsOneUnit) {
  const std::vector<uint8_t> data = {0x65, 0x88, 0x84};
  const std::vector<NalUnit> units = SplitAnnexB(data.data(), data.size());
  ASSERT_EQ(units.size(), 1u);
  EXPECT_EQ(units[0].size, 3u);
}

TEST(NalUnitsTest, StripStartCode) {
  EXPECT_EQ(StripStartCode({0x00, 0x00, 0x00, 0x01, 0x67}), (std::vector<uint8_t>{0x67}));
  EXPECT_EQ(StripStartCode({0x00, 0x00, 0x01, 0x68}), (std::vector<uint8_t>{0x68}));
  EXPECT_EQ(StripStartCode({0x67, 0x42}), (std::vector<uint8_t>{0x67, 0x42}));
}

// =============================================================================
// RTP header
// =============================================================================

TEST(RtpPacketizerTest, HeaderFields) {
  H264Packetizer packetizer;
  packetizer.SetSsrc(0x11223344);
  const auto packets = packetizer.CreatePackets(
      MakeFrame(media::MediaType::kVideo, AnnexB({Nal(0x41, 50)}), 1'000'000));
  ASSERT_EQ(packets.size(), 1u);
  const RtpFrame& p = packets[0];
  EXPECT_EQ(p.buffer[0], 0x80);
  EXPECT_EQ(PayloadTypeOf(p), kVideoPayloadType);
  EXPECT_EQ(Sequence(p), 0u);
  EXPECT_EQ(Timestamp(p), 90000u);
  EXPECT_EQ(p.timestamp, 90000u);
  EXPECT_EQ(p.buffer[8], 0x11);
  EXPECT_EQ(p.buffer[11], 0x44);
  EXPECT_EQ(p.channel_identifier, kVideoTrackChannel);
  EXPECT_TRUE(p.IsVideoFrame());
}

TEST(RtpPacketizerTest, SequenceContinuesAcrossFramesAndResets) {
  G711Packetizer packetizer;
  for (int i = 0; i < 3; ++i) {
    const auto packets = packetizer.CreatePackets(
        MakeFrame(media::MediaType::kAudio, std::vector<uint8_t>(160, 0xD5)));
    ASSERT_EQ(packets.size(), 1u);
    EXPECT_EQ(Sequence(packets[0]), static_cast<uint16_t>(i));
  }
  EXPECT_EQ(packetizer.NextSequenceNumber(), 3u);
  packetizer.Reset();
  EXPECT_EQ(packetizer.NextSequenceNumber(), 0u);
}

TEST(RtpPacketizerTest, EveryPacketFitsTheMtu) {
  H264Packetizer packetizer;
  const auto packets = packetizer.CreatePackets(
      MakeFrame(media::MediaType::kVideo, AnnexB({Nal(0x65, 20000)}), 0, true));
  ASSERT_GT(packets.size(), 1u);
  for (const RtpFrame& p : packets) {
    EXPECT_LE(p.length(), kMaxPacketSize);
  }
}

// =============================================================================
// H.264
// =============================================================================

TEST(H264PacketizerTest, SmallNalIsSingleNalUnitPacket) {
  H264Packetizer packetizer;
  const std::vector<uint8_t> nal = Nal(0x41, 200);
  const auto packets =
      packetizer.CreatePackets(MakeFrame(media::MediaType::kVideo, AnnexB({nal})));
  ASSERT_EQ(packets.size(), 1u);
  EXPECT_TRUE(Marker(packets[0]));
  ASSERT_EQ(PayloadLength(packets[0]), nal.size());
  EXPECT_TRUE(std::equal(nal.begin(), nal.end(), Payload(packets[0])));
}

TEST(H264PacketizerTest, LargeNalIsFragmentedAsFuA) {
  H264Packetizer packetizer;
  const std::vector<uint8_t> nal = Nal(0x65, 4000);
  const auto packets =
      packetizer.CreatePackets(MakeFrame(media::MediaType::kVideo, AnnexB({nal})));
  ASSERT_EQ(packets.size(), 3u);

  std::vector<uint8_t> reassembled = {static_cast<uint8_t>(
      (Payload(packets[0])[0] & 0xE0) | (Payload(packets[0])[1] & 0x1F))};
  for (size_t i = 0; i < packets.size(); ++i) {
    const uint8_t* payload = Payload(packets[i]);
    EXPECT_EQ(payload[0] & 0x1F, H264Packetizer::kNalTypeFuA);
    EXPECT_EQ((payload[1] & 0x80) != 0, i == 0);
    EXPECT_EQ((payload[1] & 0x40) != 0, i + 1 == packets.size());
    EXPECT_EQ(Marker(packets[i]), i + 1 == packets.size());
    reassembled.insert(reassembled.end(), payload + 2, payload + PayloadLength(packets[i]));
  }
  EXPECT_EQ(reassembled, nal);
}

TEST(H264PacketizerTest, KeyframeStartsWithStapA) {
  H264Packetizer packetizer;
  const std::vector<uint8_t> sps = {0x67, 0x42, 0xC0, 0x1F};
  const std::vector<uint8_t> pps = {0x68, 0xCE, 0x3C, 0x80};
  packetizer.SetVideoInfo(AnnexB({sps}), pps);
  const auto packets = packetizer.CreatePackets(
      MakeFrame(media::MediaType::kVideo, AnnexB({Nal(0x65, 100)}), 0, true));
  ASSERT_EQ(packets.size(), 2u);

  const uint8_t* stap = Payload(packets[0]);
  EXPECT_EQ(stap[0] & 0x1F, H264Packetizer::kNalTypeStapA);
  EXPECT_FALSE(Marker(packets[0]));
  EXPECT_EQ(stap[1], 0x00);
  EXPECT_EQ(stap[2], sps.size());
  EXPECT_EQ(stap[3], 0x67);
  EXPECT_EQ(stap[3 + sps.size() + 1], pps.size());
  EXPECT_EQ(stap[3 + sps.size() + 2], 0x68);
  EXPECT_EQ(PayloadLength(packets[0]), 1 + 2 + sps.size() + 2 + pps.size());
  EXPECT_TRUE(Marker(packets[1]));
}

TEST(H264PacketizerTest, InBandParameterSetsAndAudDropped) {
  H264Packetizer packetizer;
  packetizer.SetVideoInfo({0x67, 0x42}, {0x68, 0xCE});
  const auto packets = packetizer.CreatePackets(MakeFrame(
      media::MediaType::kVideo,
      AnnexB({{0x09, 0xF0}, {0x67, 0x42}, {0x68, 0xCE}, Nal(0x41, 50)})));
  ASSERT_EQ(packets.size(), 1u);
  EXPECT_EQ(Payload(packets[0])[0], 0x41);
}

TEST(H264PacketizerTest, WithoutParameterSetsInBandNalsAreSent) {
  H264Packetizer packetizer;
  const auto packets = packetizer.CreatePackets(MakeFrame(
      media::MediaType::kVideo, AnnexB({{0x67, 0x42}, {0x68, 0xCE}, Nal(0x65, 50)}), 0, true));
  ASSERT_EQ(packets.size(), 3u);
  EXPECT_EQ(Payload(packets[0])[0], 0x67);
  EXPECT_EQ(Payload(packets[1])[0], 0x68);
  EXPECT_FALSE(Marker(packets[1]));
  EXPECT_TRUE(Marker(packets[2]));
}

// =============================================================================
// H.265
// =============================================================================

TEST(H265PacketizerTest, IrapPrecededByParameterSets) {
  H265Packetizer packetizer;
  packetizer.SetVideoInfo({0x42, 0x01, 0xAA}, {0x44, 0x01, 0xBB}, {0x40, 0x01, 0xCC});
  // IDR_W_RADL = 19.
  const auto packets = packetizer.CreatePackets(
      MakeFrame(media::MediaType::kVideo, AnnexB({Nal(19 << 1, 100)})));
  ASSERT_EQ(packets.size(), 4u);
  EXPECT_EQ(H265Packetizer::NalType(Payload(packets[0])), H265Packetizer::kNalTypeVps);
  EXPECT_EQ(H265Packetizer::NalType(Payload(packets[1])), H265Packetizer::kNalTypeSps);
  EXPECT_EQ(H265Packetizer::NalType(Payload(packets[2])), H265Packetizer::kNalTypePps);
  EXPECT_EQ(H265Packetizer::NalType(Payload(packets[3])), 19);
  EXPECT_FALSE(Marker(packets[2]));
  EXPECT_TRUE(Marker(packets[3]));
}

TEST(H265PacketizerTest, LargeNalIsFragmented) {
  H265Packetizer packetizer;
  std::vector<uint8_t> nal = Nal(1 << 1, 3000);
  nal[1] = 0x01;
  const auto packets =
      packetizer.CreatePackets(MakeFrame(media::MediaType::kVideo, AnnexB({nal})));
  ASSERT_EQ(packets.size(), 3u);

  std::vector<uint8_t> reassembled = {nal[0], nal[1]};
  for (size_t i = 0; i < packets.size(); ++i) {
    const uint8_t* payload = Payload(packets[i]);
    EXPECT_EQ(H265Packetizer::NalType(payload), H265Packetizer::kNalTypeFu);
    EXPECT_EQ(payload[1], 0x01);
    EXPECT_EQ(payload[2] & 0x3F, 1);
    EXPECT_EQ((payload[2] & 0x80) != 0, i == 0);
    EXPECT_EQ((payload[2] & 0x40) != 0, i + 1 == packets.size());
    reassembled.insert(reassembled.end(), payload + 3, payload + PayloadLength(packets[i]));
  }
  EXPECT_EQ(reassembled, nal);
}

// =============================================================================
// AV1
// =============================================================================

std::vector<uint8_t> Obu(uint8_t type, size_t payload_size) {
  std::vector<uint8_t> obu = {static_cast<uint8_t>((type << 3) | 0x02)};
  size_t size = payload_size;
  do {
    uint8_t byte = size & 0x7F;
    size >>= 7;
    if (size != 0) byte |= 0x80;
    obu.push_back(byte);
  } while (size != 0);
  obu.insert(obu.end(), payload_size, 0x3C);
  return obu;
}

TEST(Av1PacketizerTest, TemporalDelimiterDroppedAndSizeFieldCleared) {
  Av1Packetizer packetizer;
  std::vector<uint8_t> tu = Obu(Av1Packetizer::kObuTemporalDelimiter, 0);
  const std::vector<uint8_t> frame = Obu(6, 100);
  tu.insert(tu.end(), frame.begin(), frame.end());

  const auto packets = packetizer.CreatePackets(MakeFrame(media::MediaType::kVideo, tu));
  ASSERT_EQ(packets.size(), 1u);
  const uint8_t* payload = Payload(packets[0]);
  EXPECT_EQ(payload[0], Av1Packetizer::kAggW1);
  // OBU header without obu_has_size_field, then the 100 payload bytes.
  EXPECT_EQ(payload[1], 6 << 3);
  EXPECT_EQ(PayloadLength(packets[0]), 1u + 1u + 100u);
  EXPECT_TRUE(Marker(packets[0]));
}

TEST(Av1PacketizerTest, KeyframeWithSequenceHeaderSetsNewSequence) {
  Av1Packetizer packetizer;
  std::vector<uint8_t> tu = Obu(Av1Packetizer::kObuSequenceHeader, 12);
  const std::vector<uint8_t> frame = Obu(6, 50);
  tu.insert(tu.end(), frame.begin(), frame.end());

  const auto packets =
      packetizer.CreatePackets(MakeFrame(media::MediaType::kVideo, tu, 0, true));
  ASSERT_EQ(packets.size(), 2u);
  EXPECT_NE(Payload(packets[0])[0] & Av1Packetizer::kAggN, 0);
  EXPECT_EQ(Payload(packets[1])[0] & Av1Packetizer::kAggN, 0);
  EXPECT_FALSE(Marker(packets[0]));
  EXPECT_TRUE(Marker(packets[1]));
}

TEST(Av1PacketizerTest, LargeObuFragmentsWithContinuationBits) {
  Av1Packetizer packetizer;
  const auto packets = packetizer.CreatePackets(
      MakeFrame(media::MediaType::kVideo, Obu(6, 3500)));
  ASSERT_EQ(packets.size(), 3u);
  const uint8_t first = Payload(packets[0])[0];
  const uint8_t middle = Payload(packets[1])[0];
  const uint8_t last = Payload(packets[2])[0];
  EXPECT_EQ(first & (Av1Packetizer::kAggZ | Av1Packetizer::kAggY), Av1Packetizer::kAggY);
  EXPECT_EQ(middle & (Av1Packetizer::kAggZ | Av1Packetizer::kAggY),
            Av1Packetizer::kAggZ | Av1Packetizer::kAggY);
  EXPECT_EQ(last & (Av1Packetizer::kAggZ | Av1Packetizer::kAggY), Av1Packetizer::kAggZ);
  EXPECT_TRUE(Marker(packets[2]));
}

TEST(Av1PacketizerTest, TruncatedObuThrows) {
  Av1Packetizer packetizer;
  std::vector<uint8_t> tu = Obu(6, 100);
  tu.resize(50);
  EXPECT_THROW(packetizer.CreatePackets(MakeFrame(media::MediaType::kVideo, tu)),
               std::runtime_error);
}

// =============================================================================
// Audio
// =============================================================================

TEST(AacPacketizerTest, AdtsHeaderStrippedAndAuHeaderWritten) {
  AacPacketizer packetizer;
  packetizer.SetAudioInfo(48000);
  std::vector<uint8_t> data = {0xFF, 0xF1, 0x50, 0x80, 0x2E, 0x7F, 0xFC};
  data.insert(data.end(), 300, 0x21);

  const auto packets = packetizer.CreatePackets(
      MakeFrame(media::MediaType::kAudio, data, 500'000));
  ASSERT_EQ(packets.size(), 1u);
  const RtpFrame& p = packets[0];
  EXPECT_EQ(PayloadTypeOf(p), kAudioPayloadType);
  EXPECT_EQ(p.channel_identifier, kAudioTrackChannel);
  EXPECT_FALSE(p.IsVideoFrame());
  EXPECT_EQ(Timestamp(p), 24000u);
  EXPECT_TRUE(Marker(p));

  const uint8_t* payload = Payload(p);
  EXPECT_EQ(payload[0], 0x00);
  EXPECT_EQ(payload[1], 0x10);
  const uint16_t au = static_cast<uint16_t>((payload[2] << 8) | payload[3]);
  EXPECT_EQ(au >> 3, 300);
  EXPECT_EQ(PayloadLength(p), 4u + 300u);
  EXPECT_EQ(payload[4], 0x21);
}

TEST(G711PacketizerTest, RawPayloadNeverMarked) {
  G711Packetizer packetizer;
  packetizer.SetAudioInfo(8000);
  const auto packets = packetizer.CreatePackets(
      MakeFrame(media::MediaType::kAudio, std::vector<uint8_t>(kPayloadBudget + 40, 0xD5),
                1'000'000));
  ASSERT_EQ(packets.size(), 2u);
  EXPECT_EQ(PayloadTypeOf(packets[0]), kG711PayloadType);
  EXPECT_FALSE(Marker(packets[0]));
  EXPECT_FALSE(Marker(packets[1]));
  EXPECT_EQ(Timestamp(packets[0]), 8000u);
  EXPECT_EQ(Timestamp(packets[1]), 8000u + kPayloadBudget);
  EXPECT_EQ(PayloadLength(packets[1]), 40u);
}

TEST(OpusPacketizerTest, UsesFixedClockRegardlessOfInputRate) {
  OpusPacketizer packetizer;
  packetizer.SetAudioInfo(16000);
  EXPECT_EQ(packetizer.InputSampleRate(), 16000);
  EXPECT_EQ(packetizer.ClockRate(), kOpusClockRate);
  const auto packets = packetizer.CreatePackets(
      MakeFrame(media::MediaType::kAudio, std::vector<uint8_t>(120, 0x78), 20'000));
  ASSERT_EQ(packets.size(), 1u);
  EXPECT_EQ(Timestamp(packets[0]), 960u);
}

TEST(OpusPacketizerTest, OversizedPacketThrows) {
  OpusPacketizer packetizer;
  EXPECT_THROW(packetizer.CreatePackets(MakeFrame(media::MediaType::kAudio,
                                                  std::vector<uint8_t>(kPayloadBudget + 1, 0))),
               std::runtime_error);
}

}  // namespace
}  // namespace rtpcast::rtp::testing
