/**
 * @file test_protocol.cpp
 * @brief Unit tests for stream framing and event payloads
 *
 * Tests cover:
 * - Header serialization and frame building
 * - FrameReader reassembly of split and coalesced frames
 * - Event payload decoding for every event type
 * - Truncated and unknown payloads
 * - Hello frame
 */

#include <gtest/gtest.h>

#include "common/FrameReader.hpp"
#include "common/Event.hpp"
#include "common/protocol.hpp"

#include <variant>

using namespace lanwatch;
using namespace lanwatch::protocol;

class ProtocolTest : public ::testing::Test {
protected:
    common::Timestamp ts = common::FromUnixMillis(1700000000123);

    common::Device SampleDevice() {
        common::Device d;
        d.id = "aa:bb:cc:dd:ee:ff";
        d.ip = "192.168.1.20";
        d.mac = "aa:bb:cc:dd:ee:ff";
        d.hostname = "printer";
        d.vendor = "Acme Corp";
        d.status = common::DeviceStatus::Up;
        d.first_seen = ts;
        d.last_seen = ts;
        d.tags = {"arp", "mdns"};
        return d;
    }
};

// =============================================================================
// Framing
// =============================================================================

TEST_F(ProtocolTest, HeaderLayoutIsBigEndian) {
    Header hdr{EXPECTED_MAGIC, static_cast<uint8_t>(MessageType::Latency), 0x01020304, 0};
    uint8_t buf[HEADER_SIZE];
    SerializeHeader(hdr, buf);

    EXPECT_EQ(buf[0], 0x4C);
    EXPECT_EQ(buf[1], 0x57);
    EXPECT_EQ(buf[2], 0x13);
    EXPECT_EQ(buf[3], 0x01);
    EXPECT_EQ(buf[6], 0x04);

    Header back = DeserializeHeader(buf);
    EXPECT_EQ(back.magic, EXPECTED_MAGIC);
    EXPECT_EQ(back.payload_length, 0x01020304u);
}

TEST_F(ProtocolTest, FrameReaderReassemblesSplitFrames) {
    auto first = BuildFrame(MessageType::DeviceUp, EncodeEvent(common::DeviceUp{"dev-1", ts}));
    auto second = BuildFrame(MessageType::Heartbeat, {});

    std::vector<uint8_t> stream(first);
    stream.insert(stream.end(), second.begin(), second.end());

    common::FrameReader reader;
    common::Frame frame;
    reader.Feed(stream.data(), 5);
    EXPECT_EQ(reader.Next(frame), common::FrameStatus::Incomplete);

    reader.Feed(stream.data() + 5, stream.size() - 5);
    ASSERT_EQ(reader.Next(frame), common::FrameStatus::Ready);
    EXPECT_EQ(frame.type, MessageType::DeviceUp);

    auto event = DecodeEvent(frame.type, frame.payload);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(std::get<common::DeviceUp>(*event).device_id, "dev-1");

    EXPECT_EQ(reader.Buffered(), HEADER_SIZE);
    ASSERT_EQ(reader.Next(frame), common::FrameStatus::Ready);
    EXPECT_EQ(frame.type, MessageType::Heartbeat);
    EXPECT_TRUE(frame.payload.empty());
    EXPECT_EQ(reader.Buffered(), 0u);
    EXPECT_EQ(reader.Next(frame), common::FrameStatus::Incomplete);
}

TEST_F(ProtocolTest, FrameReaderKeepsPartialTailAcrossFeeds) {
    auto first = BuildFrame(MessageType::DeviceDown, EncodeEvent(common::DeviceDown{"dev-2", ts}));
    auto second = BuildFrame(MessageType::DeviceUp, EncodeEvent(common::DeviceUp{"dev-3", ts}));

    std::vector<uint8_t> stream(first);
    stream.insert(stream.end(), second.begin(), second.begin() + 3);

    common::FrameReader reader;
    common::Frame frame;
    reader.Feed(stream.data(), stream.size());
    ASSERT_EQ(reader.Next(frame), common::FrameStatus::Ready);
    EXPECT_EQ(frame.type, MessageType::DeviceDown);
    EXPECT_EQ(reader.Next(frame), common::FrameStatus::Incomplete);

    reader.Feed(second.data() + 3, second.size() - 3);
    ASSERT_EQ(reader.Next(frame), common::FrameStatus::Ready);
    auto event = DecodeEvent(frame.type, frame.payload);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(std::get<common::DeviceUp>(*event).device_id, "dev-3");
}

TEST_F(ProtocolTest, RejectsBadMagicAndOversizedPayload) {
    uint8_t raw[HEADER_SIZE];
    common::Frame frame;

    common::FrameReader bad_magic;
    SerializeHeader(Header{0x1234, 0x10, 4, 0}, raw);
    bad_magic.Feed(raw, sizeof(raw));
    EXPECT_EQ(bad_magic.Next(frame), common::FrameStatus::Malformed);

    common::FrameReader huge;
    SerializeHeader(Header{EXPECTED_MAGIC, 0x10, MAX_PAYLOAD_LENGTH + 1, 0}, raw);
    huge.Feed(raw, sizeof(raw));
    EXPECT_EQ(huge.Next(frame), common::FrameStatus::Malformed);
}

// =============================================================================
// Event Payloads
// =============================================================================

TEST_F(ProtocolTest, DiscoveredCarriesFullDevice) {
    common::Event event = common::DeviceDiscovered{SampleDevice()};
    EXPECT_EQ(MessageTypeFor(event), MessageType::DeviceDiscovered);

    auto decoded = DecodeEvent(MessageType::DeviceDiscovered, EncodeEvent(event));
    ASSERT_TRUE(decoded.has_value());

    const auto &d = std::get<common::DeviceDiscovered>(*decoded).device;
    EXPECT_EQ(d.id, "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(d.ip, "192.168.1.20");
    EXPECT_EQ(d.hostname, std::optional<std::string>("printer"));
    EXPECT_EQ(d.vendor, std::optional<std::string>("Acme Corp"));
    EXPECT_FALSE(d.device_class.has_value());
    EXPECT_EQ(d.status, common::DeviceStatus::Up);
    EXPECT_EQ(common::ToUnixMillis(d.first_seen), 1700000000123);
    EXPECT_EQ(d.tags, (std::set<std::string>{"arp", "mdns"}));
}

TEST_F(ProtocolTest, MetricEventsKeepTheirFields) {
    common::Latency latency{"dev-1", 11.5, 10.0, 13.0, 0.2, ts};
    auto l = DecodeEvent(MessageType::Latency, EncodeEvent(latency));
    ASSERT_TRUE(l.has_value());
    const auto &lat = std::get<common::Latency>(*l);
    EXPECT_DOUBLE_EQ(lat.ms, 11.5);
    EXPECT_DOUBLE_EQ(lat.max_ms, 13.0);
    EXPECT_DOUBLE_EQ(lat.loss, 0.2);

    common::Bandwidth bandwidth{"dev-1", 3, 12.8, 4096.0, ts};
    auto b = DecodeEvent(MessageType::Bandwidth, EncodeEvent(bandwidth));
    ASSERT_TRUE(b.has_value());
    const auto &bw = std::get<common::Bandwidth>(*b);
    EXPECT_EQ(bw.if_index, 3u);
    EXPECT_DOUBLE_EQ(bw.in_bps, 12.8);
    EXPECT_DOUBLE_EQ(bw.out_bps, 4096.0);

    auto down = DecodeEvent(MessageType::DeviceDown, EncodeEvent(common::DeviceDown{"dev-2", ts}));
    ASSERT_TRUE(down.has_value());
    EXPECT_EQ(common::EventDeviceId(*down), "dev-2");
    EXPECT_STREQ(common::EventTypeName(*down), "device_down");
}

TEST_F(ProtocolTest, TruncatedOrUnknownPayloadsFail) {
    auto payload = EncodeEvent(common::Latency{"dev-1", 1.0, 1.0, 1.0, 0.0, ts});
    payload.resize(payload.size() - 3);

    EXPECT_FALSE(DecodeEvent(MessageType::Latency, payload).has_value());
    EXPECT_FALSE(DecodeEvent(MessageType::Heartbeat, {}).has_value());
    EXPECT_FALSE(DecodeEvent(MessageType::DeviceUp, {}).has_value());
}

// =============================================================================
// Hello
// =============================================================================

TEST_F(ProtocolTest, HelloFrame) {
    Hello hello;
    hello.server = "lanwatchd";
    hello.subscriber_id = 42;

    auto decoded = DecodeHello(EncodeHello(hello));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->version, PROTOCOL_VERSION);
    EXPECT_EQ(decoded->server, "lanwatchd");
    EXPECT_EQ(decoded->subscriber_id, 42u);

    EXPECT_FALSE(DecodeHello({0x00, 0x01}).has_value());
}
