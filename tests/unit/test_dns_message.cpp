/**
 * @file test_dns_message.cpp
 * @brief Unit tests for the DNS codec and mDNS response handling
 *
 * Tests cover:
 * - Query encoding
 * - Response decoding for A, PTR and SRV records, with name compression
 * - Malformed input and pointer loops
 * - Reverse pointer names
 * - Service type and host collection from mDNS responses
 */

#include <gtest/gtest.h>

#include "common/DnsMessage.hpp"
#include "discovery/MdnsBrowser.hpp"

#include <algorithm>
#include <stdexcept>

using namespace lanwatch;
using namespace lanwatch::common::dns;

namespace {

using Bytes = std::vector<std::uint8_t>;

// Builds a response message record by record.
class ResponseBuilder {
public:
    explicit ResponseBuilder(std::uint16_t id, std::uint16_t flags = FLAG_RESPONSE) {
        U16(id);
        U16(flags);
        for (int i = 0; i < 4; ++i)
            U16(0);
    }

    size_t Offset() const { return bytes.size(); }

    void Question(const std::string &name, std::uint16_t type) {
        Name(name);
        U16(type);
        U16(CLASS_IN);
        Bump(4);
    }

    void Ptr(const std::string &name, const std::string &target, int section = 6) {
        Bytes rdata = EncodeName(target);
        Record(name, PTR, rdata, section);
    }

    void A(const std::string &name, std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d, int section = 6) {
        Record(name, common::dns::A, Bytes{a, b, c, d}, section);
    }

    void Srv(const std::string &name, const std::string &target, std::uint16_t port, int section = 6) {
        Bytes rdata = {0, 0, 0, 0, static_cast<std::uint8_t>(port >> 8), static_cast<std::uint8_t>(port & 0xFF)};
        Bytes encoded = EncodeName(target);
        rdata.insert(rdata.end(), encoded.begin(), encoded.end());
        Record(name, SRV, rdata, section);
    }

    // Record whose owner name is a compression pointer to an earlier offset.
    void PtrAtPointer(size_t pointer, const std::string &target) {
        bytes.push_back(static_cast<std::uint8_t>(0xC0 | (pointer >> 8)));
        bytes.push_back(static_cast<std::uint8_t>(pointer & 0xFF));
        Tail(PTR, EncodeName(target));
        Bump(6);
    }

    Bytes bytes;

private:
    static Bytes EncodeName(const std::string &name) {
        Bytes out;
        size_t start = 0;
        while (start < name.size()) {
            size_t dot = name.find('.', start);
            if (dot == std::string::npos)
                dot = name.size();
            out.push_back(static_cast<std::uint8_t>(dot - start));
            out.insert(out.end(), name.begin() + start, name.begin() + dot);
            start = dot + 1;
        }
        out.push_back(0);
        return out;
    }

    void U16(std::uint16_t v) {
        bytes.push_back(static_cast<std::uint8_t>(v >> 8));
        bytes.push_back(static_cast<std::uint8_t>(v & 0xFF));
    }

    void Name(const std::string &name) {
        Bytes encoded = EncodeName(name);
        bytes.insert(bytes.end(), encoded.begin(), encoded.end());
    }

    void Tail(std::uint16_t type, const Bytes &rdata) {
        U16(type);
        U16(CLASS_IN);
        U16(0);
        U16(120);
        U16(static_cast<std::uint16_t>(rdata.size()));
        bytes.insert(bytes.end(), rdata.begin(), rdata.end());
    }

    void Record(const std::string &name, std::uint16_t type, const Bytes &rdata, int section) {
        Name(name);
        Tail(type, rdata);
        Bump(section);
    }

    // Header count fields live at offsets 4 (qd), 6 (an), 8 (ns), 10 (ar).
    void Bump(int count_offset) {
        std::uint16_t value = static_cast<std::uint16_t>((bytes[count_offset] << 8) | bytes[count_offset + 1]);
        ++value;
        bytes[count_offset] = static_cast<std::uint8_t>(value >> 8);
        bytes[count_offset + 1] = static_cast<std::uint8_t>(value & 0xFF);
    }
};

constexpr int kAnswer = 6;
constexpr int kAdditional = 10;

}

class DnsMessageTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// =============================================================================
// Codec
// =============================================================================

TEST_F(DnsMessageTest, EncodesQuery) {
    auto bytes = EncodeQuery(0x1234, {{"example.local", PTR, CLASS_IN}}, true);

    ASSERT_GE(bytes.size(), 12u);
    EXPECT_EQ(bytes[0], 0x12);
    EXPECT_EQ(bytes[1], 0x34);
    EXPECT_EQ(bytes[2], 0x01);
    EXPECT_EQ(bytes[5], 0x01);

    auto msg = Decode(bytes);
    ASSERT_TRUE(msg.has_value());
    EXPECT_FALSE(msg->IsResponse());
    ASSERT_EQ(msg->questions.size(), 1u);
    EXPECT_EQ(msg->questions[0].name, "example.local");
    EXPECT_EQ(msg->questions[0].type, PTR);
}

TEST_F(DnsMessageTest, DecodesRecordTypes) {
    ResponseBuilder b(7);
    b.A("host.local", 192, 168, 1, 9, kAnswer);
    b.Srv("web._http._tcp.local", "host.local", 8080, kAnswer);
    b.Ptr("9.1.168.192.in-addr.arpa", "host.lan", kAnswer);

    auto msg = Decode(b.bytes);
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(msg->IsResponse());
    EXPECT_EQ(msg->id, 7);
    ASSERT_EQ(msg->answers.size(), 3u);

    EXPECT_EQ(msg->answers[0].target, "192.168.1.9");
    EXPECT_EQ(msg->answers[1].type, SRV);
    EXPECT_EQ(msg->answers[1].target, "host.local");
    EXPECT_EQ(msg->answers[1].port, 8080);
    EXPECT_EQ(msg->answers[2].name, "9.1.168.192.in-addr.arpa");
    EXPECT_EQ(msg->answers[2].target, "host.lan");
    EXPECT_EQ(msg->answers[2].ttl, 120u);
}

TEST_F(DnsMessageTest, FollowsCompressionPointers) {
    ResponseBuilder b(1);
    size_t question_offset = b.Offset();
    b.Question("_services._dns-sd._udp.local", PTR);
    b.PtrAtPointer(question_offset, "_ipp._tcp.local");

    auto msg = Decode(b.bytes);
    ASSERT_TRUE(msg.has_value());
    ASSERT_EQ(msg->answers.size(), 1u);
    EXPECT_EQ(msg->answers[0].name, "_services._dns-sd._udp.local");
    EXPECT_EQ(msg->answers[0].target, "_ipp._tcp.local");
}

TEST_F(DnsMessageTest, RejectsTruncatedAndLoopingInput) {
    EXPECT_FALSE(Decode({0x00, 0x01, 0x80}).has_value());

    ResponseBuilder b(1);
    b.A("host.local", 10, 0, 0, 1, kAnswer);
    Bytes cut(b.bytes.begin(), b.bytes.end() - 2);
    EXPECT_FALSE(Decode(cut).has_value());

    // Answer whose name points at itself.
    ResponseBuilder loop(1);
    size_t self = loop.Offset();
    loop.PtrAtPointer(self, "x.local");
    EXPECT_FALSE(Decode(loop.bytes).has_value());
}

TEST_F(DnsMessageTest, RcodeIsExposed) {
    ResponseBuilder b(3, FLAG_RESPONSE | 0x0003);
    auto msg = Decode(b.bytes);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->rcode, 3);
}

TEST_F(DnsMessageTest, ReversePointerName) {
    EXPECT_EQ(ReversePointerName("192.168.1.10"), "10.1.168.192.in-addr.arpa");
    EXPECT_THROW(ReversePointerName("192.168.1"), std::invalid_argument);
}

// =============================================================================
// mDNS Responses
// =============================================================================

TEST_F(DnsMessageTest, CollectsServiceTypes) {
    ResponseBuilder b(0);
    b.Ptr("_services._dns-sd._udp.local", "_ipp._tcp.local", kAnswer);
    b.Ptr("_services._dns-sd._udp.local", "_airplay._tcp.local", kAnswer);
    b.Ptr("_http._tcp.local", "printer._http._tcp.local", kAnswer);

    auto msg = Decode(b.bytes);
    ASSERT_TRUE(msg.has_value());

    auto types = discovery::CollectServiceTypes(*msg);
    EXPECT_EQ(types, (std::set<std::string>{"_airplay._tcp.local", "_ipp._tcp.local"}));
}

TEST_F(DnsMessageTest, CollectsHostsFromSrvAndAddressRecords) {
    ResponseBuilder b(0);
    b.Ptr("_ipp._tcp.local", "Office Printer._ipp._tcp.local", kAnswer);
    b.Srv("Office Printer._ipp._tcp.local", "printer.local", 631, kAdditional);
    b.A("printer.local", 192, 168, 1, 40, kAdditional);
    b.A("nas.local", 192, 168, 1, 41, kAdditional);

    auto msg = Decode(b.bytes);
    ASSERT_TRUE(msg.has_value());

    std::vector<discovery::ProbeResult> hosts;
    discovery::CollectHosts(*msg, "192.168.1.99", hosts);

    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0].ip, "192.168.1.40");
    EXPECT_EQ(hosts[0].name, std::optional<std::string>("printer"));
    EXPECT_EQ(hosts[0].source, discovery::ProbeMethod::Mdns);
    EXPECT_FALSE(hosts[0].mac.has_value());
    EXPECT_EQ(hosts[1].ip, "192.168.1.41");
    EXPECT_EQ(hosts[1].name, std::optional<std::string>("nas"));
}

TEST_F(DnsMessageTest, SrvWithoutAddressFallsBackToResponder) {
    ResponseBuilder b(0);
    b.Srv("tv._airplay._tcp.local", "livingroom-tv.local", 7000, kAnswer);

    auto msg = Decode(b.bytes);
    ASSERT_TRUE(msg.has_value());

    std::vector<discovery::ProbeResult> hosts;
    discovery::CollectHosts(*msg, "192.168.1.77", hosts);

    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].ip, "192.168.1.77");
    EXPECT_EQ(hosts[0].name, std::optional<std::string>("livingroom-tv"));
}

TEST_F(DnsMessageTest, FallbackServiceTypesAreBounded) {
    auto types = discovery::MdnsBrowser::FallbackServiceTypes();
    EXPECT_FALSE(types.empty());
    EXPECT_LE(types.size(), discovery::MdnsBrowser::MAX_SERVICE_TYPES);
    EXPECT_NE(std::find(types.begin(), types.end(), "_http._tcp.local"), types.end());
}
