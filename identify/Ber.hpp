#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::identify::ber
{
    // Universal, application and context tags used by SNMPv2c.
    enum Tag : std::uint8_t
    {
        Integer = 0x02,
        OctetString = 0x04,
        Null = 0x05,
        ObjectId = 0x06,
        Sequence = 0x30,
        IpAddress = 0x40,
        Counter32 = 0x41,
        Gauge32 = 0x42,
        TimeTicks = 0x43,
        Counter64 = 0x46,
        NoSuchObject = 0x80,
        NoSuchInstance = 0x81,
        EndOfMibView = 0x82,
        GetRequest = 0xA0,
        GetNextRequest = 0xA1,
        GetResponse = 0xA2
    };

    using Oid = std::vector<std::uint32_t>;

    // "1.3.6.1.2.1.1.5.0" -> {1,3,6,...}. Throws std::invalid_argument on malformed text.
    Oid ParseOid(const std::string &text);
    std::string OidToString(const Oid &oid);
    bool OidStartsWith(const Oid &oid, const Oid &prefix);

    void AppendLength(std::vector<std::uint8_t> &buf, size_t length);
    void AppendTlv(std::vector<std::uint8_t> &buf, std::uint8_t tag, const std::vector<std::uint8_t> &content);

    std::vector<std::uint8_t> EncodeInteger(std::int64_t value);
    std::vector<std::uint8_t> EncodeUnsigned(std::uint64_t value);
    std::vector<std::uint8_t> EncodeOid(const Oid &oid);

    struct Tlv
    {
        std::uint8_t tag = 0;
        std::vector<std::uint8_t> value;
    };

    // Sequential TLV reader over a byte range it does not own.
    class Reader
    {
    public:
        Reader(const std::uint8_t *data, size_t size);
        explicit Reader(const std::vector<std::uint8_t> &data);

        // nullopt at the end of input or on a truncated/invalid element.
        std::optional<Tlv> Next();
        bool AtEnd() const { return m_offset >= m_size; }

    private:
        const std::uint8_t *m_data;
        size_t m_size;
        size_t m_offset = 0;
    };

    std::optional<std::int64_t> DecodeInteger(const Tlv &tlv);
    std::optional<std::uint64_t> DecodeUnsigned(const Tlv &tlv);
    std::optional<Oid> DecodeOid(const Tlv &tlv);
}
