#include "Ber.hpp"

#include <sstream>
#include <stdexcept>

namespace lanwatch::identify::ber
{
    Oid ParseOid(const std::string &text)
    {
        Oid oid;
        std::stringstream ss(text);
        std::string part;

        while (std::getline(ss, part, '.'))
        {
            if (part.empty() || part.find_first_not_of("0123456789") != std::string::npos)
                throw std::invalid_argument("malformed OID: " + text);
            oid.push_back(static_cast<std::uint32_t>(std::stoul(part)));
        }

        if (oid.size() < 2)
            throw std::invalid_argument("OID needs at least two arcs: " + text);
        return oid;
    }

    std::string OidToString(const Oid &oid)
    {
        std::string out;
        for (size_t i = 0; i < oid.size(); ++i)
        {
            if (i > 0)
                out += '.';
            out += std::to_string(oid[i]);
        }
        return out;
    }

    bool OidStartsWith(const Oid &oid, const Oid &prefix)
    {
        if (oid.size() < prefix.size())
            return false;
        for (size_t i = 0; i < prefix.size(); ++i)
        {
            if (oid[i] != prefix[i])
                return false;
        }
        return true;
    }

    void AppendLength(std::vector<std::uint8_t> &buf, size_t length)
    {
        if (length < 0x80)
        {
            buf.push_back(static_cast<std::uint8_t>(length));
            return;
        }

        std::vector<std::uint8_t> bytes;
        while (length > 0)
        {
            bytes.insert(bytes.begin(), static_cast<std::uint8_t>(length & 0xFF));
            length >>= 8;
        }
        buf.push_back(static_cast<std::uint8_t>(0x80 | bytes.size()));
        buf.insert(buf.end(), bytes.begin(), bytes.end());
    }

    void AppendTlv(std::vector<std::uint8_t> &buf, std::uint8_t tag, const std::vector<std::uint8_t> &content)
    {
        buf.push_back(tag);
        AppendLength(buf, content.size());
        buf.insert(buf.end(), content.begin(), content.end());
    }

    std::vector<std::uint8_t> EncodeInteger(std::int64_t value)
    {
        std::vector<std::uint8_t> bytes;
        for (int shift = 56; shift >= 0; shift -= 8)
            bytes.push_back(static_cast<std::uint8_t>((static_cast<std::uint64_t>(value) >> shift) & 0xFF));

        // Minimal two's complement: drop redundant leading 0x00/0xFF octets.
        size_t start = 0;
        while (start + 1 < bytes.size())
        {
            bool redundant_zero = bytes[start] == 0x00 && (bytes[start + 1] & 0x80) == 0;
            bool redundant_ones = bytes[start] == 0xFF && (bytes[start + 1] & 0x80) != 0;
            if (!redundant_zero && !redundant_ones)
                break;
            ++start;
        }
        return std::vector<std::uint8_t>(bytes.begin() + start, bytes.end());
    }

    std::vector<std::uint8_t> EncodeUnsigned(std::uint64_t value)
    {
        std::vector<std::uint8_t> bytes;
        do
        {
            bytes.insert(bytes.begin(), static_cast<std::uint8_t>(value & 0xFF));
            value >>= 8;
        } while (value > 0);

        if (bytes.front() & 0x80)
            bytes.insert(bytes.begin(), 0x00);
        return bytes;
    }

    std::vector<std::uint8_t> EncodeOid(const Oid &oid)
    {
        std::vector<std::uint8_t> out;
        if (oid.size() < 2)
            return out;

        auto append_arc = [&out](std::uint32_t arc)
        {
            std::vector<std::uint8_t> chunk;
            chunk.push_back(static_cast<std::uint8_t>(arc & 0x7F));
            arc >>= 7;
            while (arc > 0)
            {
                chunk.insert(chunk.begin(), static_cast<std::uint8_t>(0x80 | (arc & 0x7F)));
                arc >>= 7;
            }
            out.insert(out.end(), chunk.begin(), chunk.end());
        };

        append_arc(oid[0] * 40 + oid[1]);
        for (size_t i = 2; i < oid.size(); ++i)
            append_arc(oid[i]);
        return out;
    }

    Reader::Reader(const std::uint8_t *data, size_t size) : m_data(data), m_size(size)
    {
    }

    Reader::Reader(const std::vector<std::uint8_t> &data) : Reader(data.data(), data.size())
    {
    }

    std::optional<Tlv> Reader::Next()
    {
        if (m_offset + 2 > m_size)
            return std::nullopt;

        Tlv tlv;
        tlv.tag = m_data[m_offset++];

        size_t length = m_data[m_offset++];
        if (length & 0x80)
        {
            size_t count = length & 0x7F;
            if (count == 0 || count > 4 || m_offset + count > m_size)
                return std::nullopt;

            length = 0;
            for (size_t i = 0; i < count; ++i)
                length = (length << 8) | m_data[m_offset++];
        }

        if (length > m_size - m_offset)
            return std::nullopt;

        tlv.value.assign(m_data + m_offset, m_data + m_offset + length);
        m_offset += length;
        return tlv;
    }

    std::optional<std::int64_t> DecodeInteger(const Tlv &tlv)
    {
        if (tlv.value.empty() || tlv.value.size() > 8)
            return std::nullopt;

        std::int64_t value = (tlv.value[0] & 0x80) ? -1 : 0;
        for (std::uint8_t b : tlv.value)
            value = static_cast<std::int64_t>((static_cast<std::uint64_t>(value) << 8) | b);
        return value;
    }

    std::optional<std::uint64_t> DecodeUnsigned(const Tlv &tlv)
    {
        if (tlv.value.empty())
            return std::nullopt;

        size_t start = 0;
        if (tlv.value.size() > 1 && tlv.value[0] == 0x00)
            start = 1;
        if (tlv.value.size() - start > 8)
            return std::nullopt;

        std::uint64_t value = 0;
        for (size_t i = start; i < tlv.value.size(); ++i)
            value = (value << 8) | tlv.value[i];
        return value;
    }

    std::optional<Oid> DecodeOid(const Tlv &tlv)
    {
        if (tlv.value.empty())
            return std::nullopt;

        Oid oid;
        std::uint32_t arc = 0;
        bool first = true;

        for (size_t i = 0; i < tlv.value.size(); ++i)
        {
            arc = (arc << 7) | (tlv.value[i] & 0x7F);
            if (tlv.value[i] & 0x80)
                continue;

            if (first)
            {
                std::uint32_t head = arc < 80 ? arc / 40 : 2;
                oid.push_back(head);
                oid.push_back(arc - head * 40);
                first = false;
            }
            else
            {
                oid.push_back(arc);
            }
            arc = 0;
        }

        // Last octet still had the continuation bit set.
        if (tlv.value.back() & 0x80)
            return std::nullopt;
        return oid;
    }
}
