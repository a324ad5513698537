#include "FrameReader.hpp"

namespace lanwatch::common
{
    using lanwatch::protocol::HEADER_SIZE;

    void FrameReader::Feed(const uint8_t *data, size_t size)
    {
        Compact();
        m_pending.insert(m_pending.end(), data, data + size);
    }

    FrameStatus FrameReader::Next(Frame &out)
    {
        if (Buffered() < HEADER_SIZE)
            return FrameStatus::Incomplete;

        auto hdr = lanwatch::protocol::DeserializeHeader(m_pending.data() + m_offset);
        if (hdr.magic != lanwatch::protocol::EXPECTED_MAGIC ||
            hdr.payload_length > lanwatch::protocol::MAX_PAYLOAD_LENGTH)
            return FrameStatus::Malformed;

        if (Buffered() < HEADER_SIZE + hdr.payload_length)
            return FrameStatus::Incomplete;

        auto begin = m_pending.begin() + m_offset + HEADER_SIZE;
        out.type = static_cast<lanwatch::protocol::MessageType>(hdr.msg_type);
        out.payload.assign(begin, begin + hdr.payload_length);
        m_offset += HEADER_SIZE + hdr.payload_length;

        if (m_offset == m_pending.size())
            Reset();
        return FrameStatus::Ready;
    }

    void FrameReader::Reset()
    {
        m_pending.clear();
        m_offset = 0;
    }

    void FrameReader::Compact()
    {
        if (m_offset == 0)
            return;
        m_pending.erase(m_pending.begin(), m_pending.begin() + m_offset);
        m_offset = 0;
    }
}
