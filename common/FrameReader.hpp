#pragma once

#include <cstdint>
#include <vector>

#include "protocol.hpp"

namespace lanwatch::common
{
    struct Frame
    {
        lanwatch::protocol::MessageType type = lanwatch::protocol::MessageType::Heartbeat;
        std::vector<uint8_t> payload;
    };

    enum class FrameStatus
    {
        Incomplete, // need more bytes
        Ready,
        Malformed // bad magic or oversized payload; the stream cannot be resynchronized
    };

    // Cuts a TLS byte stream into frames. Consumed bytes are dropped lazily.
    class FrameReader
    {
    public:
        void Feed(const uint8_t *data, size_t size);

        // Fills out and advances past the frame on Ready.
        FrameStatus Next(Frame &out);

        size_t Buffered() const { return m_pending.size() - m_offset; }
        void Reset();

    private:
        void Compact();

        std::vector<uint8_t> m_pending;
        size_t m_offset = 0;
    };
}
