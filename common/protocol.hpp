#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "Event.hpp"

namespace lanwatch::protocol
{

    inline constexpr uint16_t EXPECTED_MAGIC = 0x4C57; // "LW"
    inline constexpr uint32_t MAX_PAYLOAD_LENGTH = 1024 * 1024; // 1MB
    inline constexpr size_t HEADER_SIZE = 8;
    inline constexpr uint32_t PROTOCOL_VERSION = 1;

    struct Header
    {
        uint16_t magic;
        uint8_t msg_type;
        uint32_t payload_length;
        uint8_t reserved;
    };

    enum class MessageType : std::uint8_t
    {
        Hello = 0x01,
        Heartbeat = 0x02,

        DeviceDiscovered = 0x10,
        DeviceUp = 0x11,
        DeviceDown = 0x12,
        Latency = 0x13,
        Bandwidth = 0x14,

        ErrorResp = 0xFF
    };

    inline void SerializeHeader(const Header& hdr, std::uint8_t* buffer)
    {
        buffer[0] = static_cast<uint8_t>((hdr.magic >> 8) & 0xFF);
        buffer[1] = static_cast<uint8_t>(hdr.magic & 0xFF);

        buffer[2] = hdr.msg_type;

        buffer[3] = static_cast<uint8_t>((hdr.payload_length >> 24) & 0xFF);
        buffer[4] = static_cast<uint8_t>((hdr.payload_length >> 16) & 0xFF);
        buffer[5] = static_cast<uint8_t>((hdr.payload_length >> 8) & 0xFF);
        buffer[6] = static_cast<uint8_t>(hdr.payload_length & 0xFF);

        buffer[7] = hdr.reserved;
    }

    inline Header DeserializeHeader(const std::uint8_t* buffer)
    {
        Header hdr;

        hdr.magic = (static_cast<uint16_t>(buffer[0]) << 8) |
                     static_cast<uint16_t>(buffer[1]);

        hdr.msg_type = buffer[2];

        hdr.payload_length = (static_cast<uint32_t>(buffer[3]) << 24) |
                             (static_cast<uint32_t>(buffer[4]) << 16) |
                             (static_cast<uint32_t>(buffer[5]) << 8)  |
                             static_cast<uint32_t>(buffer[6]);

        hdr.reserved = buffer[7];

        return hdr;
    }

    MessageType MessageTypeFor(const lanwatch::common::Event& event);

    std::vector<std::uint8_t> EncodeEvent(const lanwatch::common::Event& event);

    // nullopt when the type is not an event type or the payload is truncated.
    std::optional<lanwatch::common::Event> DecodeEvent(MessageType type, const std::vector<std::uint8_t>& payload);

    // First frame on every stream connection.
    struct Hello
    {
        uint32_t version = PROTOCOL_VERSION;
        std::string server;
        uint32_t subscriber_id = 0;
    };

    std::vector<std::uint8_t> EncodeHello(const Hello& hello);
    std::optional<Hello> DecodeHello(const std::vector<std::uint8_t>& payload);

    // Header followed by payload, ready for the wire.
    std::vector<std::uint8_t> BuildFrame(MessageType type, const std::vector<std::uint8_t>& payload);

}
