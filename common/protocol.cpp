#include "protocol.hpp"
#include "Codec.hpp"

namespace lanwatch::protocol
{
    using namespace lanwatch::common;

    namespace
    {
        void AppendDevice(std::vector<std::uint8_t> &out, const Device &d)
        {
            wire::append_string(out, d.id);
            wire::append_string(out, d.ip);
            wire::append_opt_string(out, d.mac);
            wire::append_opt_string(out, d.hostname);
            wire::append_opt_string(out, d.vendor);
            wire::append_opt_string(out, d.device_class);
            wire::append_u8(out, static_cast<std::uint8_t>(d.status));
            wire::append_i64_be(out, ToUnixMillis(d.first_seen));
            wire::append_i64_be(out, ToUnixMillis(d.last_seen));
            wire::append_u32_be(out, static_cast<std::uint32_t>(d.tags.size()));
            for (const auto &tag : d.tags)
                wire::append_string(out, tag);
        }

        bool ReadDevice(const std::vector<std::uint8_t> &in, size_t &offset, Device &d)
        {
            std::uint8_t status = 0;
            std::int64_t first = 0, last = 0;
            std::uint32_t tag_count = 0;

            if (!wire::read_string(in, offset, d.id) ||
                !wire::read_string(in, offset, d.ip) ||
                !wire::read_opt_string(in, offset, d.mac) ||
                !wire::read_opt_string(in, offset, d.hostname) ||
                !wire::read_opt_string(in, offset, d.vendor) ||
                !wire::read_opt_string(in, offset, d.device_class) ||
                !wire::read_u8(in, offset, status) ||
                !wire::read_i64_be(in, offset, first) ||
                !wire::read_i64_be(in, offset, last) ||
                !wire::read_u32_be(in, offset, tag_count))
                return false;

            if (status > static_cast<std::uint8_t>(DeviceStatus::Down))
                return false;

            d.status = static_cast<DeviceStatus>(status);
            d.first_seen = FromUnixMillis(first);
            d.last_seen = FromUnixMillis(last);

            for (std::uint32_t i = 0; i < tag_count; ++i)
            {
                std::string tag;
                if (!wire::read_string(in, offset, tag))
                    return false;
                d.tags.insert(std::move(tag));
            }
            return true;
        }

        bool ReadTimestamp(const std::vector<std::uint8_t> &in, size_t &offset, Timestamp &ts)
        {
            std::int64_t millis = 0;
            if (!wire::read_i64_be(in, offset, millis))
                return false;
            ts = FromUnixMillis(millis);
            return true;
        }

        struct EncodeVisitor
        {
            std::vector<std::uint8_t> &out;

            void operator()(const DeviceDiscovered &e) const
            {
                AppendDevice(out, e.device);
            }

            void operator()(const DeviceUp &e) const
            {
                wire::append_string(out, e.device_id);
                wire::append_i64_be(out, ToUnixMillis(e.ts));
            }

            void operator()(const DeviceDown &e) const
            {
                wire::append_string(out, e.device_id);
                wire::append_i64_be(out, ToUnixMillis(e.ts));
            }

            void operator()(const Latency &e) const
            {
                wire::append_string(out, e.device_id);
                wire::append_f64_be(out, e.ms);
                wire::append_f64_be(out, e.min_ms);
                wire::append_f64_be(out, e.max_ms);
                wire::append_f64_be(out, e.loss);
                wire::append_i64_be(out, ToUnixMillis(e.ts));
            }

            void operator()(const Bandwidth &e) const
            {
                wire::append_string(out, e.device_id);
                wire::append_u32_be(out, e.if_index);
                wire::append_f64_be(out, e.in_bps);
                wire::append_f64_be(out, e.out_bps);
                wire::append_i64_be(out, ToUnixMillis(e.ts));
            }
        };

        struct TypeVisitor
        {
            MessageType operator()(const DeviceDiscovered &) const { return MessageType::DeviceDiscovered; }
            MessageType operator()(const DeviceUp &) const { return MessageType::DeviceUp; }
            MessageType operator()(const DeviceDown &) const { return MessageType::DeviceDown; }
            MessageType operator()(const Latency &) const { return MessageType::Latency; }
            MessageType operator()(const Bandwidth &) const { return MessageType::Bandwidth; }
        };
    }

    MessageType MessageTypeFor(const Event &event)
    {
        return std::visit(TypeVisitor{}, event);
    }

    std::vector<std::uint8_t> EncodeEvent(const Event &event)
    {
        std::vector<std::uint8_t> payload;
        std::visit(EncodeVisitor{payload}, event);
        return payload;
    }

    std::optional<Event> DecodeEvent(MessageType type, const std::vector<std::uint8_t> &payload)
    {
        size_t offset = 0;

        switch (type)
        {
        case MessageType::DeviceDiscovered:
        {
            DeviceDiscovered e;
            if (!ReadDevice(payload, offset, e.device))
                return std::nullopt;
            return Event{std::move(e)};
        }
        case MessageType::DeviceUp:
        {
            DeviceUp e;
            if (!wire::read_string(payload, offset, e.device_id) || !ReadTimestamp(payload, offset, e.ts))
                return std::nullopt;
            return Event{std::move(e)};
        }
        case MessageType::DeviceDown:
        {
            DeviceDown e;
            if (!wire::read_string(payload, offset, e.device_id) || !ReadTimestamp(payload, offset, e.ts))
                return std::nullopt;
            return Event{std::move(e)};
        }
        case MessageType::Latency:
        {
            Latency e;
            if (!wire::read_string(payload, offset, e.device_id) ||
                !wire::read_f64_be(payload, offset, e.ms) ||
                !wire::read_f64_be(payload, offset, e.min_ms) ||
                !wire::read_f64_be(payload, offset, e.max_ms) ||
                !wire::read_f64_be(payload, offset, e.loss) ||
                !ReadTimestamp(payload, offset, e.ts))
                return std::nullopt;
            return Event{std::move(e)};
        }
        case MessageType::Bandwidth:
        {
            Bandwidth e;
            if (!wire::read_string(payload, offset, e.device_id) ||
                !wire::read_u32_be(payload, offset, e.if_index) ||
                !wire::read_f64_be(payload, offset, e.in_bps) ||
                !wire::read_f64_be(payload, offset, e.out_bps) ||
                !ReadTimestamp(payload, offset, e.ts))
                return std::nullopt;
            return Event{std::move(e)};
        }
        default:
            return std::nullopt;
        }
    }

    std::vector<std::uint8_t> EncodeHello(const Hello &hello)
    {
        std::vector<std::uint8_t> out;
        wire::append_u32_be(out, hello.version);
        wire::append_string(out, hello.server);
        wire::append_u32_be(out, hello.subscriber_id);
        return out;
    }

    std::optional<Hello> DecodeHello(const std::vector<std::uint8_t> &payload)
    {
        Hello hello;
        std::size_t offset = 0;
        if (!wire::read_u32_be(payload, offset, hello.version) ||
            !wire::read_string(payload, offset, hello.server) ||
            !wire::read_u32_be(payload, offset, hello.subscriber_id))
            return std::nullopt;
        return hello;
    }

    std::vector<std::uint8_t> BuildFrame(MessageType type, const std::vector<std::uint8_t> &payload)
    {
        Header hdr;
        hdr.magic = EXPECTED_MAGIC;
        hdr.msg_type = static_cast<uint8_t>(type);
        hdr.payload_length = static_cast<uint32_t>(payload.size());
        hdr.reserved = 0;

        std::vector<std::uint8_t> frame(HEADER_SIZE);
        SerializeHeader(hdr, frame.data());
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }
}
