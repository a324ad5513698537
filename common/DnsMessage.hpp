#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::common::dns
{
    enum RecordType : std::uint16_t
    {
        A = 1,
        PTR = 12,
        TXT = 16,
        AAAA = 28,
        SRV = 33,
        ANY = 255
    };

    inline constexpr std::uint16_t CLASS_IN = 1;
    inline constexpr std::uint16_t FLAG_RESPONSE = 0x8000;
    inline constexpr std::uint16_t FLAG_RECURSION_DESIRED = 0x0100;

    struct Question
    {
        std::string name;
        std::uint16_t type = PTR;
        std::uint16_t qclass = CLASS_IN;
    };

    struct ResourceRecord
    {
        std::string name;
        std::uint16_t type = 0;
        std::uint16_t rclass = 0;
        std::uint32_t ttl = 0;

        // Decoded rdata: PTR/SRV target name, or A address in dotted form.
        std::string target;
        std::uint16_t port = 0; // SRV only
    };

    struct Message
    {
        std::uint16_t id = 0;
        std::uint16_t flags = 0;
        int rcode = 0;
        std::vector<Question> questions;
        std::vector<ResourceRecord> answers;
        std::vector<ResourceRecord> authorities;
        std::vector<ResourceRecord> additionals;

        bool IsResponse() const { return (flags & FLAG_RESPONSE) != 0; }
    };

    std::vector<std::uint8_t> EncodeQuery(std::uint16_t id, const std::vector<Question> &questions, bool recursion_desired);

    // nullopt on truncated or malformed input.
    std::optional<Message> Decode(const std::vector<std::uint8_t> &data);

    // "192.168.1.10" -> "10.1.168.192.in-addr.arpa". Throws std::invalid_argument for a bad address.
    std::string ReversePointerName(const std::string &ipv4);
}
