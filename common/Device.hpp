#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace lanwatch::common
{
    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;

    enum class DeviceStatus
    {
        Unknown,
        Up,
        Down
    };

    struct Device
    {
        std::string id;
        std::string ip;
        std::optional<std::string> mac;
        std::optional<std::string> hostname;
        std::optional<std::string> vendor;
        std::optional<std::string> device_class;
        DeviceStatus status = DeviceStatus::Unknown;
        Timestamp first_seen{};
        Timestamp last_seen{};
        std::set<std::string> tags;

        bool HasTag(const std::string &tag) const { return tags.count(tag) > 0; }
    };

    const char *StatusToString(DeviceStatus status);
    DeviceStatus StatusFromString(const std::string &text);

    // Lower-case, colon separated. Returns nullopt for anything that is not 6 octets.
    std::optional<std::string> NormalizeMac(const std::string &mac);

    // Upper-case hex of the first three octets, e.g. "AABBCC".
    std::string MacPrefix(const std::string &mac);

    std::int64_t ToUnixMillis(Timestamp ts);
    Timestamp FromUnixMillis(std::int64_t millis);

    std::string JoinTags(const std::set<std::string> &tags);
    std::set<std::string> SplitTags(const std::string &text);
}
