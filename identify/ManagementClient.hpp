#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::identify
{
    // System group of a managed device. Every field is optional.
    struct SystemInfo
    {
        std::optional<std::string> system_name;
        std::optional<std::string> system_description;
        std::optional<std::uint64_t> uptime_ticks; // hundredths of a second
        std::optional<std::string> contact;
        std::optional<std::string> location;
        std::optional<std::string> object_id;

        bool Empty() const
        {
            return !system_name && !system_description && !uptime_ticks &&
                   !contact && !location && !object_id;
        }
    };

    struct InterfaceEntry
    {
        std::uint32_t if_index = 0;
        std::string if_descr;
        std::uint64_t if_speed = 0;
        std::uint64_t in_octets = 0;
        std::uint64_t out_octets = 0;
        int counter_width = 32;
    };

    class ManagementClient
    {
    public:
        virtual ~ManagementClient() = default;

        // nullopt when the agent did not answer.
        virtual std::optional<SystemInfo> Identify(const std::string &ip) = 0;
        // Empty when the agent did not answer or has no interfaces.
        virtual std::vector<InterfaceEntry> InterfaceTable(const std::string &ip) = 0;
    };
}
