#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "../common/Device.hpp"
#include "ManagementClient.hpp"
#include "ReverseResolver.hpp"
#include "VendorLookup.hpp"

namespace lanwatch::identify
{
    struct IdentificationFlags
    {
        bool use_vendor = true;
        bool use_mgmt_protocol = true;
        bool use_reverse_dns = true;
    };

    struct IdentificationRecord
    {
        std::optional<std::string> vendor;
        std::optional<std::string> system_name;
        std::optional<std::string> system_description;
        std::optional<std::uint64_t> uptime_ticks;
        std::optional<std::string> contact;
        std::optional<std::string> location;
        std::optional<std::string> object_id;
        std::optional<std::string> reverse_name;

        bool HasManagementData() const
        {
            return system_name || system_description || uptime_ticks || contact || location || object_id;
        }

        bool Empty() const { return !vendor && !reverse_name && !HasManagementData(); }

        // sysName first, reverse DNS as the fallback.
        std::optional<std::string> Hostname() const { return system_name ? system_name : reverse_name; }
    };

    // Runs the enabled lookups concurrently. Each source is bounded by its own timeout;
    // a failing source contributes nothing.
    class IdentificationResolver
    {
    public:
        // Any source may be null, which disables it.
        IdentificationResolver(const VendorLookup *vendor, ManagementClient *management, ReverseLookup *reverse);

        IdentificationRecord Identify(const std::string &ip,
                                      const std::optional<std::string> &mac,
                                      const IdentificationFlags &flags);

    private:
        const VendorLookup *m_vendor;
        ManagementClient *m_management;
        ReverseLookup *m_reverse;
    };

    // Vendor from the record, sysName over the current hostname, reverse name only into an empty one.
    // Any management field tags the device "snmp".
    void ApplyIdentification(common::Device &device, const IdentificationRecord &record);
}
