#include "IdentificationResolver.hpp"

#include <future>
#include <iostream>

namespace lanwatch::identify
{
    IdentificationResolver::IdentificationResolver(const VendorLookup *vendor, ManagementClient *management, ReverseLookup *reverse)
        : m_vendor(vendor), m_management(management), m_reverse(reverse)
    {
    }

    IdentificationRecord IdentificationResolver::Identify(const std::string &ip,
                                                          const std::optional<std::string> &mac,
                                                          const IdentificationFlags &flags)
    {
        IdentificationRecord record;

        std::future<std::optional<std::string>> vendor_task;
        std::future<std::optional<SystemInfo>> mgmt_task;
        std::future<std::optional<std::string>> reverse_task;

        if (flags.use_vendor && m_vendor && mac)
        {
            std::string prefix = common::MacPrefix(*mac);
            vendor_task = std::async(std::launch::async, [this, prefix]()
                                     { return m_vendor->Lookup(prefix); });
        }
        if (flags.use_mgmt_protocol && m_management)
        {
            mgmt_task = std::async(std::launch::async, [this, ip]()
                                   { return m_management->Identify(ip); });
        }
        if (flags.use_reverse_dns && m_reverse)
        {
            reverse_task = std::async(std::launch::async, [this, ip]()
                                      { return m_reverse->Reverse(ip); });
        }

        if (vendor_task.valid())
        {
            try
            {
                record.vendor = vendor_task.get();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Identify] Vendor lookup for " << ip << " failed: " << e.what() << "\n";
            }
        }

        if (mgmt_task.valid())
        {
            try
            {
                auto info = mgmt_task.get();
                if (info)
                {
                    record.system_name = info->system_name;
                    record.system_description = info->system_description;
                    record.uptime_ticks = info->uptime_ticks;
                    record.contact = info->contact;
                    record.location = info->location;
                    record.object_id = info->object_id;
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Identify] Management query for " << ip << " failed: " << e.what() << "\n";
            }
        }

        if (reverse_task.valid())
        {
            try
            {
                record.reverse_name = reverse_task.get();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Identify] Reverse lookup for " << ip << " failed: " << e.what() << "\n";
            }
        }

        return record;
    }

    void ApplyIdentification(common::Device &device, const IdentificationRecord &record)
    {
        if (record.vendor)
            device.vendor = record.vendor;

        if (record.system_name)
            device.hostname = record.system_name;
        else if (record.reverse_name && !device.hostname)
            device.hostname = record.reverse_name;

        if (record.HasManagementData())
            device.tags.insert("snmp");
    }
}
