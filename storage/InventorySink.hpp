#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../common/Device.hpp"

namespace lanwatch::storage
{
    class InventorySink
    {
    public:
        virtual ~InventorySink() = default;

        virtual std::optional<common::Device> Get(const std::string &device_id) = 0;
        virtual std::vector<common::Device> List() = 0;
        // Inserts, or merges into the stored record: the stored status is kept and tags are united.
        virtual bool Upsert(const common::Device &device) = 0;
        // Writes only the monitoring fields of a stored device. An absent last_seen leaves it as is.
        // False when the device is unknown.
        virtual bool UpdateStatus(const std::string &device_id,
                                  common::DeviceStatus status,
                                  std::optional<common::Timestamp> last_seen) = 0;
    };
}
