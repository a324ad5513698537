#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "Device.hpp"

namespace lanwatch::common
{
    struct DeviceDiscovered
    {
        Device device;
    };

    struct DeviceUp
    {
        std::string device_id;
        Timestamp ts;
    };

    struct DeviceDown
    {
        std::string device_id;
        Timestamp ts;
    };

    struct Latency
    {
        std::string device_id;
        double ms = 0.0;
        double min_ms = 0.0;
        double max_ms = 0.0;
        double loss = 0.0;
        Timestamp ts;
    };

    struct Bandwidth
    {
        std::string device_id;
        std::uint32_t if_index = 0;
        double in_bps = 0.0;
        double out_bps = 0.0;
        Timestamp ts;
    };

    using Event = std::variant<DeviceDiscovered, DeviceUp, DeviceDown, Latency, Bandwidth>;

    const char *EventTypeName(const Event &event);

    // Device the event is about; for discovery events this is the device's id.
    const std::string &EventDeviceId(const Event &event);

    // One-line human readable rendering, e.g. "latency 192.168.1.5 avg=1.20ms loss=0.00".
    std::string DescribeEvent(const Event &event);
}
