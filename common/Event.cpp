#include "Event.hpp"

#include <iomanip>
#include <sstream>

namespace lanwatch::common
{
    namespace
    {
        struct TypeNameVisitor
        {
            const char *operator()(const DeviceDiscovered &) const { return "device_discovered"; }
            const char *operator()(const DeviceUp &) const { return "device_up"; }
            const char *operator()(const DeviceDown &) const { return "device_down"; }
            const char *operator()(const Latency &) const { return "latency"; }
            const char *operator()(const Bandwidth &) const { return "bandwidth"; }
        };

        struct DeviceIdVisitor
        {
            const std::string &operator()(const DeviceDiscovered &e) const { return e.device.id; }
            const std::string &operator()(const DeviceUp &e) const { return e.device_id; }
            const std::string &operator()(const DeviceDown &e) const { return e.device_id; }
            const std::string &operator()(const Latency &e) const { return e.device_id; }
            const std::string &operator()(const Bandwidth &e) const { return e.device_id; }
        };
    }

    const char *EventTypeName(const Event &event)
    {
        return std::visit(TypeNameVisitor{}, event);
    }

    const std::string &EventDeviceId(const Event &event)
    {
        return std::visit(DeviceIdVisitor{}, event);
    }

    std::string DescribeEvent(const Event &event)
    {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2) << EventTypeName(event) << " " << EventDeviceId(event);

        if (const auto *e = std::get_if<DeviceDiscovered>(&event))
        {
            out << " ip=" << e->device.ip;
            if (e->device.mac)
                out << " mac=" << *e->device.mac;
            if (e->device.hostname)
                out << " host=" << *e->device.hostname;
            if (e->device.vendor)
                out << " vendor=\"" << *e->device.vendor << "\"";
            if (!e->device.tags.empty())
                out << " tags=" << JoinTags(e->device.tags);
        }
        else if (const auto *e = std::get_if<Latency>(&event))
        {
            out << " avg=" << e->ms << "ms min=" << e->min_ms << "ms max=" << e->max_ms << "ms loss=" << e->loss;
        }
        else if (const auto *e = std::get_if<Bandwidth>(&event))
        {
            out << " if=" << e->if_index << " in=" << e->in_bps << "bps out=" << e->out_bps << "bps";
        }
        return out.str();
    }
}
