#pragma once

#include <map>
#include <mutex>
#include <string>

#include "../common/Device.hpp"

namespace lanwatch::monitor
{
    enum class Transition
    {
        None,
        WentUp,   // down -> up
        WentDown  // up/unknown -> down
    };

    // Per-device up/down/unknown tracking. Every device starts Unknown.
    class DeviceStateMachine
    {
    public:
        Transition Apply(const std::string &device_id, bool burst_succeeded);

        common::DeviceStatus State(const std::string &device_id) const;

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, common::DeviceStatus> m_states;
    };
}
