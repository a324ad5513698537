#include "DeviceStateMachine.hpp"

namespace lanwatch::monitor
{
    using common::DeviceStatus;

    Transition DeviceStateMachine::Apply(const std::string &device_id, bool burst_succeeded)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        DeviceStatus previous = DeviceStatus::Unknown;
        auto it = m_states.find(device_id);
        if (it != m_states.end())
            previous = it->second;

        DeviceStatus next = burst_succeeded ? DeviceStatus::Up : DeviceStatus::Down;
        m_states[device_id] = next;

        if (next == DeviceStatus::Up && previous == DeviceStatus::Down)
            return Transition::WentUp;
        if (next == DeviceStatus::Down && previous != DeviceStatus::Down)
            return Transition::WentDown;
        return Transition::None;
    }

    DeviceStatus DeviceStateMachine::State(const std::string &device_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_states.find(device_id);
        return it == m_states.end() ? DeviceStatus::Unknown : it->second;
    }
}
