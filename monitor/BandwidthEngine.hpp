#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "../common/Event.hpp"

namespace lanwatch::monitor
{
    // Raw octet counters of one interface at one instant.
    struct CounterSample
    {
        std::string device_id;
        std::uint32_t if_index = 0;
        std::uint64_t in_octets = 0;
        std::uint64_t out_octets = 0;
        int counter_width = 32; // 32 or 64, as declared by the interface table
        common::Timestamp ts;
    };

    struct BandwidthPoint
    {
        double in_bps = 0.0;
        double out_bps = 0.0;
    };

    // Octets counted between two readings of a counter of the given width.
    // nullopt when the width is not 32/64 or a value does not fit in it.
    std::optional<std::uint64_t> CounterDelta(std::uint64_t previous, std::uint64_t current, int width);

    // nullopt for mismatched widths, out-of-range values or a non-positive interval.
    std::optional<BandwidthPoint> ComputeBandwidth(const CounterSample &previous, const CounterSample &current);

    // Keeps the last sample per (device, interface) and turns each new one into a bandwidth event.
    // A point needs a baseline taken in the device's previous tick.
    class BandwidthEngine
    {
    public:
        // Starts the next monitoring tick of a device, whether or not its counters get polled.
        void BeginTick(const std::string &device_id);

        // Baselines the sample under the device's current tick.
        std::optional<common::Bandwidth> Feed(const CounterSample &sample);

        size_t BaselineCount() const;

    private:
        using Key = std::pair<std::string, std::uint32_t>;

        struct Baseline
        {
            CounterSample sample;
            std::uint64_t tick = 0;
        };

        mutable std::mutex m_mutex;
        std::map<std::string, std::uint64_t> m_ticks;
        std::map<Key, Baseline> m_baselines;
    };
}
