#include "BandwidthEngine.hpp"

#include <chrono>
#include <limits>

namespace lanwatch::monitor
{
    namespace
    {
        std::optional<std::uint64_t> WidthMax(int width)
        {
            if (width == 32)
                return std::numeric_limits<std::uint32_t>::max();
            if (width == 64)
                return std::numeric_limits<std::uint64_t>::max();
            return std::nullopt;
        }
    }

    std::optional<std::uint64_t> CounterDelta(std::uint64_t previous, std::uint64_t current, int width)
    {
        auto max = WidthMax(width);
        if (!max || previous > *max || current > *max)
            return std::nullopt;

        if (current >= previous)
            return current - previous;

        // Wrapped once.
        return (*max - previous) + current + 1;
    }

    std::optional<BandwidthPoint> ComputeBandwidth(const CounterSample &previous, const CounterSample &current)
    {
        if (previous.counter_width != current.counter_width)
            return std::nullopt;

        std::chrono::duration<double> interval = current.ts - previous.ts;
        if (interval.count() <= 0.0)
            return std::nullopt;

        auto in_delta = CounterDelta(previous.in_octets, current.in_octets, current.counter_width);
        auto out_delta = CounterDelta(previous.out_octets, current.out_octets, current.counter_width);
        if (!in_delta || !out_delta)
            return std::nullopt;

        BandwidthPoint point;
        point.in_bps = static_cast<double>(*in_delta) * 8.0 / interval.count();
        point.out_bps = static_cast<double>(*out_delta) * 8.0 / interval.count();
        return point;
    }

    void BandwidthEngine::BeginTick(const std::string &device_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_ticks[device_id];
    }

    std::optional<common::Bandwidth> BandwidthEngine::Feed(const CounterSample &sample)
    {
        std::optional<CounterSample> previous;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::uint64_t tick = m_ticks[sample.device_id];

            Baseline &baseline = m_baselines[Key{sample.device_id, sample.if_index}];
            if (baseline.tick != 0 && baseline.tick + 1 == tick)
                previous = baseline.sample;
            baseline.sample = sample;
            baseline.tick = tick;
        }

        if (!previous)
            return std::nullopt;

        auto point = ComputeBandwidth(*previous, sample);
        if (!point)
            return std::nullopt;

        common::Bandwidth event;
        event.device_id = sample.device_id;
        event.if_index = sample.if_index;
        event.in_bps = point->in_bps;
        event.out_bps = point->out_bps;
        event.ts = sample.ts;
        return event;
    }

    size_t BandwidthEngine::BaselineCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_baselines.size();
    }
}
