#pragma once

#include <optional>
#include <vector>

#include "../common/Device.hpp"

namespace lanwatch::monitor
{
    // One echo probe outcome. rtt_ms is empty when the probe was lost.
    struct HealthSample
    {
        std::optional<double> rtt_ms;
        common::Timestamp ts;
    };

    struct BurstAggregate
    {
        int sent = 0;
        int received = 0;
        std::optional<double> avg_ms;
        std::optional<double> min_ms;
        std::optional<double> max_ms;
        double loss = 0.0; // (sent - received) / sent
    };

    // Throws std::invalid_argument for an empty burst.
    BurstAggregate AggregateBurst(const std::vector<HealthSample> &samples);
}
