#include "PingBurst.hpp"

#include <algorithm>
#include <stdexcept>

namespace lanwatch::monitor
{
    BurstAggregate AggregateBurst(const std::vector<HealthSample> &samples)
    {
        if (samples.empty())
            throw std::invalid_argument("probe burst with zero probes sent");

        BurstAggregate result;
        result.sent = static_cast<int>(samples.size());

        double total = 0.0;
        for (const auto &sample : samples)
        {
            if (!sample.rtt_ms)
                continue;

            double rtt = *sample.rtt_ms;
            total += rtt;
            result.received++;
            result.min_ms = result.min_ms ? std::min(*result.min_ms, rtt) : rtt;
            result.max_ms = result.max_ms ? std::max(*result.max_ms, rtt) : rtt;
        }

        if (result.received > 0)
            result.avg_ms = total / result.received;

        result.loss = static_cast<double>(result.sent - result.received) / result.sent;
        return result;
    }
}
