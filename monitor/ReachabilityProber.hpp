#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace lanwatch::monitor
{
    class ReachabilityProber
    {
    public:
        virtual ~ReachabilityProber() = default;

        // Round-trip time in milliseconds, or nullopt when no reply arrived before the deadline.
        virtual std::optional<double> Probe(const std::string &ip, std::chrono::milliseconds timeout) = 0;
    };
}
