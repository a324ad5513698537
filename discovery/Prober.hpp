#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "../common/AddressRange.hpp"

namespace lanwatch::discovery
{
    // Declaration order is merge priority.
    enum class ProbeMethod
    {
        Arp,
        Mdns,
        Echo
    };

    // "arp", "mdns", "echo"
    const char *MethodName(ProbeMethod method);
    // Tag a sighting leaves on the device: "arp", "mdns", "icmp".
    const char *MethodTag(ProbeMethod method);

    struct ProbeResult
    {
        std::string ip;
        std::optional<std::string> mac;
        std::optional<std::string> name;
        ProbeMethod source = ProbeMethod::Echo;
    };

    struct ProbeRequest
    {
        common::AddressRange range;
        std::string interface; // empty: default interface
        std::chrono::milliseconds timeout{3000};
        size_t max_hosts = common::AddressRange::DEFAULT_MAX_HOSTS;
    };

    // One discovery technique. Probe returns within roughly the request timeout and throws
    // (e.g. std::runtime_error) when the technique cannot run at all.
    class Prober
    {
    public:
        virtual ~Prober() = default;

        virtual ProbeMethod Method() const = 0;
        virtual std::vector<ProbeResult> Probe(const ProbeRequest &request) = 0;
    };
}
