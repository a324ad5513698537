#pragma once

#include <set>
#include <string>
#include <vector>

#include "../common/DnsMessage.hpp"
#include "Prober.hpp"

namespace lanwatch::discovery
{
    // DNS-SD browse over multicast DNS (224.0.0.251:5353), one-shot queries answered by unicast.
    class MdnsBrowser : public Prober
    {
    public:
        static constexpr size_t MAX_SERVICE_TYPES = 10;

        ProbeMethod Method() const override { return ProbeMethod::Mdns; }
        std::vector<ProbeResult> Probe(const ProbeRequest &request) override;

        static std::vector<std::string> FallbackServiceTypes();
    };

    // Collects hosts from one mDNS response: SRV targets resolved through A records in the same
    // message, falling back to the responder's address. Names lose their ".local" suffix.
    void CollectHosts(const common::dns::Message &msg, const std::string &responder_ip, std::vector<ProbeResult> &out);

    // PTR targets of a _services._dns-sd._udp.local answer.
    std::set<std::string> CollectServiceTypes(const common::dns::Message &msg);
}
