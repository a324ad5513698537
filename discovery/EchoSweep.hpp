#pragma once

#include <cstdint>

#include "Prober.hpp"

namespace lanwatch::discovery
{
    // ICMP echo sweep over libtins. Reports addresses only.
    class EchoSweep : public Prober
    {
    public:
        ProbeMethod Method() const override { return ProbeMethod::Echo; }
        std::vector<ProbeResult> Probe(const ProbeRequest &request) override;
    };
}
