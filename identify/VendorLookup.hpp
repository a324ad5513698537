#pragma once

#include <optional>
#include <string>

namespace lanwatch::identify
{
    class VendorLookup
    {
    public:
        virtual ~VendorLookup() = default;

        // prefix: six upper-case hex digits, e.g. "AABBCC".
        virtual std::optional<std::string> Lookup(const std::string &prefix) const = 0;
    };
}
