#pragma once

#include <map>
#include <string>

#include "../common/Device.hpp"

namespace lanwatch::storage
{
    using MetricTags = std::map<std::string, std::string>;
    using MetricFields = std::map<std::string, double>;

    class MetricsSink
    {
    public:
        virtual ~MetricsSink() = default;

        virtual bool Write(const std::string &measurement,
                           const MetricTags &tags,
                           const MetricFields &fields,
                           common::Timestamp ts) = 0;
    };
}
