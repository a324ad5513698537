#include "Device.hpp"

#include <cctype>
#include <sstream>

namespace lanwatch::common
{
    const char *StatusToString(DeviceStatus status)
    {
        switch (status)
        {
        case DeviceStatus::Up:
            return "up";
        case DeviceStatus::Down:
            return "down";
        case DeviceStatus::Unknown:
        default:
            return "unknown";
        }
    }

    DeviceStatus StatusFromString(const std::string &text)
    {
        if (text == "up")
            return DeviceStatus::Up;
        if (text == "down")
            return DeviceStatus::Down;
        return DeviceStatus::Unknown;
    }

    std::optional<std::string> NormalizeMac(const std::string &mac)
    {
        std::string hex;
        for (char c : mac)
        {
            if (std::isxdigit(static_cast<unsigned char>(c)))
                hex += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            else if (c != ':' && c != '-' && c != '.')
                return std::nullopt;
        }

        if (hex.size() != 12)
            return std::nullopt;

        std::string out;
        for (size_t i = 0; i < hex.size(); i += 2)
        {
            if (!out.empty())
                out += ':';
            out += hex.substr(i, 2);
        }
        return out;
    }

    std::string MacPrefix(const std::string &mac)
    {
        std::string prefix;
        for (char c : mac)
        {
            if (std::isxdigit(static_cast<unsigned char>(c)))
                prefix += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            if (prefix.size() == 6)
                break;
        }
        return prefix;
    }

    std::int64_t ToUnixMillis(Timestamp ts)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    }

    Timestamp FromUnixMillis(std::int64_t millis)
    {
        return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
    }

    std::string JoinTags(const std::set<std::string> &tags)
    {
        std::string out;
        for (const auto &tag : tags)
        {
            if (!out.empty())
                out += ',';
            out += tag;
        }
        return out;
    }

    std::set<std::string> SplitTags(const std::string &text)
    {
        std::set<std::string> tags;
        std::stringstream ss(text);
        std::string tag;
        while (std::getline(ss, tag, ','))
        {
            if (!tag.empty())
                tags.insert(tag);
        }
        return tags;
    }
}
