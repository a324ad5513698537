#include "OuiTable.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace lanwatch::identify
{
    namespace
    {
        std::string CleanPrefix(const std::string &raw)
        {
            std::string out;
            for (char c : raw)
            {
                if (std::isxdigit(static_cast<unsigned char>(c)))
                    out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            return out.size() >= 6 ? out.substr(0, 6) : std::string();
        }

        std::string Trim(const std::string &s)
        {
            size_t begin = s.find_first_not_of(" \t\r\"");
            if (begin == std::string::npos)
                return "";
            size_t end = s.find_last_not_of(" \t\r\"");
            return s.substr(begin, end - begin + 1);
        }
    }

    bool OuiTable::LoadFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            std::cerr << "[OUI] Cache file not found at " << path << "\n";
            return false;
        }

        size_t count = Load(file);
        std::cout << "[OUI] Loaded " << count << " entries from " << path << "\n";
        return true;
    }

    size_t OuiTable::Load(std::istream &in)
    {
        size_t count = 0;
        std::string line;

        while (std::getline(in, line))
        {
            size_t comma = line.find(',');
            if (comma == std::string::npos)
                continue;

            std::string prefix = CleanPrefix(line.substr(0, comma));
            std::string vendor = Trim(line.substr(comma + 1));

            // Also skips the "prefix,vendor" header.
            if (prefix.size() != 6 || vendor.empty())
                continue;

            m_entries[prefix] = vendor;
            ++count;
        }
        return count;
    }

    void OuiTable::Add(const std::string &prefix, const std::string &vendor)
    {
        std::string clean = CleanPrefix(prefix);
        if (!clean.empty())
            m_entries[clean] = vendor;
    }

    std::optional<std::string> OuiTable::Lookup(const std::string &prefix) const
    {
        auto it = m_entries.find(CleanPrefix(prefix));
        if (it == m_entries.end())
            return std::nullopt;
        return it->second;
    }
}
