#pragma once

#include <istream>
#include <string>
#include <unordered_map>

#include "VendorLookup.hpp"

namespace lanwatch::identify
{
    // Read-only OUI prefix -> vendor table loaded from a "prefix,vendor" CSV cache.
    class OuiTable : public VendorLookup
    {
    public:
        // Returns false when the file cannot be opened; the table stays empty.
        bool LoadFile(const std::string &path);
        // Returns the number of entries read.
        size_t Load(std::istream &in);

        void Add(const std::string &prefix, const std::string &vendor);

        std::optional<std::string> Lookup(const std::string &prefix) const override;

        size_t Size() const { return m_entries.size(); }

    private:
        std::unordered_map<std::string, std::string> m_entries;
    };
}
