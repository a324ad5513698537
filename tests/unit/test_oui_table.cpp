/**
 * @file test_oui_table.cpp
 * @brief Unit tests for the OUI vendor table
 */

#include <gtest/gtest.h>

#include "identify/OuiTable.hpp"

#include <sstream>

using namespace lanwatch::identify;

class OuiTableTest : public ::testing::Test {
protected:
    OuiTable table;
};

// =============================================================================
// Loading
// =============================================================================

TEST_F(OuiTableTest, LoadsCsvAndSkipsHeaderAndJunk) {
    std::istringstream csv(
        "prefix,vendor\n"
        "001A2B,Acme Networks\n"
        "00:1b:2c,\"Widgets, Inc.\"\n"
        "not a line\n"
        "ABC,Short Prefix\n"
        "AABBCC,\n");

    EXPECT_EQ(table.Load(csv), 2u);
    EXPECT_EQ(table.Size(), 2u);
    EXPECT_EQ(table.Lookup("001A2B"), std::optional<std::string>("Acme Networks"));
    EXPECT_EQ(table.Lookup("001B2C"), std::optional<std::string>("Widgets, Inc."));
}

TEST_F(OuiTableTest, MissingFileLeavesTableEmpty) {
    EXPECT_FALSE(table.LoadFile("/nonexistent/oui_cache.csv"));
    EXPECT_EQ(table.Size(), 0u);
}

// =============================================================================
// Lookup
// =============================================================================

TEST_F(OuiTableTest, LookupAcceptsAnyPrefixSpelling) {
    table.Add("f4:f5:d8", "Google");

    EXPECT_EQ(table.Lookup("F4F5D8"), std::optional<std::string>("Google"));
    EXPECT_EQ(table.Lookup("f4-f5-d8"), std::optional<std::string>("Google"));
    EXPECT_EQ(table.Lookup("f4:f5:d8:12:34:56"), std::optional<std::string>("Google"));
}

TEST_F(OuiTableTest, UnknownPrefixIsAbsent) {
    table.Add("001A2B", "Acme");

    EXPECT_FALSE(table.Lookup("FFFFFF").has_value());
    EXPECT_FALSE(table.Lookup("").has_value());
    EXPECT_FALSE(table.Lookup("00").has_value());
}
