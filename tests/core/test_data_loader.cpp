/// @file tests/core/test_data_loader.cpp
/// @brief Tests for the (x, value) CSV DataLoader.

#include <gtest/gtest.h>
#include "bri/data_loader.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace bri;
using namespace bri::core;

TEST(DataLoader, ParsesRowsAfterHeader) {
    const std::string csv =
        "x,value\n"
        "0,0\n"
        "10,100\n"
        "2.5,-3.75\n";
    const auto rows = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], (Observation{0.0, 0.0}));
    EXPECT_EQ(rows[1], (Observation{10.0, 100.0}));
    EXPECT_EQ(rows[2], (Observation{2.5, -3.75}));
}

TEST(DataLoader, SkipsCommentsBlankAndMalformedRows) {
    const std::string csv =
        "# exported points\n"
        "x,value\n"
        "\n"
        "1,2\n"
        "abc,3\n"
        "4,\n"
        "5,6,7\n"
        "8 , 9 \r\n"
        "# trailing comment\n";
    const auto rows = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (Observation{1.0, 2.0}));
    EXPECT_EQ(rows[1], (Observation{8.0, 9.0}));
}

TEST(DataLoader, RejectsNonFinite) {
    const std::string csv =
        "x,value\n"
        "inf,1\n"
        "1,nan\n"
        "2,1e400\n"
        "3,4\n";
    const auto rows = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].key, 3.0);
}

TEST(DataLoader, HeaderOnlyOrEmpty) {
    EXPECT_TRUE(DataLoader::parse_csv_string("").empty());
    EXPECT_TRUE(DataLoader::parse_csv_string("x,value\n").empty());
}

TEST(DataLoader, ParseDouble) {
    EXPECT_DOUBLE_EQ(*DataLoader::parse_double(" 1.5 "), 1.5);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_double("+2"), 2.0);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_double("-1e3"), -1000.0);
    EXPECT_FALSE(DataLoader::parse_double("").has_value());
    EXPECT_FALSE(DataLoader::parse_double("1.5x").has_value());
    EXPECT_FALSE(DataLoader::parse_double("inf").has_value());
}

TEST(DataLoader, MissingFileIsNullopt) {
    EXPECT_FALSE(DataLoader::load_csv("/nonexistent/dir/points.csv").has_value());
}

TEST(DataLoader, LoadsFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "bri_data_loader_test.csv";
    {
        std::ofstream out(path);
        out << "x,value\n1,10\n2,20\n";
    }
    const auto rows = DataLoader::load_csv(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 2u);
    EXPECT_EQ((*rows)[1], (Observation{2.0, 20.0}));
}
