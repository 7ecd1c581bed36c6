//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "pbr/utils/string_utils.hpp"

#include <vector>

using namespace pbr;
using namespace pbr::string_utils;
using namespace std::chrono_literals;

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  hello  "), "hello");
    EXPECT_EQ(trim("\t\nhello\r\n"), "hello");
    EXPECT_EQ(trim("hello"), "hello");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(StringUtilsTest, ToUpper) {
    EXPECT_EQ(to_upper("warning"), "WARNING");
    EXPECT_EQ(to_upper("Info"), "INFO");
    EXPECT_EQ(to_upper("p0"), "P0");
}

TEST(StringUtilsTest, Join) {
    const std::vector<std::string> parts = {"duration", "allocations", "bytes"};
    EXPECT_EQ(join(parts, ", "), "duration, allocations, bytes");
    EXPECT_EQ(join(std::vector<std::string>{}, ", "), "");
    EXPECT_EQ(join(std::vector<std::string>{"single"}, ", "), "single");
}

TEST(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(format_duration(100ns), "100ns");
    EXPECT_EQ(format_duration(Duration::zero()), "0ns");
    EXPECT_EQ(format_duration(10us), "10.00us");
    EXPECT_EQ(format_duration(1500ns), "1.50us");
    EXPECT_EQ(format_duration(100ms), "100.00ms");
    EXPECT_EQ(format_duration(1500ms), "1.50s");
}

TEST(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1024), "1.00 KB");
    EXPECT_EQ(format_bytes(50 * 1024), "50.00 KB");
    EXPECT_EQ(format_bytes(2 * 1024 * 1024), "2.00 MB");
    EXPECT_EQ(format_bytes(3LL * 1024 * 1024 * 1024), "3.00 GB");
}
