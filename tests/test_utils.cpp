#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <regex>

TEST(Utils, SplitLinesDropsCarriageReturns) {
    auto lines = split_lines("a\r\nb\nc");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "c");
    EXPECT_TRUE(split_lines("").empty());
}

TEST(Utils, TrimmedStripsBothEnds) {
    EXPECT_EQ(trimmed("  load: 0.5\r\n"), "load: 0.5");
    EXPECT_EQ(trimmed(" \t\n"), "");
}

TEST(Utils, NowIsoFormat) {
    std::regex pattern(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2})");
    EXPECT_TRUE(std::regex_match(now_iso(), pattern));
}
