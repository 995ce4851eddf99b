#include "gtest/gtest.h"
#include "judge/comparator.hpp"

using namespace std;
using namespace labjudge;

TEST(ComparatorTest, NormalizeTest) {
    EXPECT_EQ(normalize_output("1 2\r\n3 4\r\n"), "1 2\n3 4");
    EXPECT_EQ(normalize_output("a   \nb\t\n\n\n"), "a\nb");
    EXPECT_EQ(normalize_output("  leading\n"), "  leading");
    EXPECT_EQ(normalize_output(""), "");
    EXPECT_EQ(normalize_output("\n\n"), "");
}

TEST(ComparatorTest, TrailingWhitespaceTest) {
    EXPECT_TRUE(outputs_match("Hello\n", "Hello"));
    EXPECT_TRUE(outputs_match("Hello  \r\n\r\n", "Hello"));
    EXPECT_TRUE(outputs_match("1\n2\n", "1  \n2"));
}

TEST(ComparatorTest, InnerWhitespaceTest) {
    EXPECT_FALSE(outputs_match("1  2", "1 2"));
    EXPECT_FALSE(outputs_match(" 1", "1"));
    EXPECT_FALSE(outputs_match("1\n\n2", "1\n2"));
    EXPECT_FALSE(outputs_match("hello", "Hello"));
}

TEST(ComparatorTest, EmptyOutputTest) {
    EXPECT_TRUE(outputs_match("", "\n"));
    EXPECT_FALSE(outputs_match("", "0"));
}
