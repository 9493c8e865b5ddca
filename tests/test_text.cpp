#include <gtest/gtest.h>
#include <pyresolve/text.hpp>
#include <cstdlib>

using namespace pyresolve;

TEST(Trim, Whitespace) {
    EXPECT_EQ(trim("  /usr/bin/python3\r\n"), "/usr/bin/python3");
    EXPECT_EQ(trim("\n\t "), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(Wrap, GreedyLines) {
    EXPECT_EQ(wrap_text("aaa bbb ccc", 7), "aaa bbb\nccc");
    EXPECT_EQ(wrap_text("aaa  bbb\nccc", 80), "aaa bbb ccc");
}

TEST(Wrap, LongWordsStayWhole) {
    EXPECT_EQ(wrap_text("see /a/very/long/path/to/python here", 10), "see\n/a/very/long/path/to/python\nhere");
}

TEST(Wrap, ZeroWidthIsIdentity) {
    EXPECT_EQ(wrap_text("a  b", 0), "a  b");
}

TEST(TerminalWidth, FromColumns) {
    setenv("COLUMNS", "120", 1);
    EXPECT_EQ(terminal_width(), 120u);
    setenv("COLUMNS", "junk", 1);
    EXPECT_EQ(terminal_width(), 80u);
    unsetenv("COLUMNS");
    EXPECT_EQ(terminal_width(), 80u);
}
