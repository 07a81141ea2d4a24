// File: tests/unit/test_parse_cursor.cpp
// Purpose: Exercise the character cursor used by the tokenizer.
// Key invariants: Line/column tracking stays consistent with seek and advance.
// Ownership/Lifetime: Cursor views string literals owned by the test.
// Links: include/movetext/parse/Cursor.h

#include <gtest/gtest.h>

#include "movetext/parse/Cursor.h"

using movetext::parse::Cursor;

TEST(ParseCursor, PeekAndLookahead)
{
    Cursor cur("0x1");
    EXPECT_EQ(cur.peek(), '0');
    EXPECT_EQ(cur.peekAt(1), 'x');
    EXPECT_EQ(cur.peekAt(2), '1');
    EXPECT_EQ(cur.peekAt(3), '\0');
    EXPECT_FALSE(cur.atEnd());
}

TEST(ParseCursor, ConsumeWhileAndConsumeIf)
{
    Cursor cur("abc123 rest");
    auto letters = cur.consumeWhile([](char c) { return c >= 'a' && c <= 'z'; });
    EXPECT_EQ(letters, "abc");
    auto digits = cur.consumeWhile([](char c) { return c >= '0' && c <= '9'; });
    EXPECT_EQ(digits, "123");
    EXPECT_EQ(cur.offset(), 6u);
    EXPECT_TRUE(cur.consumeIf(' '));
    EXPECT_FALSE(cur.consumeIf('x'));
    EXPECT_EQ(cur.peek(), 'r');
    EXPECT_EQ(cur.pos().column, 7u);
}

TEST(ParseCursor, TracksLinesAndSeeksBackwards)
{
    Cursor cur("ab\ncd");
    cur.seek(4);
    EXPECT_EQ(cur.pos().line, 2u);
    EXPECT_EQ(cur.pos().column, 1u);

    cur.seek(1);
    EXPECT_EQ(cur.pos().line, 1u);
    EXPECT_EQ(cur.pos().column, 1u);
    EXPECT_EQ(cur.peek(), 'b');

    cur.seek(100);
    EXPECT_TRUE(cur.atEnd());
    EXPECT_EQ(cur.peek(), '\0');
}
