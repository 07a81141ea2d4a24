// File: tests/unit/test_io_lexer.cpp
// Purpose: Verify tokenization of type tags, literals and error inputs.
// Key invariants: Tokens cover the input exactly; failures are M1000 at the token start.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/io/Lexer.hpp

#include <gtest/gtest.h>

#include "io/Lexer.hpp"

#include <string>
#include <vector>

using namespace movetext::io;

namespace
{
std::vector<TokenKind> kindsOf(const std::vector<Token> &tokens)
{
    std::vector<TokenKind> kinds;
    for (const auto &t : tokens)
        kinds.push_back(t.kind);
    return kinds;
}

Token single(std::string_view text)
{
    auto tokens = tokenize(text);
    EXPECT_TRUE(tokens) << text;
    if (!tokens || tokens.value().size() != 1)
    {
        ADD_FAILURE() << "expected exactly one token for " << text;
        return Token{};
    }
    return tokens.value().front();
}

void expectLexError(std::string_view text, const std::string &message, uint32_t column)
{
    auto tokens = tokenize(text);
    ASSERT_FALSE(tokens) << text;
    EXPECT_EQ(tokens.error().message, message) << text;
    EXPECT_EQ(tokens.error().code, "M1000") << text;
    EXPECT_EQ(tokens.error().loc.column, column) << text;
}
} // namespace

TEST(IoLexer, StructTagTokensAndColumns)
{
    auto tokens = tokenize("u8 vector<0x1::M::S>");
    ASSERT_TRUE(tokens);
    const auto &t = tokens.value();
    EXPECT_EQ(kindsOf(t),
              (std::vector<TokenKind>{TokenKind::U8Type,
                                      TokenKind::Whitespace,
                                      TokenKind::VectorType,
                                      TokenKind::Lt,
                                      TokenKind::Address,
                                      TokenKind::ColonColon,
                                      TokenKind::Name,
                                      TokenKind::ColonColon,
                                      TokenKind::Name,
                                      TokenKind::Gt}));
    EXPECT_EQ(t[2].loc.column, 4u);
    EXPECT_EQ(t[2].length, 6u);
    EXPECT_EQ(t[4].text, "0x1");
    EXPECT_EQ(t[4].loc.column, 11u);
    EXPECT_EQ(t[5].length, 2u);
    EXPECT_EQ(t[6].text, "M");
    EXPECT_EQ(t[9].loc.column, 20u);

    std::size_t covered = 0;
    for (const auto &tok : t)
        covered += tok.length;
    EXPECT_EQ(covered, std::string("u8 vector<0x1::M::S>").size());
}

TEST(IoLexer, KeywordsAndNames)
{
    EXPECT_EQ(single("u8").kind, TokenKind::U8Type);
    EXPECT_EQ(single("u64").kind, TokenKind::U64Type);
    EXPECT_EQ(single("u128").kind, TokenKind::U128Type);
    EXPECT_EQ(single("bool").kind, TokenKind::BoolType);
    EXPECT_EQ(single("address").kind, TokenKind::AddressType);
    EXPECT_EQ(single("vector").kind, TokenKind::VectorType);
    EXPECT_EQ(single("signer").kind, TokenKind::SignerType);
    EXPECT_EQ(single("true").kind, TokenKind::True);
    EXPECT_EQ(single("false").kind, TokenKind::False);

    Token name = single("vector2");
    EXPECT_EQ(name.kind, TokenKind::Name);
    EXPECT_EQ(name.text, "vector2");
    EXPECT_EQ(single("true3").kind, TokenKind::Name);
    EXPECT_EQ(single("Diem_Type").text, "Diem_Type");

    auto kw = Lexer::lookupKeyword("signer");
    ASSERT_TRUE(kw.has_value());
    EXPECT_EQ(*kw, TokenKind::SignerType);
    EXPECT_FALSE(Lexer::lookupKeyword("Signer"));
}

TEST(IoLexer, IntegerLiteralsKeepDigitsOnly)
{
    Token u8 = single("255u8");
    EXPECT_EQ(u8.kind, TokenKind::U8);
    EXPECT_EQ(u8.text, "255");
    EXPECT_EQ(u8.length, 5u);

    Token plain = single("0123");
    EXPECT_EQ(plain.kind, TokenKind::U64);
    EXPECT_EQ(plain.text, "0123");

    EXPECT_EQ(single("7u64").kind, TokenKind::U64);
    EXPECT_EQ(single("1u128").kind, TokenKind::U128);
}

TEST(IoLexer, AddressLiteralNormalizesPrefix)
{
    Token addr = single("0X54afa3526");
    EXPECT_EQ(addr.kind, TokenKind::Address);
    EXPECT_EQ(addr.text, "0x54afa3526");
    EXPECT_EQ(addr.length, 11u);

    auto split = tokenize("0x00g0");
    ASSERT_TRUE(split);
    EXPECT_EQ(kindsOf(split.value()), (std::vector<TokenKind>{TokenKind::Address, TokenKind::Name}));
}

TEST(IoLexer, ByteStrings)
{
    Token ascii = single("b\"hi\"");
    EXPECT_EQ(ascii.kind, TokenKind::Bytes);
    EXPECT_EQ(ascii.text, "6869");
    EXPECT_EQ(ascii.length, 5u);

    Token hex = single("x\"DEad\"");
    EXPECT_EQ(hex.text, "DEad");
    EXPECT_EQ(hex.length, 7u);

    EXPECT_EQ(single("x\"\"").text, "");
    EXPECT_EQ(single("b\"\"").text, "");
}

TEST(IoLexer, WhitespaceRunsCollapse)
{
    auto tokens = tokenize("u8 \t\r\n\fu64");
    ASSERT_TRUE(tokens);
    ASSERT_EQ(tokens.value().size(), 3u);
    EXPECT_EQ(tokens.value()[1].kind, TokenKind::Whitespace);
    EXPECT_EQ(tokens.value()[1].length, 5u);
    EXPECT_EQ(tokens.value()[2].loc.line, 2u);
    EXPECT_EQ(tokens.value()[2].loc.column, 2u);
}

TEST(IoLexer, EmptyInputHasNoTokens)
{
    auto tokens = tokenize("");
    ASSERT_TRUE(tokens);
    EXPECT_TRUE(tokens.value().empty());

    Lexer lexer("");
    auto eof = lexer.next();
    ASSERT_TRUE(eof);
    EXPECT_EQ(eof.value().kind, TokenKind::Eof);
    EXPECT_EQ(eof.value().length, 0u);
}

TEST(IoLexer, RejectsUnrecognizedInput)
{
    expectLexError("-3", "unrecognized token", 1);
    expectLexError("u8 :", "unrecognized token", 4);
    expectLexError("0x", "unrecognized token", 1);
    expectLexError("0x_", "unrecognized token", 1);
    expectLexError("_a", "unrecognized token", 1);
    expectLexError("\v", "unrecognized token", 1);
    expectLexError("\xc3\xa9", "unrecognized token", 1);
    expectLexError("x\"ffff", "unrecognized token", 1);
    expectLexError("x\"a \"", "unrecognized token", 1);
    expectLexError("x\"0g\"", "unrecognized token", 1);
    expectLexError("b\"caf\xc3\xa9\"", "unrecognized token", 1);
}

TEST(IoLexer, RejectsBadSuffixes)
{
    expectLexError("0u42", "invalid suffix", 1);
    expectLexError("0u645", "invalid suffix", 1);
    expectLexError("0u64x", "invalid suffix", 1);
    expectLexError("0u6 4", "invalid suffix", 1);
    expectLexError("0u", "invalid suffix", 1);
    expectLexError("u8, 3false", "invalid suffix", 5);
}
