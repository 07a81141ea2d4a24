//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the type and literal tokenizer.
///
/// ## Token Dispatch
///
/// The first character selects the token class:
///
/// | Leading text      | Token                                     |
/// |-------------------|-------------------------------------------|
/// | `<` `>` `,`       | punctuation                               |
/// | `::`              | ColonColon; a lone `:` is an error        |
/// | `0x` / `0X`       | address literal, at least one hex digit   |
/// | digit             | integer literal with optional suffix      |
/// | `b"`              | ASCII byte string, stored hex encoded     |
/// | `x"`              | hex byte string, stored as written        |
/// | whitespace        | one Whitespace token per run              |
/// | letter            | keyword or name                           |
///
/// ## Keyword Lookup
///
/// Keywords are stored in a sorted array (kKeywordTable) and resolved by
/// binary search after a name has been scanned, so `vector2` stays a name.
///
/// ## Integer Literals
///
/// Digits are collected first.  A letter or digit run directly after them is
/// a width suffix and must be exactly `u8`, `u64` or `u128`.  The token keeps
/// only the digits; range checking happens when the parser converts them.
///
//===----------------------------------------------------------------------===//

#include "io/Lexer.hpp"

#include "core/Identifier.hpp"
#include "io/ParseError.hpp"
#include "support/char_utils.hpp"
#include "support/hex.hpp"

#include <algorithm>
#include <array>

namespace movetext::io
{

namespace cu = support::char_utils;
using support::Expected;

namespace
{

struct KeywordEntry
{
    std::string_view key;
    TokenKind kind;
};

/// Sorted by spelling for binary search.
constexpr std::array<KeywordEntry, 9> kKeywordTable = {{
    {"address", TokenKind::AddressType},
    {"bool", TokenKind::BoolType},
    {"false", TokenKind::False},
    {"signer", TokenKind::SignerType},
    {"true", TokenKind::True},
    {"u128", TokenKind::U128Type},
    {"u64", TokenKind::U64Type},
    {"u8", TokenKind::U8Type},
    {"vector", TokenKind::VectorType},
}};

support::Diag unrecognized(support::SourceLoc loc)
{
    return makeParseError(ErrorKind::LexError, loc, "unrecognized token");
}

} // namespace

Lexer::Lexer(std::string_view text, uint32_t fileId) : cur_(text), fileId_(fileId) {}

std::optional<TokenKind> Lexer::lookupKeyword(std::string_view name)
{
    auto it = std::lower_bound(kKeywordTable.begin(),
                               kKeywordTable.end(),
                               name,
                               [](const KeywordEntry &entry, std::string_view key)
                               { return entry.key < key; });
    if (it != kKeywordTable.end() && it->key == name)
        return it->kind;
    return std::nullopt;
}

support::SourceLoc Lexer::currentLoc() const
{
    const parse::SourcePos pos = cur_.pos();
    return support::SourceLoc{fileId_, pos.line, static_cast<uint32_t>(pos.column + 1)};
}

Expected<Token> Lexer::next()
{
    Token tok;
    tok.loc = currentLoc();
    const std::size_t begin = cur_.offset();
    if (cur_.atEnd())
    {
        tok.kind = TokenKind::Eof;
        return tok;
    }

    const char c = cur_.peek();
    switch (c)
    {
        case '<':
            cur_.advance();
            tok.kind = TokenKind::Lt;
            break;
        case '>':
            cur_.advance();
            tok.kind = TokenKind::Gt;
            break;
        case ',':
            cur_.advance();
            tok.kind = TokenKind::Comma;
            break;
        case ':':
            if (cur_.peekAt(1) != ':')
                return unrecognized(tok.loc);
            cur_.seek(begin + 2);
            tok.kind = TokenKind::ColonColon;
            break;
        default:
        {
            Expected<void> ok;
            const char n = cur_.peekAt(1);
            if (c == '0' && (n == 'x' || n == 'X'))
                ok = lexAddress(tok);
            else if (cu::isDigit(c))
                ok = lexNumber(tok);
            else if ((c == 'b' || c == 'x') && n == '"')
                ok = lexByteString(tok);
            else if (cu::isWhitespace(c))
            {
                tok.kind = TokenKind::Whitespace;
                tok.text = std::string(cur_.consumeWhile(cu::isWhitespace));
            }
            else if (cu::isLetter(c))
                lexName(tok);
            else
                return unrecognized(tok.loc);

            if (!ok)
            {
                cur_.seek(begin);
                return std::move(ok).error();
            }
            break;
        }
    }

    tok.length = cur_.offset() - begin;
    return tok;
}

/// @brief Scan `0x` followed by one or more hex digits.
/// @details The prefix is normalized to lowercase so the address collaborator
///          only ever sees `0x`.
Expected<void> Lexer::lexAddress(Token &tok)
{
    cur_.seek(cur_.offset() + 2);
    std::string_view digits = cur_.consumeWhile(cu::isHexDigit);
    if (digits.empty())
        return unrecognized(tok.loc);
    tok.kind = TokenKind::Address;
    tok.text = "0x";
    tok.text.append(digits);
    return {};
}

Expected<void> Lexer::lexNumber(Token &tok)
{
    std::string_view digits = cur_.consumeWhile(cu::isDigit);
    tok.text = std::string(digits);
    if (!cu::isAlphanumeric(cur_.peek()))
    {
        tok.kind = TokenKind::U64;
        return {};
    }

    std::string_view suffix = cur_.consumeWhile(cu::isAlphanumeric);
    if (suffix == "u8")
        tok.kind = TokenKind::U8;
    else if (suffix == "u64")
        tok.kind = TokenKind::U64;
    else if (suffix == "u128")
        tok.kind = TokenKind::U128;
    else
        return makeParseError(ErrorKind::LexError, tok.loc, "invalid suffix");
    return {};
}

/// @brief Scan `b"ascii"` or `x"hex"` through the closing quote.
/// @details Every character before the closing quote must be ASCII for `b`
///          strings and a hex digit for `x` strings.  Running out of input
///          before the quote is an error.
Expected<void> Lexer::lexByteString(Token &tok)
{
    const bool isHex = cur_.peek() == 'x';
    cur_.seek(cur_.offset() + 2);
    auto isBody = [isHex](char ch) { return ch != '"' && (isHex ? cu::isHexDigit(ch) : cu::isAscii(ch)); };
    std::string_view body = cur_.consumeWhile(isBody);
    if (!cur_.consumeIf('"'))
        return unrecognized(tok.loc);
    tok.kind = TokenKind::Bytes;
    tok.text = isHex ? std::string(body) : support::encodeHex(body);
    return {};
}

void Lexer::lexName(Token &tok)
{
    std::string_view name = cur_.consumeWhile(core::isValidIdentifierChar);
    if (auto kw = lookupKeyword(name))
    {
        tok.kind = *kw;
        return;
    }
    tok.kind = TokenKind::Name;
    tok.text = std::string(name);
}

Expected<std::vector<Token>> tokenize(std::string_view text, uint32_t fileId)
{
    Lexer lexer(text, fileId);
    std::vector<Token> tokens;
    while (true)
    {
        auto tok = lexer.next();
        if (!tok)
            return std::move(tok).error();
        if (tok.value().is(TokenKind::Eof))
            break;
        tokens.push_back(std::move(tok).value());
    }
    return tokens;
}

} // namespace movetext::io
