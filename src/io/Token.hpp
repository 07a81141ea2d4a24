//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the type and literal lexer.
///
/// ## Token Categories
///
/// 1. **Type keywords**: `u8`, `u64`, `u128`, `bool`, `address`, `vector`,
///    `signer`
/// 2. **Boolean literals**: `true`, `false`
/// 3. **Payload tokens**: names, address literals, the three integer widths
///    and byte strings; `text` holds the payload
/// 4. **Punctuation**: `::`, `<`, `>`, `,`
/// 5. **Whitespace** runs and the synthetic end-of-input marker
///
/// Integer tokens carry their digit text without the suffix.  Byte-string
/// tokens carry lowercase-or-verbatim hex: `b"..."` content is hex encoded by
/// the lexer, `x"..."` content is kept as written.  Address tokens always start
/// with a lowercase `0x`.
///
/// @invariant `length` is the number of input bytes the token covers; the
///            end-of-input marker covers none.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <string>

namespace movetext::io
{

/// @brief Lexical categories.
enum class TokenKind
{
    // Type keywords
    U8Type,
    U64Type,
    U128Type,
    BoolType,
    AddressType,
    VectorType,
    SignerType,

    // Boolean literals
    True,
    False,

    // Payload-carrying tokens
    Name,
    Address,
    U8,
    U64,
    U128,
    Bytes,

    Whitespace,

    // Punctuation
    ColonColon,
    Lt,
    Gt,
    Comma,

    Eof
};

/// @brief Single lexical token.
struct Token
{
    /// @brief The kind of token this represents.
    TokenKind kind = TokenKind::Eof;

    /// @brief Payload for names, literals and whitespace; empty otherwise.
    std::string text;

    /// @brief Location of the first byte of the token.
    support::SourceLoc loc{};

    /// @brief Number of input bytes the token spans.
    std::size_t length = 0;

    /// @brief Check if this token is of a specific kind.
    bool is(TokenKind k) const
    {
        return kind == k;
    }
};

/// @brief Fixed spelling of @p kind, e.g. `'::'` or `'vector'`; a category
///        name such as `name` for payload kinds.
const char *tokenKindToString(TokenKind kind);

/// @brief Describe @p tok for a diagnostic, including its payload if any.
/// @details `name 'Coin'`, `address '0x1'`, `'<'`, `end of input`.
std::string describeToken(const Token &tok);

} // namespace movetext::io
