//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: io/TokenStream.hpp
// Purpose: One-token lookahead over a lexed token list plus the comma-list
//          combinator shared by every list-shaped grammar rule.
// Key invariants: The list ends with exactly one Eof token; the cursor only
//                 moves forward.
// Ownership/Lifetime: The stream owns its tokens; next() moves them out.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "io/ParseError.hpp"
#include "io/Token.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

namespace movetext::io
{

/// @brief Forward-only cursor over tokens with single-token lookahead.
class TokenStream
{
  public:
    /// @brief Take ownership of @p tokens.
    /// @param tokens Whitespace-free tokens terminated by an Eof token.
    explicit TokenStream(std::vector<Token> tokens);

    /// @brief Consume and return the next token.
    /// @return The token, or a SyntaxError once the Eof token itself has been
    ///         consumed.
    support::Expected<Token> next();

    /// @brief Look at the next token without consuming it.
    /// @return Null once every token, Eof included, has been consumed.
    const Token *peek() const;

    /// @brief Check whether the next token has kind @p kind.
    bool peekIs(TokenKind kind) const
    {
        const Token *tok = peek();
        return tok && tok->is(kind);
    }

    /// @brief Consume the next token and require it to have kind @p expected.
    /// @return Success, or a SyntaxError naming both the expected and the
    ///         actual token.
    support::Expected<void> consume(TokenKind expected);

    /// @brief Parse a comma separated list of items ending before @p terminator.
    /// @details The list is empty when @p terminator comes first.  Otherwise
    ///          each item must be followed by @p terminator or a comma; a comma
    ///          directly before @p terminator is accepted only with
    ///          @p allowTrailingComma.  The terminator is left in the stream.
    /// @param parseItem Callable returning Expected<Item>.
    /// @return Items in input order, or the first diagnostic.
    template <class ParseItem>
    auto parseCommaList(ParseItem &&parseItem, TokenKind terminator, bool allowTrailingComma)
        -> support::Expected<std::vector<typename std::invoke_result_t<ParseItem &>::value_type>>
    {
        using Item = typename std::invoke_result_t<ParseItem &>::value_type;
        std::vector<Item> items;
        if (peekIs(terminator))
            return items;
        while (true)
        {
            auto item = parseItem();
            if (!item)
                return std::move(item).error();
            items.push_back(std::move(item).value());
            if (peekIs(terminator))
                break;
            if (auto comma = consume(TokenKind::Comma); !comma)
                return std::move(comma).error();
            if (allowTrailingComma && peekIs(terminator))
                break;
        }
        return items;
    }

  private:
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
};

} // namespace movetext::io
