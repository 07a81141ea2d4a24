//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: io/Lexer.hpp
// Purpose: Declares the tokenizer for type tag and transaction argument text.
// Key invariants: Tokens are produced in input order and together cover every
//                 input byte exactly once.
// Ownership/Lifetime: The lexer views caller-owned text; tokens own their payload.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "io/Token.hpp"
#include "movetext/parse/Cursor.h"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace movetext::io
{

/// @brief Splits text into tokens one at a time.
/// @details Each call to next() scans exactly one token starting at the
///          current position.  Whitespace is returned as a token so callers
///          decide whether to keep it.  The first failure leaves the lexer
///          positioned at the start of the rejected token.
class Lexer
{
  public:
    /// @brief Create a lexer over @p text.
    /// @param text Input; must outlive the lexer.
    /// @param fileId Source manager identifier stamped into token locations.
    explicit Lexer(std::string_view text, uint32_t fileId = 0);

    /// @brief Scan the next token.
    /// @return The token, an Eof token once the input is exhausted, or a
    ///         LexError diagnostic.
    support::Expected<Token> next();

    /// @brief Resolve a reserved spelling to its keyword kind.
    /// @return The keyword kind, or std::nullopt for ordinary names.
    static std::optional<TokenKind> lookupKeyword(std::string_view name);

  private:
    support::SourceLoc currentLoc() const;

    support::Expected<void> lexAddress(Token &tok);
    support::Expected<void> lexNumber(Token &tok);
    support::Expected<void> lexByteString(Token &tok);
    void lexName(Token &tok);

    parse::Cursor cur_;
    uint32_t fileId_;
};

/// @brief Tokenize all of @p text.
/// @return Every token including whitespace, without an end marker, or the
///         first lexical error.
support::Expected<std::vector<Token>> tokenize(std::string_view text, uint32_t fileId = 0);

} // namespace movetext::io
