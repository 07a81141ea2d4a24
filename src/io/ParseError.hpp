//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: io/ParseError.hpp
// Purpose: Classifies parse failures and stamps diagnostics with stable codes.
// Key invariants: Each ErrorKind maps to exactly one code.
// Ownership/Lifetime: Stateless helpers returning diagnostics by value.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>

namespace movetext::io
{

/// @brief Broad class of a parse failure.
enum class ErrorKind
{
    LexError,            ///< M1000: input could not be split into tokens.
    SyntaxError,         ///< M2000: tokens arrived in an order the grammar rejects.
    SemanticError,       ///< M3000: a token was well formed but its value was not.
    NestingLimitExceeded ///< M4000: type tag recursion hit the nesting limit.
};

/// @brief Diagnostic code for @p kind, e.g. "M2000".
const char *errorCode(ErrorKind kind);

/// @brief Create an error diagnostic of class @p kind.
support::Diag makeParseError(ErrorKind kind, support::SourceLoc loc, std::string msg);

/// @brief Re-tag a collaborator failure as a semantic error at @p loc.
/// @details Collaborator diagnostics carry no location or code; the parser
///          attributes them to the token whose payload was rejected.
support::Diag semanticError(support::Diag inner, support::SourceLoc loc);

} // namespace movetext::io
