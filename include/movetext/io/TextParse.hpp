//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/movetext/io/TextParse.hpp
// Purpose: Stable façade for parsing type tags, struct tags, transaction
//          arguments and name lists from text.
// Key invariants: Every entry point consumes its whole input; trailing tokens
//                 are an error.  No entry point keeps state between calls.
// Ownership/Lifetime: Results are owned by the caller.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/TransactionArgument.hpp"
#include "core/TypeTag.hpp"
#include "io/Lexer.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

/// @file include/movetext/io/TextParse.hpp
/// @brief Aggregated public header for the text entry points.  Each function
///        tokenizes @p text, drops whitespace, runs one grammar rule at depth 0
///        and then requires the end of input.  io::tokenize is re-exported
///        through io/Lexer.hpp for tools that dump raw tokens.

namespace movetext::io
{

/// @brief Parse exactly one type tag, e.g. `vector<0x1::M::S<u8>>`.
support::Expected<core::TypeTag> parseTypeTag(std::string_view text);

/// @brief Parse a comma separated, possibly empty, list of type tags.
/// @details A trailing comma is accepted.
support::Expected<std::vector<core::TypeTag>> parseTypeTags(std::string_view text);

/// @brief Parse a type tag that must be a struct.
/// @details Failures read `invalid struct tag: <text>, <reason>`; a valid
///          non-struct tag reads `invalid struct tag: <text>`.
support::Expected<core::StructTag> parseStructTag(std::string_view text);

/// @brief Parse exactly one transaction argument literal.
support::Expected<core::TransactionArgument> parseTransactionArgument(std::string_view text);

/// @brief Parse a comma separated, possibly empty, list of argument literals.
/// @details A trailing comma is accepted.
support::Expected<std::vector<core::TransactionArgument>> parseTransactionArguments(
    std::string_view text);

/// @brief Parse a comma separated, possibly empty, list of bare names.
/// @details A trailing comma is accepted.  Keywords are not names.
support::Expected<std::vector<std::string>> parseStringList(std::string_view text);

} // namespace movetext::io
