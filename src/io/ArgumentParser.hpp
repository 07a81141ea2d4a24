//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: io/ArgumentParser.hpp
// Purpose: Declares the single-token rules for transaction arguments and names.
// Key invariants: Each rule consumes exactly one token on success.
// Ownership/Lifetime: Returned values are owned by the caller.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/TransactionArgument.hpp"
#include "io/TokenStream.hpp"
#include "support/diag_expected.hpp"

#include <string>

namespace movetext::io
{

/// @brief Parse one transaction argument literal.
/// @details Integer tokens are range checked for their width, `true`/`false`
///          become booleans, address literals go through the address
///          collaborator and byte strings are hex decoded.
support::Expected<core::TransactionArgument> parseTransactionArgument(TokenStream &ts);

/// @brief Parse one bare name and return its spelling.
/// @details Keywords are not names, so `vector` or `u8` is rejected here.
support::Expected<std::string> parseString(TokenStream &ts);

} // namespace movetext::io
