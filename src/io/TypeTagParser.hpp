//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: io/TypeTagParser.hpp
// Purpose: Declares the recursive-descent rule for type tags.
// Key invariants: Recursion depth never reaches core::kMaxTypeTagNesting.
// Ownership/Lifetime: Returned tags are owned by the caller.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/TypeTag.hpp"
#include "io/TokenStream.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>

namespace movetext::io
{

/// @brief Parse one type tag from @p ts.
/// @details Grammar:
///          @code
///          TypeTag := primitive
///                   | "vector" "<" TypeTag ">"
///                   | AddrLit "::" Name "::" Name [ "<" TypeTag {"," TypeTag} [","] ">" ]
///          @endcode
///          Vector elements and struct type arguments are parsed at
///          @p depth + 1.  Reaching core::kMaxTypeTagNesting fails before any
///          token is consumed.
/// @param ts Token stream positioned at the first token of the tag.
/// @param depth Nesting depth of this tag; 0 for a top-level tag.
/// @return The tag or the first diagnostic.
support::Expected<core::TypeTag> parseTypeTag(TokenStream &ts, std::size_t depth);

} // namespace movetext::io
