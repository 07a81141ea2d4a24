//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/uint128.hpp
// Purpose: Names the 128-bit unsigned integer used by u128 literals.
// Key invariants: Formatting is plain base-10 with no sign or leading zeros.
// Ownership/Lifetime: Value type.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace movetext::support
{

/// @brief Unsigned 128-bit integer; a GCC/Clang builtin on 64-bit targets.
using UInt128 = unsigned __int128;

/// @brief Largest representable 128-bit value.
inline constexpr UInt128 kUInt128Max = ~static_cast<UInt128>(0);

/// @brief Render @p value in base 10.
/// @details std::to_string has no overload for the builtin, so digits are
///          produced by repeated division.
std::string toDecimalString(UInt128 value);

} // namespace movetext::support
