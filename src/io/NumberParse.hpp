//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: io/NumberParse.hpp
// Purpose: Converts integer literal digit text to fixed-width values.
// Key invariants: Out-of-range input is an error, never wrapped or saturated.
// Ownership/Lifetime: Stateless; views caller-owned text.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/uint128.hpp"

#include <cstdint>
#include <string_view>

namespace movetext::io
{

/// @brief Convert base-10 @p digits to an 8-bit value.
/// @details Leading zeros are accepted.  Empty text, a non-digit or a value
///          above 255 yields an unlocated diagnostic.
support::Expected<uint8_t> parseU8(std::string_view digits);

/// @brief Convert base-10 @p digits to a 64-bit value.
support::Expected<uint64_t> parseU64(std::string_view digits);

/// @brief Convert base-10 @p digits to a 128-bit value.
support::Expected<support::UInt128> parseU128(std::string_view digits);

} // namespace movetext::io
