//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/hex.hpp
// Purpose: Declares conversions between raw bytes and lowercase hex text.
// Key invariants: encodeHex output always has even length and lowercase digits.
// Ownership/Lifetime: Results are returned by value.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace movetext::support
{

/// @brief Render @p bytes as two lowercase hex digits per byte.
std::string encodeHex(const std::vector<uint8_t> &bytes);

/// @brief Render the characters of @p text as two lowercase hex digits per byte.
std::string encodeHex(std::string_view text);

/// @brief Decode hex text into bytes.
/// @param hex Even-length string of hex digits in either case.
/// @return Decoded bytes, or an error when the length is odd or a character
///         is not a hex digit. The diagnostic carries no location.
Expected<std::vector<uint8_t>> decodeHex(std::string_view hex);

} // namespace movetext::support
