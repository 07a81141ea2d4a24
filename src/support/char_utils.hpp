//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/char_utils.hpp
// Purpose: ASCII character classification shared by the lexer and the value
//          types that validate their own spelling.
//
// Classification is byte based and locale independent; the grammar is ASCII
// only, so bytes >= 0x80 never match any class here.
//
//===----------------------------------------------------------------------===//
#pragma once

namespace movetext::support::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character is a hex digit (0-9, A-F, a-f).
[[nodiscard]] constexpr bool isHexDigit(char c) noexcept
{
    return isDigit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}

/// @brief Check if character is alphanumeric (letter or digit).
[[nodiscard]] constexpr bool isAlphanumeric(char c) noexcept
{
    return isLetter(c) || isDigit(c);
}

/// @brief Check if character is ASCII whitespace.
/// @details Space, tab, line feed, form feed and carriage return.  Vertical
///          tab is not whitespace.
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

/// @brief Check if the byte is 7-bit ASCII.
[[nodiscard]] constexpr bool isAscii(char c) noexcept
{
    return static_cast<unsigned char>(c) < 0x80;
}

/// @brief Get the numeric value of a hex digit (0-15).
/// @return Value 0-15, or -1 if not a hex digit.
[[nodiscard]] constexpr int hexDigitValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

} // namespace movetext::support::char_utils
