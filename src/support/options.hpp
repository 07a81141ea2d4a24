//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the settings parsed from the movetext-parse command line.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace movetext::support
{

/// @brief Which entry point the command-line tool feeds its input to.
enum class ParseMode
{
    None,
    TypeTag,
    TypeTags,
    StructTag,
    Argument,
    Arguments,
    Names,
    Tokens,
};

/// @brief Holds command-line settings that influence the parse tool.
/// @invariant Exactly one of `text` or `file` is used once parsing succeeds.
/// @ownership Value type.
struct Options
{
    /// @brief Grammar selected by the mode flag.
    ParseMode mode = ParseMode::None;

    /// @brief Echo every input before its result.
    bool trace = false;

    /// @brief Inline input text; ignored when `file` is set.
    std::string text;

    /// @brief Path of a file whose non-empty lines are parsed one by one.
    std::string file;
};
} // namespace movetext::support
