//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the lightweight source location POD attached to tokens and diagnostics.
// Key invariants: file_id == 0 denotes text that did not come from a registered file;
//                 line/column are 1-based when non-zero.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace movetext::support
{

/// @brief Represents an absolute position within a parsed text.
/// @invariant file_id == 0 indicates inline text with no backing file.
/// @ownership Value type with no owned resources.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 for inline text.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based byte column within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a registered file.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    /// @brief Determine whether a 1-based column number is available.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace movetext::support
