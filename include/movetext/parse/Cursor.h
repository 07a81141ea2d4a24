//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/movetext/parse/Cursor.h
// Purpose: Declare a lightweight text cursor for the movetext lexer.
// Key invariants: Operates on a string_view without allocating or owning storage.
// Ownership/Lifetime: Views textual buffers owned by the caller; no allocations.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines the character cursor the tokenizer scans with.
/// @details The cursor provides zero-allocation scanning primitives: single and
///          two-character lookahead, predicate-driven runs and position
///          tracking.  The lexer builds every token out of these calls, so it
///          never indexes the input buffer directly.

#pragma once

#include <concepts>
#include <cstddef>
#include <string_view>

namespace movetext::parse
{

template <class Predicate>
concept CursorPredicate = requires(Predicate pred, char ch) {
    { pred(ch) } -> std::convertible_to<bool>;
};

/// @brief Represents a line/column pair within a textual buffer.
struct SourcePos
{
    unsigned line = 0;      ///< 1-based line number for diagnostics.
    std::size_t column = 0; ///< 0-based column offset within the current line.
};

/// @brief Lightweight cursor for scanning type and literal text.
class Cursor
{
  public:
    /// @brief Construct a cursor over @p text starting at @p start.
    Cursor(std::string_view text, SourcePos start = {1, 0}) noexcept;

    /// @brief Query whether the cursor has reached the end of the buffer.
    [[nodiscard]] bool atEnd() const noexcept
    {
        return index_ >= text_.size();
    }

    /// @brief Inspect the current character without consuming it.
    [[nodiscard]] char peek() const noexcept;

    /// @brief Inspect the character @p ahead positions past the current one.
    /// @return The character, or '\0' past the end of the buffer.
    [[nodiscard]] char peekAt(std::size_t ahead) const noexcept;

    /// @brief Report the current line/column location.
    [[nodiscard]] SourcePos pos() const noexcept
    {
        return pos_;
    }

    /// @brief Retrieve the absolute byte offset within the buffer.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return index_;
    }

    /// @brief Consume @p c if present at the cursor.
    bool consumeIf(char c) noexcept;

    /// @brief Consume characters while @p pred returns true.
    template <CursorPredicate Predicate> std::string_view consumeWhile(Predicate pred) noexcept
    {
        const std::size_t begin = index_;
        while (!atEnd() && pred(peek()))
            advance();
        return text_.substr(begin, index_ - begin);
    }

    /// @brief Advance by a single character if not already at end.
    void advance() noexcept;

    /// @brief Advance to @p offset within the buffer.
    void seek(std::size_t offset) noexcept;

  private:
    void applyAdvance(char ch) noexcept;

    std::string_view text_;
    std::size_t index_ = 0;
    SourcePos start_{};
    SourcePos pos_{};
};

} // namespace movetext::parse
