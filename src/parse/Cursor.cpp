//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/parse/Cursor.cpp
// Purpose: Provide out-of-line helpers for the parse::Cursor utility.
// Key invariants: Position tracking always agrees with the byte index.
// Ownership/Lifetime: Operates on caller-owned string_view buffers.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the character cursor used by the tokenizer.

#include "movetext/parse/Cursor.h"

namespace movetext::parse
{

/// @brief Construct a cursor over the provided source buffer.
/// @param text Source text to traverse.
/// @param start Source position representing the beginning of the buffer.
Cursor::Cursor(std::string_view text, SourcePos start) noexcept
    : text_(text), index_(0), start_(start), pos_(start)
{
}

/// @brief Inspect the current character without advancing.
/// @details Returns '\0' when the cursor is at the end to simplify callers that
///          expect a sentinel terminator.  Embedded NUL bytes are therefore
///          indistinguishable from the end; callers test atEnd() first.
char Cursor::peek() const noexcept
{
    return atEnd() ? '\0' : text_[index_];
}

char Cursor::peekAt(std::size_t ahead) const noexcept
{
    const std::size_t at = index_ + ahead;
    return at < text_.size() ? text_[at] : '\0';
}

/// @brief Update the tracked source position after consuming @p ch.
/// @details Handles newlines by incrementing the line counter and resetting the
///          column; other characters simply increment the column.
void Cursor::applyAdvance(char ch) noexcept
{
    if (ch == '\n')
    {
        ++pos_.line;
        pos_.column = 0;
    }
    else
    {
        ++pos_.column;
    }
}

/// @brief Consume the current character and update the position.
/// @details Safely returns when already at end-of-input.
void Cursor::advance() noexcept
{
    if (atEnd())
        return;
    const char ch = text_[index_++];
    applyAdvance(ch);
}

/// @brief Conditionally consume @p c and report success.
/// @details The cursor is left untouched when the character does not match.
/// @return True when @p c was consumed.
bool Cursor::consumeIf(char c) noexcept
{
    if (!atEnd() && peek() == c)
    {
        advance();
        return true;
    }
    return false;
}

/// @brief Move the cursor to @p offset within the source buffer.
/// @details Adjusts both the byte index and the tracked source position. When
///          seeking backwards the routine recomputes the position from the start
///          of the buffer to keep line/column data accurate.
/// @param offset Zero-based index into the source buffer.
void Cursor::seek(std::size_t offset) noexcept
{
    if (offset > text_.size())
        offset = text_.size();

    if (offset >= index_)
    {
        while (index_ < offset)
            advance();
        return;
    }

    index_ = 0;
    pos_ = start_;
    while (index_ < offset)
        advance();
}

} // namespace movetext::parse
