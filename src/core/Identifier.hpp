//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/Identifier.hpp
// Purpose: Declares the validated module/struct name value type.
// Key invariants: A constructed Identifier always satisfies Identifier::isValid.
// Ownership/Lifetime: Owns its string.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace movetext::core
{

/// @brief Check whether @p c may appear after the first character of a name.
/// @details ASCII letters, digits and underscore.
[[nodiscard]] bool isValidIdentifierChar(char c) noexcept;

/// @brief Module or struct name.
/// @details A name begins with an ASCII letter, or with `_` when at least one
///          more character follows; every later character satisfies
///          isValidIdentifierChar.  A lone `_` is rejected.
class Identifier
{
  public:
    /// @brief Validate @p name and wrap it.
    /// @return The identifier, or an error naming the rejected text.
    static support::Expected<Identifier> make(std::string name);

    /// @brief Check the naming rule without constructing.
    [[nodiscard]] static bool isValid(std::string_view name) noexcept;

    /// @brief Borrow the spelling.
    const std::string &str() const
    {
        return name_;
    }

    bool operator==(const Identifier &) const = default;

  private:
    explicit Identifier(std::string name) : name_(std::move(name)) {}

    std::string name_;
};

} // namespace movetext::core
