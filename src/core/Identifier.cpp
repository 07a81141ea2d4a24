//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "core/Identifier.hpp"

#include "support/char_utils.hpp"

#include <algorithm>

namespace movetext::core
{

namespace cu = support::char_utils;

bool isValidIdentifierChar(char c) noexcept
{
    return cu::isAlphanumeric(c) || c == '_';
}

bool Identifier::isValid(std::string_view name) noexcept
{
    if (name.empty())
        return false;
    if (name[0] == '_')
    {
        if (name.size() == 1)
            return false;
    }
    else if (!cu::isLetter(name[0]))
    {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), isValidIdentifierChar);
}

support::Expected<Identifier> Identifier::make(std::string name)
{
    if (!isValid(name))
        return support::makeError({}, "invalid identifier '" + name + "'");
    return Identifier(std::move(name));
}

} // namespace movetext::core
