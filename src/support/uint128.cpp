//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "support/uint128.hpp"

#include <algorithm>

namespace movetext::support
{

std::string toDecimalString(UInt128 value)
{
    if (value == 0)
        return "0";
    std::string digits;
    while (value != 0)
    {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

} // namespace movetext::support
