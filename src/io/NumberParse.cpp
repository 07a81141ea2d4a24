//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Integer conversion for the argument grammar.  The 8- and 64-bit widths use
// std::from_chars; the standard library has no 128-bit overload, so that width
// accumulates digits by hand with an explicit overflow check.
//
//===----------------------------------------------------------------------===//

#include "io/NumberParse.hpp"

#include "support/char_utils.hpp"

#include <charconv>
#include <system_error>

namespace movetext::io
{

using support::Expected;
using support::makeError;

namespace
{

constexpr const char *kEmptyMessage = "cannot parse integer from empty string";
constexpr const char *kInvalidDigitMessage = "invalid digit found in string";
constexpr const char *kOverflowMessage = "number too large to fit in target type";

template <class T> Expected<T> parseWithFromChars(std::string_view digits)
{
    if (digits.empty())
        return makeError({}, kEmptyMessage);

    T value{};
    const char *end = digits.data() + digits.size();
    auto result = std::from_chars(digits.data(), end, value);
    if (result.ec == std::errc::result_out_of_range)
        return makeError({}, kOverflowMessage);
    // from_chars also stops at a leading sign, so a short parse means a bad digit.
    if (result.ec != std::errc{} || result.ptr != end)
        return makeError({}, kInvalidDigitMessage);
    return value;
}

} // namespace

Expected<uint8_t> parseU8(std::string_view digits)
{
    return parseWithFromChars<uint8_t>(digits);
}

Expected<uint64_t> parseU64(std::string_view digits)
{
    return parseWithFromChars<uint64_t>(digits);
}

Expected<support::UInt128> parseU128(std::string_view digits)
{
    if (digits.empty())
        return makeError({}, kEmptyMessage);

    constexpr support::UInt128 kLimit = support::kUInt128Max / 10;
    constexpr unsigned kLastDigit = static_cast<unsigned>(support::kUInt128Max % 10);

    support::UInt128 value = 0;
    for (char c : digits)
    {
        if (!support::char_utils::isDigit(c))
            return makeError({}, kInvalidDigitMessage);
        const unsigned d = static_cast<unsigned>(c - '0');
        if (value > kLimit || (value == kLimit && d > kLastDigit))
            return makeError({}, kOverflowMessage);
        value = value * 10 + d;
    }
    return value;
}

} // namespace movetext::io
