//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Hex helpers used by byte-string literals and account addresses.  Encoding
// never fails; decoding reports the first offending character by position.
//
//===----------------------------------------------------------------------===//

#include "support/hex.hpp"

#include "support/char_utils.hpp"

namespace movetext::support
{
namespace
{
constexpr char kHexDigits[] = "0123456789abcdef";

void appendByte(std::string &out, uint8_t byte)
{
    out.push_back(kHexDigits[byte >> 4]);
    out.push_back(kHexDigits[byte & 0x0F]);
}
} // namespace

std::string encodeHex(const std::vector<uint8_t> &bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes)
        appendByte(out, b);
    return out;
}

std::string encodeHex(std::string_view text)
{
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text)
        appendByte(out, static_cast<uint8_t>(c));
    return out;
}

Expected<std::vector<uint8_t>> decodeHex(std::string_view hex)
{
    if (hex.size() % 2 != 0)
        return makeError({}, "odd number of hex digits");

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        const int hi = char_utils::hexDigitValue(hex[i]);
        const int lo = char_utils::hexDigitValue(hex[i + 1]);
        if (hi < 0 || lo < 0)
        {
            const size_t bad = hi < 0 ? i : i + 1;
            return makeError({},
                             std::string("invalid hex character '") + hex[bad] +
                                 "' at position " + std::to_string(bad));
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

} // namespace movetext::support
