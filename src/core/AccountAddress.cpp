//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Construction and rendering for account addresses.  Short literals such as
// `0x1` are accepted and padded on the left; the canonical rendering strips the
// padding back off so parsed struct tags print the way they were written.
//
//===----------------------------------------------------------------------===//

#include "core/AccountAddress.hpp"

#include "support/hex.hpp"

#include <algorithm>

namespace movetext::core
{

using support::Expected;
using support::makeError;

Expected<AccountAddress> AccountAddress::fromHexLiteral(std::string_view literal)
{
    if (literal.substr(0, 2) != "0x")
        return makeError({}, "address literal must start with 0x: " + std::string(literal));

    std::string_view digits = literal.substr(2);
    if (digits.empty() || digits.size() > kLength * 2)
        return makeError({}, "invalid address literal length: " + std::string(literal));

    std::string padded(kLength * 2 - digits.size(), '0');
    padded.append(digits);
    auto parsed = fromHex(padded);
    if (!parsed)
        return makeError({}, "invalid address literal: " + std::string(literal) + ", " +
                                 parsed.error().message);
    return parsed;
}

Expected<AccountAddress> AccountAddress::fromHex(std::string_view hex)
{
    auto decoded = support::decodeHex(hex);
    if (!decoded)
        return std::move(decoded).error();
    if (decoded.value().size() != kLength)
        return makeError({}, "address must be " + std::to_string(kLength) + " bytes, got " +
                                 std::to_string(decoded.value().size()));

    Bytes bytes{};
    std::copy(decoded.value().begin(), decoded.value().end(), bytes.begin());
    return AccountAddress(bytes);
}

std::string AccountAddress::toHex() const
{
    return support::encodeHex(std::vector<uint8_t>(bytes_.begin(), bytes_.end()));
}

std::string AccountAddress::toHexLiteral() const
{
    return "0x" + toHex();
}

std::string AccountAddress::shortString() const
{
    std::string hex = toHex();
    const auto first = hex.find_first_not_of('0');
    if (first == std::string::npos)
        return "0x0";
    return "0x" + hex.substr(first);
}

} // namespace movetext::core
