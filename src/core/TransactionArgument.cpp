//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "core/TransactionArgument.hpp"

#include "support/hex.hpp"

#include <utility>

namespace movetext::core
{

TransactionArgument TransactionArgument::u8(uint8_t v)
{
    return TransactionArgument{Kind::U8, v};
}

TransactionArgument TransactionArgument::u64(uint64_t v)
{
    return TransactionArgument{Kind::U64, v};
}

TransactionArgument TransactionArgument::u128(support::UInt128 v)
{
    return TransactionArgument{Kind::U128, v};
}

TransactionArgument TransactionArgument::boolean(bool v)
{
    return TransactionArgument{Kind::Bool, 0, v};
}

TransactionArgument TransactionArgument::address(AccountAddress a)
{
    return TransactionArgument{Kind::Address, 0, false, a};
}

TransactionArgument TransactionArgument::u8Vector(std::vector<uint8_t> b)
{
    return TransactionArgument{Kind::U8Vector, 0, false, {}, std::move(b)};
}

std::string toString(const TransactionArgument &arg)
{
    using Kind = TransactionArgument::Kind;
    switch (arg.kind)
    {
        case Kind::U8:
            return support::toDecimalString(arg.value) + "u8";
        case Kind::U64:
            return support::toDecimalString(arg.value) + "u64";
        case Kind::U128:
            return support::toDecimalString(arg.value) + "u128";
        case Kind::Bool:
            return arg.flag ? "true" : "false";
        case Kind::Address:
            return arg.addr.shortString();
        case Kind::U8Vector:
            return "x\"" + support::encodeHex(arg.bytes) + "\"";
    }
    return "";
}

} // namespace movetext::core
