//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the transaction argument and bare name rules.
/// @details Both rules look at exactly one token.  Conversion failures such as
///          `256u8` or an odd-length byte string are reported as semantic
///          errors at the literal's column; a token of the wrong category is a
///          syntax error.

#include "io/ArgumentParser.hpp"

#include "io/NumberParse.hpp"
#include "io/ParseError.hpp"
#include "support/hex.hpp"

#include <utility>

namespace movetext::io
{

using core::TransactionArgument;
using support::Expected;

namespace
{

/// @brief Convert an integer token with @p convert and wrap it with @p make.
template <class Convert, class Make>
Expected<TransactionArgument> integerArgument(const Token &tok, Convert convert, Make make)
{
    auto value = convert(tok.text);
    if (!value)
        return semanticError(std::move(value).error(), tok.loc);
    return make(value.value());
}

} // namespace

Expected<TransactionArgument> parseTransactionArgument(TokenStream &ts)
{
    auto next = ts.next();
    if (!next)
        return std::move(next).error();
    const Token &tok = next.value();

    switch (tok.kind)
    {
        case TokenKind::U8:
            return integerArgument(tok, parseU8, TransactionArgument::u8);
        case TokenKind::U64:
            return integerArgument(tok, parseU64, TransactionArgument::u64);
        case TokenKind::U128:
            return integerArgument(tok, parseU128, TransactionArgument::u128);
        case TokenKind::True:
            return TransactionArgument::boolean(true);
        case TokenKind::False:
            return TransactionArgument::boolean(false);
        case TokenKind::Address:
        {
            auto address = core::AccountAddress::fromHexLiteral(tok.text);
            if (!address)
                return semanticError(std::move(address).error(), tok.loc);
            return TransactionArgument::address(address.value());
        }
        case TokenKind::Bytes:
        {
            auto bytes = support::decodeHex(tok.text);
            if (!bytes)
                return semanticError(std::move(bytes).error(), tok.loc);
            return TransactionArgument::u8Vector(std::move(bytes).value());
        }
        default:
            return makeParseError(ErrorKind::SyntaxError,
                                  tok.loc,
                                  "unexpected token " + describeToken(tok) +
                                      ", expected transaction argument");
    }
}

Expected<std::string> parseString(TokenStream &ts)
{
    auto tok = ts.next();
    if (!tok)
        return std::move(tok).error();
    if (!tok.value().is(TokenKind::Name))
        return makeParseError(ErrorKind::SyntaxError,
                              tok.value().loc,
                              "unexpected token " + describeToken(tok.value()) +
                                  ", expected string");
    return std::move(tok).value().text;
}

} // namespace movetext::io
