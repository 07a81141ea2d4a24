//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the type tag grammar.  Dispatch is on a single token: primitive
// keywords map straight to their tag, `vector` recurses once and an address
// literal starts a struct tag.  The depth counter is passed by value and
// checked on entry, so hostile input such as thousands of nested `vector<`
// fails with a diagnostic long before the native stack is at risk.
//
// Invariants:
//   * Struct parts are validated by the AccountAddress and Identifier
//     collaborators only after the whole struct tag has been read, so a syntax
//     error inside the type arguments is reported first.
//   * Collaborator failures are re-tagged as semantic errors located at the
//     token whose payload was rejected.
//
//===----------------------------------------------------------------------===//

#include "io/TypeTagParser.hpp"

#include "io/ParseError.hpp"

#include <string>
#include <utility>
#include <vector>

namespace movetext::io
{

using core::TypeTag;
using support::Expected;

namespace
{

/// @brief Consume a Name token and return it.
Expected<Token> expectName(TokenStream &ts)
{
    auto tok = ts.next();
    if (!tok)
        return tok;
    if (!tok.value().is(TokenKind::Name))
        return makeParseError(ErrorKind::SyntaxError,
                              tok.value().loc,
                              "expected name, got " + describeToken(tok.value()));
    return tok;
}

/// @brief Parse `:: Name :: Name [<...>]` after the address token @p addrTok.
Expected<TypeTag> parseStructBody(TokenStream &ts, const Token &addrTok, std::size_t depth)
{
    if (auto sep = ts.consume(TokenKind::ColonColon); !sep)
        return std::move(sep).error();
    auto moduleTok = expectName(ts);
    if (!moduleTok)
        return std::move(moduleTok).error();
    if (auto sep = ts.consume(TokenKind::ColonColon); !sep)
        return std::move(sep).error();
    auto nameTok = expectName(ts);
    if (!nameTok)
        return std::move(nameTok).error();

    std::vector<TypeTag> typeParams;
    if (ts.peekIs(TokenKind::Lt))
    {
        if (auto lt = ts.next(); !lt)
            return std::move(lt).error();
        auto params = ts.parseCommaList(
            [&ts, depth]() { return parseTypeTag(ts, depth + 1); }, TokenKind::Gt, true);
        if (!params)
            return std::move(params).error();
        if (auto gt = ts.consume(TokenKind::Gt); !gt)
            return std::move(gt).error();
        typeParams = std::move(params).value();
    }

    auto address = core::AccountAddress::fromHexLiteral(addrTok.text);
    if (!address)
        return semanticError(std::move(address).error(), addrTok.loc);
    auto module = core::Identifier::make(moduleTok.value().text);
    if (!module)
        return semanticError(std::move(module).error(), moduleTok.value().loc);
    auto name = core::Identifier::make(nameTok.value().text);
    if (!name)
        return semanticError(std::move(name).error(), nameTok.value().loc);

    return TypeTag::structure(core::StructTag{std::move(address).value(),
                                              std::move(module).value(),
                                              std::move(name).value(),
                                              std::move(typeParams)});
}

} // namespace

Expected<TypeTag> parseTypeTag(TokenStream &ts, std::size_t depth)
{
    if (depth >= core::kMaxTypeTagNesting)
    {
        const Token *at = ts.peek();
        return makeParseError(ErrorKind::NestingLimitExceeded,
                              at ? at->loc : support::SourceLoc{},
                              "Exceeded TypeTag nesting limit during parsing: " +
                                  std::to_string(depth));
    }

    auto tok = ts.next();
    if (!tok)
        return std::move(tok).error();

    switch (tok.value().kind)
    {
        case TokenKind::U8Type:
            return TypeTag::u8();
        case TokenKind::U64Type:
            return TypeTag::u64();
        case TokenKind::U128Type:
            return TypeTag::u128();
        case TokenKind::BoolType:
            return TypeTag::boolean();
        case TokenKind::AddressType:
            return TypeTag::address();
        case TokenKind::SignerType:
            return TypeTag::signer();
        case TokenKind::VectorType:
        {
            if (auto lt = ts.consume(TokenKind::Lt); !lt)
                return std::move(lt).error();
            auto element = parseTypeTag(ts, depth + 1);
            if (!element)
                return element;
            if (auto gt = ts.consume(TokenKind::Gt); !gt)
                return std::move(gt).error();
            return TypeTag::vector(std::move(element).value());
        }
        case TokenKind::Address:
            return parseStructBody(ts, tok.value(), depth);
        default:
            return makeParseError(ErrorKind::SyntaxError,
                                  tok.value().loc,
                                  "unexpected token " + describeToken(tok.value()) +
                                      ", expected type tag");
    }
}

} // namespace movetext::io
