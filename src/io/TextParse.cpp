//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the six text entry points.  They share one driver: lex the whole
// input, keep every non-whitespace token and the lexer's end-of-input token,
// run one grammar rule and then consume the end-of-input token.  A rule that
// stops early therefore surfaces as "expected token end of input, got ...".
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry points that turn complete strings into parsed values.

#include "movetext/io/TextParse.hpp"

#include "io/ArgumentParser.hpp"
#include "io/ParseError.hpp"
#include "io/TokenStream.hpp"
#include "io/TypeTagParser.hpp"

#include <utility>

namespace movetext::io
{

using support::Expected;

namespace
{

/// @brief Lex @p text into a stream without whitespace, ending in Eof.
Expected<TokenStream> lexForParsing(std::string_view text)
{
    Lexer lexer(text);
    std::vector<Token> tokens;
    while (true)
    {
        auto tok = lexer.next();
        if (!tok)
            return std::move(tok).error();
        if (tok.value().is(TokenKind::Whitespace))
            continue;
        const bool done = tok.value().is(TokenKind::Eof);
        tokens.push_back(std::move(tok).value());
        if (done)
            break;
    }
    return TokenStream(std::move(tokens));
}

/// @brief Run @p rule over all of @p text and require nothing to follow.
template <class Rule>
auto parseWhole(std::string_view text, Rule rule) -> decltype(rule(std::declval<TokenStream &>()))
{
    auto ts = lexForParsing(text);
    if (!ts)
        return std::move(ts).error();
    auto result = rule(ts.value());
    if (!result)
        return result;
    if (auto end = ts.value().consume(TokenKind::Eof); !end)
        return std::move(end).error();
    return result;
}

} // namespace

Expected<core::TypeTag> parseTypeTag(std::string_view text)
{
    return parseWhole(text, [](TokenStream &ts) { return parseTypeTag(ts, 0); });
}

Expected<std::vector<core::TypeTag>> parseTypeTags(std::string_view text)
{
    return parseWhole(text,
                      [](TokenStream &ts)
                      {
                          return ts.parseCommaList(
                              [&ts]() { return parseTypeTag(ts, 0); }, TokenKind::Eof, true);
                      });
}

Expected<core::StructTag> parseStructTag(std::string_view text)
{
    auto tag = parseTypeTag(text);
    if (!tag)
    {
        support::Diag diag = std::move(tag).error();
        diag.message = "invalid struct tag: " + std::string(text) + ", " + diag.message;
        return diag;
    }
    if (tag.value().kind() != core::TypeTag::Kind::Struct)
        return makeParseError(
            ErrorKind::SemanticError, {}, "invalid struct tag: " + std::string(text));
    return tag.value().structTag();
}

Expected<core::TransactionArgument> parseTransactionArgument(std::string_view text)
{
    return parseWhole(text, [](TokenStream &ts) { return parseTransactionArgument(ts); });
}

Expected<std::vector<core::TransactionArgument>> parseTransactionArguments(std::string_view text)
{
    return parseWhole(text,
                      [](TokenStream &ts)
                      {
                          return ts.parseCommaList(
                              [&ts]() { return parseTransactionArgument(ts); }, TokenKind::Eof, true);
                      });
}

Expected<std::vector<std::string>> parseStringList(std::string_view text)
{
    return parseWhole(text,
                      [](TokenStream &ts)
                      {
                          return ts.parseCommaList(
                              [&ts]() { return parseString(ts); }, TokenKind::Eof, true);
                      });
}

} // namespace movetext::io
