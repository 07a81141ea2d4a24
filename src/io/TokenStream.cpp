//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "io/TokenStream.hpp"

namespace movetext::io
{

TokenStream::TokenStream(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

support::Expected<Token> TokenStream::next()
{
    if (pos_ >= tokens_.size())
        return makeParseError(
            ErrorKind::SyntaxError, {}, "out of tokens, this should not happen");
    return std::move(tokens_[pos_++]);
}

const Token *TokenStream::peek() const
{
    return pos_ < tokens_.size() ? &tokens_[pos_] : nullptr;
}

support::Expected<void> TokenStream::consume(TokenKind expected)
{
    auto tok = next();
    if (!tok)
        return std::move(tok).error();
    if (!tok.value().is(expected))
        return makeParseError(ErrorKind::SyntaxError,
                              tok.value().loc,
                              std::string("expected token ") + tokenKindToString(expected) +
                                  ", got " + describeToken(tok.value()));
    return {};
}

} // namespace movetext::io
