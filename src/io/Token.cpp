//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "io/Token.hpp"

namespace movetext::io
{

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::U8Type:
            return "'u8'";
        case TokenKind::U64Type:
            return "'u64'";
        case TokenKind::U128Type:
            return "'u128'";
        case TokenKind::BoolType:
            return "'bool'";
        case TokenKind::AddressType:
            return "'address'";
        case TokenKind::VectorType:
            return "'vector'";
        case TokenKind::SignerType:
            return "'signer'";
        case TokenKind::True:
            return "'true'";
        case TokenKind::False:
            return "'false'";
        case TokenKind::Name:
            return "name";
        case TokenKind::Address:
            return "address";
        case TokenKind::U8:
            return "u8 literal";
        case TokenKind::U64:
            return "u64 literal";
        case TokenKind::U128:
            return "u128 literal";
        case TokenKind::Bytes:
            return "byte string";
        case TokenKind::Whitespace:
            return "whitespace";
        case TokenKind::ColonColon:
            return "'::'";
        case TokenKind::Lt:
            return "'<'";
        case TokenKind::Gt:
            return "'>'";
        case TokenKind::Comma:
            return "','";
        case TokenKind::Eof:
            return "end of input";
    }
    return "<invalid>";
}

std::string describeToken(const Token &tok)
{
    switch (tok.kind)
    {
        case TokenKind::Name:
        case TokenKind::Address:
        case TokenKind::U8:
        case TokenKind::U64:
        case TokenKind::U128:
        case TokenKind::Bytes:
            return std::string(tokenKindToString(tok.kind)) + " '" + tok.text + "'";
        default:
            return tokenKindToString(tok.kind);
    }
}

} // namespace movetext::io
