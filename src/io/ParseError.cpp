//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "io/ParseError.hpp"

#include <utility>

namespace movetext::io
{

const char *errorCode(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::LexError:
            return "M1000";
        case ErrorKind::SyntaxError:
            return "M2000";
        case ErrorKind::SemanticError:
            return "M3000";
        case ErrorKind::NestingLimitExceeded:
            return "M4000";
    }
    return "";
}

support::Diag makeParseError(ErrorKind kind, support::SourceLoc loc, std::string msg)
{
    return support::makeError(loc, std::move(msg), errorCode(kind));
}

support::Diag semanticError(support::Diag inner, support::SourceLoc loc)
{
    inner.loc = loc;
    inner.code = errorCode(ErrorKind::SemanticError);
    return inner;
}

} // namespace movetext::io
