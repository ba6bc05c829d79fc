#pragma once

namespace seqmatch::notation {

#define TOKEN_DEFINITIONS(X) \
    X(Undefined , "undefined"  ) \
    X(EndOfInput, "end of input") \
    \
    X(Identifier, "identifier") \
    X(Integer   , "integer"   ) \
    \
    X(Star    , "star"    ) \
    X(Plus    , "plus"    ) \
    X(Question, "question") \
    \
    X(OpenBrace   , "openBrace"   ) \
    X(CloseBrace  , "closeBrace"  ) \
    X(OpenBracket , "openBracket" ) \
    X(CloseBracket, "closeBracket") \
    \
    X(Colon    , "colon"    ) \
    X(Semicolon, "semicolon") \
    X(Comma    , "comma"    )

#define X(A,B) A,
enum class TokenKind
{
TOKEN_DEFINITIONS(X)
};
#undef X

const char* to_string(TokenKind kind);

inline bool isQuantifierStart(TokenKind kind)
{
    switch (kind) {
    case TokenKind::Star:
    case TokenKind::Plus:
    case TokenKind::Question:
    case TokenKind::OpenBrace:
        return true;

    default:
        return false;
    }
}

inline bool isSeparator(TokenKind kind)
{
    return kind == TokenKind::Semicolon
        || kind == TokenKind::Comma;
}

} // namespace seqmatch::notation
