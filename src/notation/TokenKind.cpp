#include <seqmatch/notation/TokenKind.hpp>

namespace seqmatch::notation {

const char* to_string(TokenKind kind)
{
    #define X(A,B) B,
    static const char* tokenKindStringTable[] =
    {
    TOKEN_DEFINITIONS(X)
    };
    #undef X

    return tokenKindStringTable[static_cast<int>(kind)];
}

} // namespace seqmatch::notation
