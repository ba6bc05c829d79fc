#include <seqmatch/notation/Scanner.hpp>

namespace seqmatch::notation {

namespace
{
    bool isSpace(char c)
    {
        switch (c)
        {
        case ' ':
        case '\t':
            return true;
        }

        return false;
    }

    bool isLineBreak(char c)
    {
        switch (c)
        {
        case '\r':
        case '\n':
            return true;
        }

        return false;
    }

    bool isLetter(char c)
    {
        if ( 'a' <= c && c <= 'z' )
            return true;

        if ( 'A' <= c && c <= 'Z' )
            return true;

        return false;
    }

    bool isNumber(char c)
    {
        if ( '0' <= c && c <= '9' )
            return true;

        return false;
    }

    bool isIdentifierStart(char c)
    {
        return c == '_' || isLetter(c);
    }

    bool isIdentifierMid(char c)
    {
        return isIdentifierStart(c) || isNumber(c) || c == '.';
    }

    std::string_view lexeme(Tokenizer::Window w)
    {
        return std::string_view(w.data(), w.card());
    }
} // namespace

Scanner::Scanner(std::string_view text)
    : myTok(Slice<char const>(text.data(), text.size()))
{
}

Token Scanner::next()
{
    if ( !myBuffer.empty() ) {
        auto ret = myBuffer.front();
        myBuffer.pop_front();
        return ret;
    }

    return readNext();
}

Token const& Scanner::peek(uz lookAhead)
{
    while ( lookAhead >= myBuffer.size() )
        myBuffer.push_back(readNext());

    return myBuffer[lookAhead];
}

bool Scanner::eof() const
{
    return !myTok && myBuffer.empty();
}

bool Scanner::hasError() const
{
    return myError;
}

Scanner::operator bool() const
{
    return !eof() && !myError;
}

void Scanner::bumpLine()
{
    ++myLoc.line;
    myLoc.column = 1;
}

Token Scanner::readNext()
{
    auto token = [this](TokenKind kind) {
        auto loc = myLoc;
        auto w = myTok.take();
        myLoc.column += static_cast<ColumnIndex>(w.card());
        return Token(kind, lexeme(w), loc);
    };

    for (;;) {
        if ( !myTok )
            return Token(TokenKind::EndOfInput, myLoc);

        auto const c = myTok.current();
        if ( isLineBreak(c) ) {
            if ( c == '\r' && myTok.peek() == '\n' )
                myTok.grow();

            myTok.bump();
            bumpLine();
            continue;
        }

        if ( isSpace(c) ) {
            myTok.bump();
            ++myLoc.column;
            continue;
        }

        break;
    }

    switch ( myTok.current() ) {
    case '*': return token(TokenKind::Star        );
    case '+': return token(TokenKind::Plus        );
    case '?': return token(TokenKind::Question    );
    case '{': return token(TokenKind::OpenBrace   );
    case '}': return token(TokenKind::CloseBrace  );
    case '[': return token(TokenKind::OpenBracket );
    case ']': return token(TokenKind::CloseBracket);
    case ':': return token(TokenKind::Colon       );
    case ';': return token(TokenKind::Semicolon   );
    case ',': return token(TokenKind::Comma       );
    }

    if ( isIdentifierStart(myTok.current()) ) {
        while ( isIdentifierMid(myTok.peek()) )
            myTok.grow();

        return token(TokenKind::Identifier);
    }

    if ( isNumber(myTok.current()) ) {
        while ( isNumber(myTok.peek()) )
            myTok.grow();

        return token(TokenKind::Integer);
    }

    myError = true;
    return token(TokenKind::Undefined);
}

} // namespace seqmatch::notation
