#pragma once

#include <deque>
#include <string_view>

#include <seqmatch/Slice.hpp>
#include <seqmatch/Types.hpp>
#include <seqmatch/notation/Token.hpp>

namespace seqmatch::notation {

/**
 * Non-ASCII meta characters
 *
 * Characters are 8-bit values in range [0, 256). ASCII values are 7-bit
 * values in range [0, 128). These meta-characters are non-ASCII
 * characters used as signals in ASCII character streams.
 */
enum MetaChar : unsigned char
{
    EndOfInputChar = 0b1111'1111,
};

class Tokenizer
{
public:
    using Unit = char;
    using ParentView = Slice<char const>;
    using Window = Slice<char const>;
    using Pointer = ParentView::const_pointer;

public:
    Tokenizer() = default;

    explicit Tokenizer(ParentView buffer)
        : myWindow(buffer.data(), 1)
        , myEnd(buffer.data() + buffer.card())
    {
    }

public:
    bool hasNext() const
    {
        return myWindow.begin() != myEnd;
    }

public:
    Window take()
    {
        auto ret = window();
        bump();
        return ret;
    }

    Window window() const
    {
        return myWindow;
    }

    void bump()
    {
        myWindow = Window(myWindow.end(), 1);
    }

    void grow()
    {
        myWindow = Window(myWindow.data(), myWindow.card() + 1);
    }

    Unit current() const
    {
        return myWindow.back();
    }

    Unit peek() const
    {
        if ( myEnd <= myWindow.end() )
            return static_cast<Unit>(EndOfInputChar);

        return *myWindow.end();
    }

public:
    explicit operator bool () const
    {
        return hasNext();
    }

private:
    Window myWindow;
    Pointer myEnd = nullptr;
};

/**
 * Splits sequence notation into tokens
 *
 * Whitespace separates tokens and is otherwise ignored. A character that
 * starts no token comes back as an Undefined token, after which scanning
 * continues.
 */
class Scanner
{
public:
    explicit Scanner(std::string_view text);

public:
    Scanner(Scanner const&) = delete;
    Scanner& operator = (Scanner const&) = delete;

public:
    Token next();
    Token const& peek(uz lookAhead = 0);

    bool eof() const;
    bool hasError() const;

    explicit operator bool() const;

protected:
    Token readNext();

    void bumpLine();

private:
    Tokenizer myTok;
    std::deque<Token> myBuffer;

    SourceLocation myLoc = { 1, 1 };
    bool myError = false;
};

} // namespace seqmatch::notation
