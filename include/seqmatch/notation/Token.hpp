#pragma once

#include <string_view>

#include <seqmatch/Stream.hpp>
#include <seqmatch/Types.hpp>
#include <seqmatch/Utilities.hpp>
#include <seqmatch/notation/TokenKind.hpp>

namespace seqmatch::notation {

using LineIndex = u32;
using ColumnIndex = u32;

struct SourceLocation
{
    LineIndex line = 0;
    ColumnIndex column = 0;

    constexpr SourceLocation() noexcept = default;
    constexpr SourceLocation(LineIndex line, ColumnIndex col) noexcept
        : line(line)
        , column(col)
    {
    }

    void swap(SourceLocation& rhs)
    {
        using seqmatch::swap;
        swap(line, rhs.line);
        swap(column, rhs.column);
    }
};

/**
 * Lexeme of the sequence notation
 *
 * The lexeme views the scanned text, which must outlive the token.
 */
class Token
{
public:
    constexpr explicit Token() noexcept = default;

    constexpr Token(TokenKind kind, std::string_view lexeme, SourceLocation loc) noexcept
        : myKind(kind)
        , myLexeme(lexeme)
        , myLoc(loc)
    {
    }

    constexpr Token(TokenKind kind, SourceLocation loc) noexcept
        : myKind(kind)
        , myLoc(loc)
    {
    }

    void swap(Token& rhs) noexcept
    {
        using seqmatch::swap;

        swap(myKind, rhs.myKind);
        swap(myLexeme, rhs.myLexeme);
        swap(myLoc, rhs.myLoc);
    }

public:
    constexpr explicit operator bool () const noexcept
    {
        return myKind != TokenKind::Undefined;
    }

public:
    constexpr TokenKind        kind    () const noexcept { return myKind      ; }
    constexpr std::string_view lexeme  () const noexcept { return myLexeme    ; }
    constexpr SourceLocation   location() const noexcept { return myLoc       ; }
    constexpr LineIndex        line    () const noexcept { return myLoc.line  ; }
    constexpr ColumnIndex      column  () const noexcept { return myLoc.column; }

private:
    TokenKind myKind = TokenKind::Undefined;
    std::string_view myLexeme;
    SourceLocation myLoc;
};

} // namespace seqmatch::notation

namespace seqmatch::ascii {
    template <typename Sink>
    void write(Sink& sink, notation::SourceLocation loc)
    {
        write(sink, loc.line);
        write(sink, ':');
        write(sink, loc.column);
    }
}
