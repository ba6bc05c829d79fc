#include <seqmatch/notation/Parse.hpp>

#include <limits>
#include <utility>

#include <seqmatch/notation/Diagnostics.hpp>
#include <seqmatch/Stream.hpp>

#include <seqmatch/notation/Scanner.hpp>
#include <seqmatch/notation/Token.hpp>

namespace seqmatch::notation {

namespace {
    bool endsItem(TokenKind kind)
    {
        switch ( kind ) {
        case TokenKind::Identifier:
        case TokenKind::Semicolon:
        case TokenKind::Comma:
        case TokenKind::CloseBracket:
        case TokenKind::EndOfInput:
            return true;

        default:
            return false;
        }
    }
} // namespace

//
// SequenceParser

SequenceParser::SequenceParser(Diagnostics& dgn, Scanner& scanner)
    : myDiagnostics(&dgn)
    , myScanner(&scanner)
{
}

Diagnostics& SequenceParser::diagnostics()
{
    return *myDiagnostics;
}

Scanner& SequenceParser::scanner()
{
    return *myScanner;
}

std::vector<Item> SequenceParser::parseSequence()
{
    std::vector<Item> ret;

    bool bracketed = false;
    Token open;
    if ( scanner().peek().kind() == TokenKind::OpenBracket ) {
        open = scanner().next();
        bracketed = true;
    }

    for (;;) {
        auto const kind = scanner().peek().kind();
        if ( kind == TokenKind::EndOfInput || kind == TokenKind::CloseBracket )
            break;

        if ( isSeparator(kind) ) {
            scanner().next();
            continue;
        }

        if ( auto item = parseItem() )
            ret.emplace_back(std::move(*item));
    }

    if ( bracketed ) {
        if ( scanner().peek().kind() == TokenKind::CloseBracket )
            scanner().next();
        else
            diagnostics().error(diag::expected_close_bracket, scanner().peek()).see(open);
    }

    while ( scanner().peek().kind() != TokenKind::EndOfInput ) {
        auto tok = scanner().next();
        diagnostics().error(tok ? diag::unexpected_token : diag::lexer_error, tok)
            .expected("end of input");
    }

    return ret;
}

std::optional<Item> SequenceParser::parseItem()
{
    if ( scanner().peek().kind() != TokenKind::Identifier ) {
        auto bad = scanner().next();
        if ( !bad )
            diagnostics().error(diag::lexer_error, bad);
        else
            diagnostics().error(diag::expected_item, bad);

        skipItem();
        return std::nullopt;
    }

    auto id = scanner().next();
    if ( !isQuantifierStart(scanner().peek().kind()) )
        return Item(std::string(id.lexeme()));

    auto q = parseQuantifier();
    if ( !q )
        return std::nullopt;

    return Item(std::string(id.lexeme()), *q);
}

std::optional<Quantifier> SequenceParser::parseQuantifier()
{
    auto tok = scanner().next();
    switch ( tok.kind() ) {
    case TokenKind::Star:     return Quantifier::zeroOrMore();
    case TokenKind::Plus:     return Quantifier::oneOrMore();
    case TokenKind::Question: return Quantifier::optional();
    case TokenKind::OpenBrace:
        return parseBounds(tok);

    default:
        diagnostics().error(diag::unexpected_token, tok);
        return std::nullopt;
    }
}

std::optional<Quantifier> SequenceParser::parseBounds(Token const& open)
{
    auto const minTok = scanner().peek();
    auto min = parseBound();
    if ( !min ) {
        skipBounds();
        return std::nullopt;
    }

    std::optional<MatchCount> max;
    if ( scanner().peek().kind() == TokenKind::Colon ) {
        scanner().next();
        auto m = parseBound();
        if ( !m ) {
            skipBounds();
            return std::nullopt;
        }

        max = *m;
    }
    else if ( *min ) {
        max = *min;
    }
    else {
        // "{}" names no bound at all
        diagnostics().error(diag::expected_integer, scanner().peek());
        skipBounds();
        return std::nullopt;
    }

    if ( scanner().peek().kind() != TokenKind::CloseBrace ) {
        diagnostics().error(diag::expected_close_brace, scanner().peek()).see(open);
        skipItem();
        return std::nullopt;
    }
    scanner().next();

    MatchCount const lo = min->value_or(0);
    if ( max && lo > *max ) {
        diagnostics().error(diag::inverted_bounds, minTok);
        return std::nullopt;
    }

    return Quantifier(lo, max);
}

// A malformed bound yields nothing
std::optional<Bound> SequenceParser::parseBound()
{
    auto const& tok = scanner().peek();
    switch ( tok.kind() ) {
    case TokenKind::Colon:
    case TokenKind::CloseBrace:
        return std::optional<Bound>(std::in_place);

    case TokenKind::Integer:
        break;

    default:
        diagnostics().error(diag::expected_integer, tok);
        return std::nullopt;
    }

    auto num = scanner().next();
    u64 value = 0;
    for ( auto c : num.lexeme() ) {
        value = value * 10 + static_cast<u64>(c - '0');
        if ( value > std::numeric_limits<MatchCount>::max() ) {
            diagnostics().error(diag::bound_overflow, num);
            return std::nullopt;
        }
    }

    return std::optional<Bound>(std::in_place, static_cast<MatchCount>(value));
}

void SequenceParser::skipItem()
{
    while ( !endsItem(scanner().peek().kind()) )
        scanner().next();
}

// Resumes after the closing brace of a malformed quantifier
void SequenceParser::skipBounds()
{
    for (;;) {
        auto const kind = scanner().peek().kind();
        if ( kind == TokenKind::CloseBrace ) {
            scanner().next();
            return;
        }

        if ( isSeparator(kind) || kind == TokenKind::CloseBracket || kind == TokenKind::EndOfInput )
            return;

        scanner().next();
    }
}

//
// misc

std::vector<Item> parseSequence(std::string_view text, Diagnostics& dgn)
{
    Scanner scanner(text);
    SequenceParser parser(dgn, scanner);
    return parser.parseSequence();
}

std::optional<Item> parseItem(std::string_view text, Diagnostics& dgn)
{
    Scanner scanner(text);
    SequenceParser parser(dgn, scanner);

    auto ret = parser.parseItem();
    if ( scanner.peek().kind() != TokenKind::EndOfInput ) {
        dgn.error(diag::unexpected_token, scanner.peek()).expected("end of input");
        return std::nullopt;
    }

    return ret;
}

std::string render(Slice<Item const> items)
{
    auto const show = defaultShow<std::string>();

    StringSink sink;
    sink.write('[');
    for ( uz i = 0; i < items.card(); ++i ) {
        if ( i )
            sink.write(';');
        sink.write(seqmatch::str(&items[i], show));
    }
    sink.write(']');

    return std::move(sink).str();
}

} // namespace seqmatch::notation
