#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include <seqmatch/notation/Diagnostics.hpp>
#include <seqmatch/notation/Parse.hpp>
#include <seqmatch/notation/Scanner.hpp>

namespace seqmatch::unittests {

using notation::diag;
using notation::Diagnostics;
using notation::Item;
using notation::TokenKind;

namespace {
    std::vector<TokenKind> kinds(std::string_view text)
    {
        std::vector<TokenKind> ret;
        notation::Scanner scanner(text);
        for (;;) {
            auto tok = scanner.next();
            ret.push_back(tok.kind());
            if ( tok.kind() == TokenKind::EndOfInput )
                return ret;
        }
    }
}

TEST_CASE("Scanner", "[notation]")
{
    CHECK(kinds("") == std::vector<TokenKind>{ TokenKind::EndOfInput });

    CHECK(kinds("[A*; b.c+, _d? E{2:15}]") == std::vector<TokenKind>{
        TokenKind::OpenBracket,
        TokenKind::Identifier, TokenKind::Star, TokenKind::Semicolon,
        TokenKind::Identifier, TokenKind::Plus, TokenKind::Comma,
        TokenKind::Identifier, TokenKind::Question,
        TokenKind::Identifier, TokenKind::OpenBrace, TokenKind::Integer, TokenKind::Colon, TokenKind::Integer, TokenKind::CloseBrace,
        TokenKind::CloseBracket,
        TokenKind::EndOfInput,
    });

    notation::Scanner scanner("ab\n  $cd");
    auto ab = scanner.next();
    CHECK(ab.lexeme() == "ab");
    CHECK(ab.line() == 1);
    CHECK(ab.column() == 1);

    CHECK(scanner.peek().kind() == TokenKind::Undefined);
    auto bad = scanner.next();
    CHECK(bad.lexeme() == "$");
    CHECK(bad.line() == 2);
    CHECK(bad.column() == 3);
    CHECK(scanner.hasError());

    auto cd = scanner.next();
    CHECK(cd.lexeme() == "cd");
    CHECK(cd.column() == 4);
    CHECK(scanner.next().kind() == TokenKind::EndOfInput);
}

TEST_CASE("parseSequence", "[notation]")
{
    Diagnostics dgn;
    auto items = notation::parseSequence("[A; B*, C+ D? E{2:5} F{2:} G{3} H{:4} I{:}]", dgn);
    CHECK(dgn.errorCount() == 0);

    std::vector<Item> const expected = {
        Item("A"),
        Item("B", Quantifier::zeroOrMore()),
        Item("C", Quantifier::oneOrMore()),
        Item("D", Quantifier::optional()),
        Item("E", Quantifier::between(2, 5)),
        Item("F", Quantifier::atLeast(2)),
        Item("G", Quantifier::exactly(3)),
        Item("H", Quantifier::upTo(4)),
        Item("I", Quantifier::zeroOrMore()),
    };
    CHECK(items == expected);

    CHECK(notation::render(items) == "[A;B*;C+;D?;E{2:5};F{2:};G{3:3};H{0:4};I*]");
}

TEST_CASE("notation round-trips", "[notation]")
{
    for ( auto text : { "[]", "[X]", "[X*]", "[X+]", "[X?]", "[X{2:5}]", "[X{2:}]", "[a.b;c_d{0:3};E{4:4}]" } ) {
        Diagnostics dgn;
        auto items = notation::parseSequence(text, dgn);
        CHECK(dgn.errorCount() == 0);
        CHECK(notation::render(items) == text);
    }

    Diagnostics dgn;
    CHECK(notation::parseSequence("X Y*", dgn) == notation::parseSequence("[X;Y*]", dgn));
    CHECK(dgn.errorCount() == 0);
}

TEST_CASE("parseItem", "[notation]")
{
    Diagnostics dgn;
    CHECK(notation::parseItem("X{1:3}", dgn) == Item("X", Quantifier::between(1, 3)));
    CHECK(dgn.errorCount() == 0);

    CHECK(!notation::parseItem("X Y", dgn));
    REQUIRE(dgn.errorCount() == 1);
    CHECK(dgn.report(0).code() == diag::unexpected_token);
}

TEST_CASE("malformed quantifiers are diagnosed", "[notation]")
{
    SECTION("inverted bounds") {
        Diagnostics dgn;
        auto items = notation::parseSequence("[A{3:1}]", dgn);
        CHECK(items.empty());
        REQUIRE(dgn.errorCount() == 1);

        auto const& r = dgn.report(0);
        CHECK(r.code() == diag::inverted_bounds);
        CHECK(r.subject().lexeme == "3");
        CHECK(r.subject().location.line == 1);
        CHECK(r.subject().location.column == 4);
        CHECK(str(r) == "1:4: error: '3' quantifier minimum exceeds its maximum\n");
    }

    SECTION("not an integer") {
        Diagnostics dgn;
        auto items = notation::parseSequence("A{x} B", dgn);
        REQUIRE(dgn.errorCount() == 1);
        CHECK(dgn.report(0).code() == diag::expected_integer);
        REQUIRE(items.size() == 1);
        CHECK(items[0] == Item("B"));
    }

    SECTION("empty braces") {
        Diagnostics dgn;
        notation::parseSequence("A{}", dgn);
        REQUIRE(dgn.errorCount() == 1);
        CHECK(dgn.report(0).code() == diag::expected_integer);
    }

    SECTION("unclosed brace") {
        Diagnostics dgn;
        auto items = notation::parseSequence("A{2 B", dgn);
        REQUIRE(dgn.errorCount() == 1);
        CHECK(dgn.report(0).code() == diag::expected_close_brace);
        REQUIRE(items.size() == 1);
        CHECK(items[0] == Item("B"));
    }

    SECTION("bound overflow") {
        Diagnostics dgn;
        notation::parseSequence("A{99999999999}", dgn);
        REQUIRE(dgn.errorCount() == 1);
        CHECK(dgn.report(0).code() == diag::bound_overflow);
    }
}

TEST_CASE("malformed sequences are diagnosed", "[notation]")
{
    SECTION("unclosed bracket") {
        Diagnostics dgn;
        auto items = notation::parseSequence("[A B", dgn);
        CHECK(items == std::vector<Item>{ Item("A"), Item("B") });
        REQUIRE(dgn.errorCount() == 1);
        CHECK(dgn.report(0).code() == diag::expected_close_bracket);
        CHECK(str(dgn.report(0)) ==
              "1:5: error: end of input expected ']' to close the sequence\n"
              "1:5: see '[' at 1:1\n");
    }

    SECTION("stray character") {
        Diagnostics dgn;
        auto items = notation::parseSequence("A $ B", dgn);
        CHECK(items == std::vector<Item>{ Item("A"), Item("B") });
        REQUIRE(dgn.errorCount() == 1);
        CHECK(dgn.report(0).code() == diag::lexer_error);
        CHECK(dgn.report(0).subject().location.column == 3);
    }

    SECTION("missing item") {
        Diagnostics dgn;
        auto items = notation::parseSequence("[A; *]", dgn);
        CHECK(items == std::vector<Item>{ Item("A") });
        REQUIRE(dgn.errorCount() == 1);
        CHECK(dgn.report(0).code() == diag::expected_item);
    }

    SECTION("trailing input") {
        Diagnostics dgn;
        auto items = notation::parseSequence("[A] B", dgn);
        CHECK(items == std::vector<Item>{ Item("A") });
        REQUIRE(dgn.errorCount() == 1);
        CHECK(dgn.report(0).code() == diag::unexpected_token);
    }
}

TEST_CASE("Diagnostics::dumpErrors", "[notation][Diagnostics]")
{
    Diagnostics dgn;
    notation::parseSequence("A{3:1} B{", dgn);
    REQUIRE(dgn.errorCount() == 2);

    std::ostringstream ss;
    OutStream out(ss);
    dgn.dumpErrors(out);

    CHECK(ss.str() ==
          "1:3: error: '3' quantifier minimum exceeds its maximum\n"
          "1:10: error: end of input expected integer\n");

    dgn.clear();
    CHECK(dgn.errorCount() == 0);
    CHECK_THROWS_AS(dgn.report(0), RuntimeException);
}

} // namespace seqmatch::unittests
