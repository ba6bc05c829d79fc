#include <catch2/catch.hpp>

#include <string>

#include <seqmatch/QuantifiedItem.hpp>
#include <seqmatch/Utilities.hpp>

namespace seqmatch::unittests {

TEST_CASE("Quantifier named constructors", "[Quantifier]")
{
    CHECK(Quantifier::one() == Quantifier(1, 1));
    CHECK(Quantifier::optional() == Quantifier(0, 1));
    CHECK(Quantifier::zeroOrMore() == Quantifier(0, std::nullopt));
    CHECK(Quantifier::oneOrMore() == Quantifier(1, std::nullopt));
    CHECK(Quantifier::atLeast(3) == Quantifier(3, std::nullopt));
    CHECK(Quantifier::exactly(2) == Quantifier(2, 2));
    CHECK(Quantifier::upTo(4) == Quantifier(0, 4));
    CHECK(Quantifier::between(2, 5) == Quantifier(2, 5));
    CHECK(Quantifier::between(2, 5) != Quantifier(2, 6));

    CHECK(Quantifier::one().bounded());
    CHECK(!Quantifier::oneOrMore().bounded());
}

TEST_CASE("Quantifier rejects inverted bounds", "[Quantifier]")
{
    CHECK_THROWS_AS(Quantifier(3, 2), RuntimeException);
    CHECK_THROWS_AS(Quantifier::between(1, 0), RuntimeException);
    CHECK_NOTHROW(Quantifier(0, 0));
    CHECK_NOTHROW(Quantifier(7, std::nullopt));
}

TEST_CASE("Quantifier::isRepeated", "[Quantifier]")
{
    CHECK(!Quantifier::one().isRepeated());
    CHECK(!Quantifier::exactly(0).isRepeated());
    CHECK(Quantifier::optional().isRepeated());
    CHECK(Quantifier::zeroOrMore().isRepeated());
    CHECK(Quantifier::oneOrMore().isRepeated());
    CHECK(Quantifier::exactly(2).isRepeated());
}

TEST_CASE("Quantifier notation", "[Quantifier]")
{
    CHECK(str(Quantifier::one()).empty());
    CHECK(str(Quantifier::zeroOrMore()) == "*");
    CHECK(str(Quantifier::oneOrMore()) == "+");
    CHECK(str(Quantifier::optional()) == "?");
    CHECK(str(Quantifier::between(2, 5)) == "{2:5}");
    CHECK(str(Quantifier::atLeast(2)) == "{2:}");
    CHECK(str(Quantifier::exactly(3)) == "{3:3}");
}

TEST_CASE("QuantifiedItem", "[QuantifiedItem]")
{
    QuantifiedItem<std::string> x("x");
    CHECK(x.item() == "x");
    CHECK(x.minMatches() == 1);
    CHECK(x.maxMatches() == 1u);
    CHECK(!x.isRepeated());

    QuantifiedItem<std::string> xs("x", 0, std::nullopt);
    CHECK(xs.isRepeated());
    CHECK(!xs.maxMatches());

    CHECK(x == QuantifiedItem<std::string>("x", Quantifier::one()));
    CHECK(x != xs);
    CHECK(x != QuantifiedItem<std::string>("y"));

    auto const show = defaultShow<std::string>();
    CHECK(str(&x, show) == "x");
    CHECK(str(&xs, show) == "x*");
    CHECK(str(static_cast<QuantifiedItem<std::string> const*>(nullptr), show) == "undefined");
}

TEST_CASE("MatchTracker counts without mutating", "[MatchTracker]")
{
    QuantifiedItem<int> item(7, Quantifier::upTo(2));
    MatchTracker<int> t(item);

    CHECK(&t.sequenceItem() == &item);
    CHECK(t.item() == 7);
    CHECK(t.matches() == 0);
    CHECK(t.isSkippable());
    CHECK(t.hasMoreMatches());

    auto t1 = t.matched();
    auto t2 = t1.matched();
    CHECK(t.matches() == 0);
    CHECK(t1.matches() == 1);
    CHECK(t2.matches() == 2);
    CHECK(t1.hasMoreMatches());
    CHECK(!t2.hasMoreMatches());

    QuantifiedItem<int> many(7, Quantifier::oneOrMore());
    MatchTracker<int> m(many, 1000);
    CHECK(!m.isSkippable());
    CHECK(m.hasMoreMatches());
}

TEST_CASE("MatchTracker notation", "[MatchTracker]")
{
    auto const show = defaultShow<std::string>();

    QuantifiedItem<std::string> one("a");
    QuantifiedItem<std::string> opt("b", Quantifier::optional());
    QuantifiedItem<std::string> star("c", Quantifier::zeroOrMore());

    MatchTracker<std::string> t1(one);
    MatchTracker<std::string> t2(opt);
    MatchTracker<std::string> t3(star, 3);

    CHECK(str(&t1, show) == "a");
    CHECK(str(&t2, show) == "b?");
    CHECK(str(&t3, show) == "c*.[3]");
}

TEST_CASE("trackers", "[MatchTracker]")
{
    std::vector<QuantifiedItem<int>> seq = { 1, QuantifiedItem<int>(2, Quantifier::zeroOrMore()), 3 };
    auto ts = trackers(seq);

    REQUIRE(ts.size() == 3);
    for ( uz i = 0; i < ts.size(); ++i ) {
        CHECK(&ts[i].sequenceItem() == &seq[i]);
        CHECK(ts[i].matches() == 0);
    }
}

} // namespace seqmatch::unittests
