#include <catch2/catch.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <seqmatch/Accumulators.hpp>
#include <seqmatch/notation/Diagnostics.hpp>
#include <seqmatch/notation/Parse.hpp>

namespace seqmatch::unittests {

namespace {
    using Item = QuantifiedItem<std::string>;
    using Seq = std::vector<Item>;
    using Tracker = MatchTracker<std::string>;

    bool sameLabel(std::string const& dest, std::string const& src)
    {
        return dest == src;
    }

    // Any pairing that involves int widens to int*
    std::optional<Item> widenInt(Item const* dest, Item const* src)
    {
        if ( (dest && dest->item() == "int") || (src && src->item() == "int") )
            return Item("int", Quantifier::zeroOrMore());

        return std::nullopt;
    }

    // Pairs of equal labels merge into that label
    std::optional<Item> equalLabels(Item const* dest, Item const* src)
    {
        if ( dest && src && dest->item() == src->item() )
            return Item(dest->item());

        return std::nullopt;
    }

    // Pairs merge into the source label; an item against absence is tagged
    // with the side it came from
    std::optional<Item> tagAbsent(Item const* dest, Item const* src)
    {
        if ( dest && src ) {
            if ( dest->item().size() != 1 || src->item().size() != 1
              || dest->item()[0] - 'A' + 'a' != src->item()[0] )
            {
                return std::nullopt;
            }

            return Item(src->item());
        }

        if ( dest )
            return Item("d_" + dest->item());

        if ( src )
            return Item("s_" + src->item());

        return std::nullopt;
    }

    Seq parse(std::string_view text)
    {
        notation::Diagnostics dgn;
        auto ret = notation::parseSequence(text, dgn);
        REQUIRE(dgn.errorCount() == 0);
        return ret;
    }

    std::string render(std::optional<Seq> const& seq)
    {
        if ( !seq )
            return "none";

        std::string ret;
        auto const show = defaultShow<std::string>();
        for ( auto const& e : *seq ) {
            if ( !ret.empty() )
                ret += ' ';
            ret += str(&e, show);
        }

        return ret;
    }
}

TEST_CASE("correspond", "[Accumulators]")
{
    Item a("a");
    Item b("b", Quantifier::optional());
    Tracker ta(a);
    Tracker tb(b);
    Tracker exhausted = ta.matched();

    Predicate<std::string, std::string> const pred = sameLabel;

    CHECK(correspond(pred, static_cast<Tracker const*>(nullptr), static_cast<Tracker const*>(nullptr)));
    CHECK(correspond(pred, &ta, &ta));
    CHECK(!correspond(pred, &ta, &tb));
    CHECK(!correspond(pred, &exhausted, &ta));
    CHECK(!correspond(pred, &ta, &exhausted));
    CHECK(correspond(pred, static_cast<Tracker const*>(nullptr), &tb));
    CHECK(correspond(pred, &tb, static_cast<Tracker const*>(nullptr)));
    CHECK(!correspond(pred, &ta, static_cast<Tracker const*>(nullptr)));
    CHECK(!correspond(pred, static_cast<Tracker const*>(nullptr), &ta));
}

TEST_CASE("ExistenceAccumulator", "[Accumulators]")
{
    Item a("a");
    Item b("b");
    Tracker ta(a);
    Tracker tb(b);

    ExistenceAccumulator<std::string, std::string> acc(sameLabel);
    CHECK(!acc.value());
    CHECK(acc.str() == "false");

    auto miss = acc.accumulate(&ta, &tb);
    CHECK(!miss->value());

    auto hit = acc.accumulate(&ta, &ta);
    CHECK(hit->value());
    CHECK(!acc.value());

    auto still = hit->accumulate(&ta, &tb);
    CHECK(still->value());

    auto copy = hit->copy();
    CHECK(copy->value());
    CHECK(copy->str() == "true");
    CHECK(copy->memoKey() == acc.memoKey());
}

TEST_CASE("GroupingAccumulator", "[Accumulators]")
{
    Item a("a", Quantifier::oneOrMore());
    Item b("b", Quantifier::optional());
    Item x("a");
    Tracker ta(a);
    Tracker tb(b);
    Tracker tx(x);

    GroupingAccumulator<std::string, std::string> acc(sameLabel);

    auto g = acc.accumulate(&ta, &tx);
    g = g->accumulate(&ta, &tx);
    g = g->accumulate(nullptr, &tx);
    g = g->accumulate(&ta, nullptr);
    g = g->accumulate(&tb, nullptr);
    g = g->accumulate(&tb, nullptr);

    CHECK(acc.value().empty());

    auto const& groups = g->value();
    REQUIRE(groups.size() == 2);
    CHECK(groups[0].destItem == &a);
    CHECK(groups[0].matchedSrcItems == std::vector<Item const*>{ &x, &x });
    CHECK(groups[1].destItem == &b);
    CHECK(groups[1].matchedSrcItems.empty());

    CHECK(g->str() == "{a+ == [a;a];b? == []}");
}

TEST_CASE("common subsequence widens repeated items", "[Accumulators]")
{
    Seq const ints = { Item("int"), Item("int"), Item("int") };
    Seq const intStar = { Item("int", Quantifier::zeroOrMore()) };

    auto common = getCommonSequence<std::string, std::string, std::string>(ints, intStar, widenInt);
    CHECK(render(common) == "int*");

    common = getCommonSequence<std::string, std::string, std::string>(intStar, ints, widenInt);
    CHECK(render(common) == "int*");
}

TEST_CASE("common subsequence keeps distinct items", "[Accumulators]")
{
    Seq const ab = { Item("a"), Item("b") };
    Seq const aa = { Item("a"), Item("a") };

    CHECK(render(getCommonSequence<std::string, std::string, std::string>(ab, ab, equalLabels)) == "a b");
    CHECK(render(getCommonSequence<std::string, std::string, std::string>(aa, aa, equalLabels)) == "a a");
    CHECK(render(getCommonSequence<std::string, std::string, std::string>(ab, aa, equalLabels)) == "none");

    auto empty = getCommonSequence<std::string, std::string, std::string>(Seq(), Seq(), equalLabels);
    REQUIRE(empty);
    CHECK(empty->empty());
}

TEST_CASE("common subsequence folds both skipped runs", "[Accumulators]")
{
    Seq const dest = parse("[X;P?;Y]");
    Seq const src = parse("[x;q?;y]");

    // P and q cannot pair, so both sides jump their optional item at once
    auto common = getCommonSequence<std::string, std::string, std::string>(dest, src, tagAbsent);
    CHECK(render(common) == "x d_P s_q y");
}

TEST_CASE("CommonSequenceAccumulator coalesces equal repeated items", "[Accumulators]")
{
    Item i("int");
    Tracker ti(i);

    CommonSequenceAccumulator<std::string, std::string, std::string> acc(widenInt);
    CHECK(acc.matches(&ti, nullptr));
    CHECK(!acc.matches(nullptr, nullptr));

    auto c = acc.accumulate(&ti, &ti);
    c = c->accumulate(&ti, nullptr);
    c = c->accumulate(nullptr, &ti);

    REQUIRE(c->value().size() == 1);
    CHECK(c->value().front() == Item("int", Quantifier::zeroOrMore()));
    CHECK(c->str() == "[int*]");

    // nothing common leaves the value as it was
    auto same = c->accumulate(nullptr, nullptr);
    CHECK(same->value() == c->value());
}

TEST_CASE("accumulators render through ascii::write", "[Accumulators]")
{
    ExistenceAccumulator<std::string, std::string> acc(sameLabel);

    StringSink sink;
    ascii::write(sink, acc);
    CHECK(sink.str() == "false");
}

} // namespace seqmatch::unittests
