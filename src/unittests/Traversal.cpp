#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <seqmatch/Accumulators.hpp>
#include <seqmatch/Traversal.hpp>
#include <seqmatch/notation/Diagnostics.hpp>
#include <seqmatch/notation/Parse.hpp>

namespace seqmatch::unittests {

namespace {
    using Item = QuantifiedItem<std::string>;
    using Seq = std::vector<Item>;
    using Groups = std::vector<DestItemMatches<std::string, std::string>>;

    Seq seq(std::string_view text)
    {
        notation::Diagnostics dgn;
        auto ret = notation::parseSequence(text, dgn);
        REQUIRE(dgn.errorCount() == 0);
        return ret;
    }

    // Upper-case destination labels accept their lower-case source labels
    bool lowered(std::string const& dest, std::string const& src)
    {
        if ( dest.size() != src.size() )
            return false;

        for ( uz i = 0; i < dest.size(); ++i )
            if ( dest[i] - 'A' + 'a' != src[i] )
                return false;

        return true;
    }

    bool sameLabel(std::string const& dest, std::string const& src)
    {
        return dest == src;
    }

    std::string render(std::optional<Groups> const& groups)
    {
        if ( !groups )
            return "none";

        std::string ret;
        for ( auto const& g : *groups ) {
            if ( !ret.empty() )
                ret += ' ';

            ret += g.destItem->item() + ":[";
            for ( uz i = 0; i < g.matchedSrcItems.size(); ++i ) {
                if ( i )
                    ret += ',';
                ret += g.matchedSrcItems[i]->item();
            }
            ret += ']';
        }

        return ret;
    }

    std::string group(Seq const& dest, Seq const& src, TraversalOptions const& options = TraversalOptions())
    {
        return render(matchAccumulateSequence(dest, src, lowered, options));
    }

    std::string group(std::string_view dest, std::string_view src, TraversalOptions const& options = TraversalOptions())
    {
        return group(seq(dest), seq(src), options);
    }
}

TEST_CASE("empty sequences match", "[Traversal]")
{
    Seq const none;
    CHECK(matchSequence(none, none, sameLabel));

    auto groups = matchAccumulateSequence(none, none, sameLabel);
    REQUIRE(groups);
    CHECK(groups->empty());
}

TEST_CASE("fixed sequences match pairwise", "[Traversal]")
{
    Seq const dest = seq("[A;B]");

    CHECK(matchSequence(dest, seq("[a;b]"), lowered));
    CHECK(!matchSequence(dest, seq("[a]"), lowered));
    CHECK(!matchSequence(dest, seq("[a;b;c]"), lowered));
    CHECK(!matchSequence(dest, seq("[a;c]"), lowered));
    CHECK(!matchSequence(dest, seq("[b;a]"), lowered));
    CHECK(!matchSequence(dest, Seq(), lowered));

    CHECK(group(dest, seq("[a;b]")) == "A:[a] B:[b]");
}

TEST_CASE("zero-or-more item against nothing", "[Traversal]")
{
    Seq const dest = seq("[X*]");
    CHECK(matchSequence(dest, Seq(), lowered));
    CHECK(group(dest, Seq()) == "X:[]");

    Seq const src = seq("[x*]");
    CHECK(matchSequence(Seq(), src, lowered));
    CHECK(group(Seq(), src).empty());
}

TEST_CASE("repeating items are greedy", "[Traversal]")
{
    CHECK(group("[X*]", "[x;x]") == "X:[x,x]");
    CHECK(group("[X*;Y*]", "[x;x]") == "X:[x,x] Y:[]");
    CHECK(group("[X*;X*]", "[x;x]") == "X:[x,x] X:[]");
}

TEST_CASE("bounded items stop at their maximum", "[Traversal]")
{
    CHECK(group("[X{:2}]", "[x;x]") == "X:[x,x]");
    CHECK(group("[X{:2}]", "[x;x;x]") == "none");
    CHECK(group("[X+]", "[]") == "none");
}

TEST_CASE("skip chains fold each skipped item once", "[Traversal]")
{
    CHECK(group("[X;P?;Q*;Y]", "[x;y]") == "X:[x] P:[] Q:[] Y:[y]");
    CHECK(group("[P?;Q*;Y]", "[y]") == "P:[] Q:[] Y:[y]");
    CHECK(group("[Y;P?;Q*]", "[y]") == "Y:[y] P:[] Q:[]");
}

TEST_CASE("skippable source items leave no group", "[Traversal]")
{
    Seq const dest = seq("[B;S]");
    Seq const src = seq("[d*;B;S]");

    CHECK(matchSequence(dest, src, sameLabel));

    auto groups = matchAccumulateSequence(dest, src, sameLabel);
    CHECK(render(groups) == "B:[B] S:[S]");
}

TEST_CASE("grouping with markers", "[Traversal]")
{
    Seq const dest = seq("[Mark1;A*;Mark2;B*]");
    Seq const src = seq("[Mark1;Mark2;Mark2;Mark2;Mark2;str]");

    auto accepts = [](std::string const& d, std::string const& s) {
        if ( d == "A" )
            return s == "Mark1";

        if ( d == "B" )
            return true;

        return d == s;
    };

    auto groups = matchAccumulateSequence(dest, src, accepts);
    REQUIRE(groups);
    CHECK(render(groups) == "Mark1:[Mark1] A:[] Mark2:[Mark2] B:[Mark2,Mark2,Mark2,str]");

    // groups refer to the caller's items
    REQUIRE(groups->size() == 4);
    CHECK((*groups)[0].destItem == &dest[0]);
    CHECK((*groups)[3].matchedSrcItems.back() == &src[5]);
}

TEST_CASE("traversal is deterministic", "[Traversal]")
{
    Seq const dest = seq("[X*;X?;X*]");
    Seq const src = seq("[x;x;x]");

    auto const first = group(dest, src);
    CHECK(first == "X:[x,x,x] X:[] X:[]");
    for ( int i = 0; i < 3; ++i )
        CHECK(group(dest, src) == first);
}

TEST_CASE("traversal leaves the initial accumulator untouched", "[Traversal]")
{
    Seq const dest = seq("[X*]");
    Seq const src = seq("[x;x]");

    auto const destTrackers = trackers(dest);
    auto const srcTrackers = trackers(src);

    GroupingAccumulator<std::string, std::string> init(lowered);
    auto acc = traverseAccumulateSequence<std::string, std::string, Groups>(destTrackers, srcTrackers, init);

    REQUIRE(acc);
    CHECK(init.value().empty());
    CHECK(acc->value().size() == 1);
}

TEST_CASE("a walk with a false value is still a walk", "[Traversal]")
{
    Seq const none;
    auto const empty = trackers(none);

    ExistenceAccumulator<std::string, std::string> init(sameLabel);
    auto acc = traverseAccumulateSequence<std::string, std::string, bool>(empty, empty, init);

    REQUIRE(acc);
    CHECK(!acc->value());
}

TEST_CASE("traversal statistics", "[Traversal]")
{
    TraversalStats stats;
    TraversalOptions options;
    options.stats = &stats;

    CHECK(group("[X*]", "[x;x]", options) == "X:[x,x]");
    CHECK(stats.steps == 5);
    CHECK(stats.maxDepth == 4);
    CHECK(stats.memoHits == 0);
    CHECK(!stats.limitReached);
}

TEST_CASE("step limit abandons the search", "[Traversal]")
{
    TraversalStats stats;
    TraversalOptions options;
    options.stats = &stats;

    options.stepLimit = 5;
    CHECK(group("[X*]", "[x;x]", options) == "X:[x,x]");
    CHECK(!stats.limitReached);

    options.stepLimit = 4;
    CHECK(group("[X*]", "[x;x]", options) == "none");
    CHECK(stats.limitReached);
}

TEST_CASE("depth limit abandons the search", "[Traversal]")
{
    TraversalStats stats;
    TraversalOptions options;
    options.stats = &stats;

    options.depthLimit = 4;
    CHECK(group("[X*]", "[x;x]", options) == "X:[x,x]");
    CHECK(!stats.limitReached);

    options.depthLimit = 3;
    CHECK(group("[X*]", "[x;x]", options) == "none");
    CHECK(stats.limitReached);
}

TEST_CASE("failure memo prunes revisited states", "[Traversal][memo]")
{
    Seq const dest = seq("[X*;X*;Y]");
    Seq const src = seq("[x;x;x;x;z]");

    TraversalStats plain;
    TraversalOptions options;
    options.stats = &plain;
    CHECK(group(dest, src, options) == "none");

    TraversalStats memo;
    options.stats = &memo;
    options.memoize = true;
    CHECK(group(dest, src, options) == "none");

    CHECK(plain.memoHits == 0);
    CHECK(plain.memoSize == 0);
    CHECK(memo.memoHits > 0);
    CHECK(memo.memoSize > 0);
    CHECK(memo.steps < plain.steps);
}

TEST_CASE("failure memo does not change results", "[Traversal][memo]")
{
    std::vector<std::pair<Seq, Seq>> const cases = {
        { seq("[X*;X*;Y]"), seq("[x;x;y]") },
        { seq("[X;P?;Q*;Y]"), seq("[x;y]") },
        { seq("[X*;Y?;X*]"), seq("[x;y;x;x]") },
        { seq("[X{:2};Y*]"), seq("[x;x;x]") },
    };

    TraversalOptions memo;
    memo.memoize = true;

    for ( auto const& [dest, src] : cases ) {
        CHECK(group(dest, src) == group(dest, src, memo));
        CHECK(matchSequence(dest, src, lowered) == matchSequence(dest, src, lowered, memo));
    }
}

TEST_CASE("predicate exceptions propagate", "[Traversal]")
{
    auto throws = [](std::string const&, std::string const&) -> bool {
        throw std::runtime_error("predicate failed");
    };

    CHECK_THROWS_AS(matchSequence(seq("[X]"), seq("[x]"), throws), std::runtime_error);
}

} // namespace seqmatch::unittests
