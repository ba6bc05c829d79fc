#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include <seqmatch/Accumulators.hpp>
#include <seqmatch/Stream.hpp>
#include <seqmatch/Trace.hpp>

namespace seqmatch::unittests {

namespace {
    using Item = QuantifiedItem<std::string>;
    using Seq = std::vector<Item>;

    bool lowered(std::string const& dest, std::string const& src)
    {
        return dest.size() == 1 && src.size() == 1 && dest[0] - 'A' + 'a' == src[0];
    }
}

TEST_CASE("formatTraceLine", "[Trace]")
{
    CHECK(formatTraceLine(0, 0, "hello") == "[acc_sequence] hello");
    CHECK(formatTraceLine(2, 3, "x") == "  [acc_sequence] ---x");
}

TEST_CASE("StreamTrace writes one line per call", "[Trace]")
{
    std::ostringstream ss;
    {
        OutStream out(ss);
        StreamTrace trace(out);
        trace.line(1, 2, "hi");
        trace.line(0, 0, "there");
    }

    CHECK(ss.str() == " [acc_sequence] --hi\n[acc_sequence] there\n");
}

TEST_CASE("accepted search trace", "[Trace]")
{
    BufferTrace trace;
    TraversalOptions options;
    options.trace = &trace;

    Seq const dest = { Item("X", Quantifier::zeroOrMore()) };
    Seq const src = { Item("x"), Item("x") };
    CHECK(matchSequence(dest, src, lowered, options));

    auto const& lines = trace.lines();
    REQUIRE(lines.size() > 2);
    CHECK(lines.front() == "[acc_sequence] [X*.[0]] ==?== [x;x]");
    CHECK(lines.back() == "[acc_sequence] [X*.[0]] ==?== [x;x] ==> true");
    CHECK(trace.count("[ACCEPT] both sequences ended") == 1);
    CHECK(trace.contains("[acc_sequence] -step(0: X*.[0], 0: x)"));
    CHECK(trace.contains("--step(0: X*.[1], 1: x)"));
    CHECK(!trace.contains("[ABANDON]"));
}

TEST_CASE("rejected search trace", "[Trace]")
{
    BufferTrace trace;
    TraversalOptions options;
    options.trace = &trace;
    options.indent = 2;

    Seq const dest = { Item("A") };
    Seq const src = { Item("b") };
    CHECK(!matchSequence(dest, src, lowered, options));

    CHECK(trace.contains("[REJECT] items do not correspond"));
    CHECK(!trace.contains("[ACCEPT]"));
    CHECK(trace.lines().back() == "  [acc_sequence] [A] ==?== [b] ==> undefined");
    for ( auto const& l : trace.lines() )
        CHECK(l.rfind("  [acc_sequence] ", 0) == 0);

    trace.clear();
    CHECK(trace.lines().empty());
}

TEST_CASE("abandoned search trace", "[Trace]")
{
    BufferTrace trace;
    TraversalOptions options;
    options.trace = &trace;
    options.stepLimit = 1;

    Seq const dest = { Item("A") };
    Seq const src = { Item("a") };
    CHECK(!matchSequence(dest, src, lowered, options));
    CHECK(trace.count("[ABANDON] search limit reached") == 1);
}

} // namespace seqmatch::unittests
